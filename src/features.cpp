#include "features.hpp"

namespace kir {

bool apply_language_flag(LanguageFeatures& features, std::string_view flag) {
    constexpr std::string_view prefix = "-XXLanguage:";
    if (flag.substr(0, prefix.size()) != prefix) return false;
    flag.remove_prefix(prefix.size());
    if (flag.empty()) return false;

    bool enable = false;
    if (flag.front() == '+') {
        enable = true;
    } else if (flag.front() != '-') {
        return false;
    }
    flag.remove_prefix(1);

    if (flag == "SuspendConversion") {
        features.suspend_conversion = enable;
        return true;
    }
    return false;
}

}  // namespace kir
