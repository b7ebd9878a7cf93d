#pragma once

#include <string_view>

namespace kir {

// Language features that change how lowering adapts callable values.
struct LanguageFeatures {
    // Non-suspend functions and functional values may be passed where a
    // suspend functional type is expected.
    bool suspend_conversion = true;
};

// Applies a `-XXLanguage:+Feature` / `-XXLanguage:-Feature` flag. Returns
// false for malformed flags and unknown features.
bool apply_language_flag(LanguageFeatures& features, std::string_view flag);

}  // namespace kir
