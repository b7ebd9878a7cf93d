#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "source.hpp"
#include "span.hpp"

namespace llvm {
class raw_ostream;
}  // namespace llvm

namespace kir {

enum class Severity : std::uint8_t { Error, Warning, Note };

// Prefix of diagnostics that report compiler bugs rather than user errors.
inline constexpr std::string_view kInternalErrorPrefix = "internal error: ";

struct Diagnostic {
  Severity severity = Severity::Error;
  Span span{};
  std::string message{};

  bool is_internal() const {
    return std::string_view(message).substr(0, kInternalErrorPrefix.size()) ==
           kInternalErrorPrefix;
  }
};

const char* severity_name(Severity s);

// `path:line:col: severity: message`. Spans with undefined offsets print
// only the path.
std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d);

// One formatted line per diagnostic, in report order.
void print_diagnostics(llvm::raw_ostream& os, const SourceManager& sm,
                       const std::vector<Diagnostic>& diags);

}  // namespace kir
