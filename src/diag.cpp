#include "diag.hpp"

#include <llvm/Support/raw_ostream.h>

namespace kir {

const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d) {
  std::string out{};
  llvm::raw_string_ostream os(out);
  os << sm.path(d.span.file);
  if (!d.span.is_undefined()) {
    const SourceLoc loc = sm.location(d.span.file, d.span.start);
    os << ":" << loc.line << ":" << loc.column;
  }
  os << ": " << severity_name(d.severity) << ": " << d.message;
  os.flush();
  return out;
}

void print_diagnostics(llvm::raw_ostream& os, const SourceManager& sm,
                       const std::vector<Diagnostic>& diags) {
  for (const Diagnostic& d : diags) os << format_diagnostic(sm, d) << "\n";
}

}  // namespace kir
