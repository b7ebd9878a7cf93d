#include "session.hpp"

#include <utility>

namespace kir {

void Session::error(Span span, std::string message) {
  diags.push_back(Diagnostic{.severity = Severity::Error,
                             .span = span,
                             .message = std::move(message)});
}

void Session::internal_error(Span span, std::string message) {
  error(span, std::string(kInternalErrorPrefix) + std::move(message));
}

bool Session::has_errors() const {
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) return true;
  }
  return false;
}

}  // namespace kir
