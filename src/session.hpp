#pragma once

#include <string>
#include <vector>

#include "diag.hpp"
#include "source.hpp"

namespace kir {

// Per-compilation-unit state shared by the lowering collaborators.
struct Session {
    SourceManager sources{};
    std::vector<Diagnostic> diags{};

    void error(Span span, std::string message);

    // Compiler bugs, not user errors. Reported as errors so the host stops
    // lowering the unit.
    void internal_error(Span span, std::string message);

    bool has_errors() const;
};

}  // namespace kir
