#pragma once

#include "builtins.hpp"
#include "session.hpp"
#include "types.hpp"

namespace kir {

// What reflection proxies need from the IR interpreter: where to report
// problems and the builtin classes that describe values at run time.
class IrInterpreter {
   public:
    IrInterpreter(Session& session, const TypeStore& types,
                  const Builtins& builtins)
        : session_(session), types_(types), builtins_(builtins) {}

    Session& session() { return session_; }
    const TypeStore& types() const { return types_; }
    const Builtins& builtins() const { return builtins_; }

   private:
    Session& session_;
    const TypeStore& types_;
    const Builtins& builtins_;
};

}  // namespace kir
