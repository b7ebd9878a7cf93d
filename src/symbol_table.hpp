#pragma once

#include <cstddef>
#include <vector>

#include <llvm/ADT/SmallVector.h>

#include "ir.hpp"
#include "session.hpp"

namespace kir {

// Allocates function symbols and tracks which declaration currently owns
// newly declared value parameters. Scopes nest strictly.
class SymbolTable {
   public:
    explicit SymbolTable(Session& session) : session_(session) {}

    SymbolId declare_function(IrFunction* fn);
    const IrFunction* lookup(SymbolId id) const;

    // Parameters may only be declared inside the scope of their function.
    bool declare_value_parameter(IrValueParameter* param);

    void enter_scope(const IrDeclaration* owner);
    bool leave_scope(const IrDeclaration* owner);

    size_t scope_depth() const { return scopes_.size(); }
    const IrDeclaration* current_scope_owner() const;

    // Enters the scope of `owner` on construction and leaves it on
    // destruction, on every path.
    class ScopeGuard {
       public:
        ScopeGuard(SymbolTable& table, const IrDeclaration* owner)
            : table_(table), owner_(owner) {
            table_.enter_scope(owner_);
        }
        ~ScopeGuard() { (void)table_.leave_scope(owner_); }

        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

       private:
        SymbolTable& table_;
        const IrDeclaration* owner_ = nullptr;
    };

   private:
    struct Scope {
        const IrDeclaration* owner = nullptr;
        std::vector<const IrValueParameter*> params{};
    };

    Session& session_;
    llvm::SmallVector<Scope, 4> scopes_{};
    std::vector<IrFunction*> functions_{};  // index = symbol - 1
};

// The declaration that synthetic local declarations get attached to.
class ConversionScope {
   public:
    void push_parent(IrDeclaration* parent) { parents_.push_back(parent); }
    void pop_parent() {
        if (!parents_.empty()) parents_.pop_back();
    }
    IrDeclaration* parent() const {
        return parents_.empty() ? nullptr : parents_.back();
    }

   private:
    std::vector<IrDeclaration*> parents_{};
};

}  // namespace kir
