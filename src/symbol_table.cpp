#include "symbol_table.hpp"

#include <string>

namespace kir {

SymbolId SymbolTable::declare_function(IrFunction* fn) {
    if (fn->symbol != 0) return fn->symbol;
    functions_.push_back(fn);
    fn->symbol = static_cast<SymbolId>(functions_.size());
    return fn->symbol;
}

const IrFunction* SymbolTable::lookup(SymbolId id) const {
    if (id == 0 || id > functions_.size()) return nullptr;
    return functions_[id - 1];
}

bool SymbolTable::declare_value_parameter(IrValueParameter* param) {
    if (scopes_.empty() || scopes_.back().owner != param->parent) {
        session_.internal_error(param->span,
                                "value parameter `" + param->name +
                                    "` declared outside its function's scope");
        return false;
    }
    scopes_.back().params.push_back(param);
    return true;
}

void SymbolTable::enter_scope(const IrDeclaration* owner) {
    scopes_.push_back(Scope{.owner = owner});
}

bool SymbolTable::leave_scope(const IrDeclaration* owner) {
    if (scopes_.empty() || scopes_.back().owner != owner) {
        session_.internal_error(owner ? owner->span : Span{},
                                "unbalanced symbol table scope exit");
        return false;
    }
    scopes_.pop_back();
    return true;
}

const IrDeclaration* SymbolTable::current_scope_owner() const {
    return scopes_.empty() ? nullptr : scopes_.back().owner;
}

}  // namespace kir
