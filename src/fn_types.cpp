#include "fn_types.hpp"

#include <unordered_set>
#include <vector>

namespace kir {
namespace {

IrFunction* find_invoke_in_hierarchy(
    const TypeStore& types, const IrClass* cls, std::uint32_t arity,
    std::unordered_set<const IrClass*>& visited) {
    if (!cls || !visited.insert(cls).second) return nullptr;
    for (IrFunction* f : cls->functions) {
        if (f->name == "invoke" && f->flags.is_operator &&
            f->value_params.size() == arity)
            return f;
    }
    for (TypeId super : cls->supertypes) {
        if (IrFunction* f = find_invoke_in_hierarchy(
                types, types.class_of(super), arity, visited))
            return f;
    }
    return nullptr;
}

bool inherits_from(const TypeStore& types, const IrClass* cls,
                   const IrClass* target,
                   std::unordered_set<const IrClass*>& visited) {
    if (!cls || !visited.insert(cls).second) return false;
    if (cls == target) return true;
    for (TypeId super : cls->supertypes) {
        if (inherits_from(types, types.class_of(super), target, visited))
            return true;
    }
    return false;
}

}  // namespace

const FunctionalClassInfo* FunctionalTypes::functional_info(TypeId t) const {
    const IrClass* c = types_.class_of(t);
    if (!c || !c->functional) return nullptr;
    return &*c->functional;
}

bool FunctionalTypes::is_suspend_functional_type(TypeId t) const {
    const FunctionalClassInfo* info = functional_info(t);
    if (!info) return false;
    return info->kind == FunctionClassKind::SuspendFunction ||
           info->kind == FunctionClassKind::KSuspendFunction;
}

bool FunctionalTypes::is_builtin_functional_type(TypeId t) const {
    return functional_info(t) != nullptr;
}

bool FunctionalTypes::is_subtype_of_functional_type(
    TypeId t, TypeId functional_type) const {
    const IrClass* target = types_.class_of(functional_type);
    if (!target) return false;
    std::unordered_set<const IrClass*> visited{};
    return inherits_from(types_, types_.class_of(t), target, visited);
}

std::optional<TypeId> FunctionalTypes::to_non_suspend_functional_supertype(
    TypeId t) const {
    if (!is_suspend_functional_type(t)) return std::nullopt;
    const TypeData& d = types_.get(t);
    const std::uint32_t arity = d.class_def->functional->arity;
    std::vector<TypeArg> args = d.args;
    const bool nullable = d.nullable;
    IrClass* plain = builtins_.function_class(FunctionClassKind::Function, arity);
    return types_.class_(plain, std::move(args), nullable);
}

std::optional<std::uint32_t> FunctionalTypes::functional_arity(TypeId t) const {
    const FunctionalClassInfo* info = functional_info(t);
    if (!info) return std::nullopt;
    return info->arity;
}

IrFunction* FunctionalTypes::find_base_invoke(TypeId t) const {
    const IrClass* c = types_.class_of(t);
    if (!c || !c->functional) return nullptr;
    return c->find_function("invoke");
}

IrFunction* FunctionalTypes::find_contributed_invoke(
    TypeId t, TypeId functional_type) const {
    auto arity = functional_arity(functional_type);
    if (!arity) return nullptr;
    std::unordered_set<const IrClass*> visited{};
    return find_invoke_in_hierarchy(types_, types_.class_of(t), *arity,
                                    visited);
}

IrFunction* FunctionalTypes::find_invoke_member(TypeId argument_type,
                                                TypeId functional_type) const {
    if (types_.get(argument_type).kind != TypeKind::Class) return nullptr;
    if (!is_subtype_of_functional_type(argument_type, functional_type))
        return nullptr;
    if (is_builtin_functional_type(argument_type))
        return find_base_invoke(argument_type);
    return find_contributed_invoke(argument_type, functional_type);
}

}  // namespace kir
