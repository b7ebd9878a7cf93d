#pragma once

#include <cstdint>
#include <optional>

#include "builtins.hpp"
#include "ir.hpp"
#include "types.hpp"

namespace kir {

// Queries over the builtin functional classes and their subtypes.
class FunctionalTypes {
   public:
    FunctionalTypes(const TypeStore& types, Builtins& builtins)
        : types_(types), builtins_(builtins) {}

    // `SuspendFunctionN` or `KSuspendFunctionN`.
    bool is_suspend_functional_type(TypeId t) const;

    // Any of the four builtin functional class families.
    bool is_builtin_functional_type(TypeId t) const;

    // True if the class of `t` is, or inherits from, the class of
    // `functional_type`. Type arguments are not compared.
    bool is_subtype_of_functional_type(TypeId t, TypeId functional_type) const;

    // `suspend (A) -> R` to `(A) -> R`, same arguments. nullopt if `t` is not
    // a suspend functional type.
    std::optional<TypeId> to_non_suspend_functional_supertype(TypeId t) const;

    std::optional<std::uint32_t> functional_arity(TypeId t) const;

    // The `invoke` member declared by a builtin functional class.
    IrFunction* find_base_invoke(TypeId t) const;

    // The `invoke` operator a class contributes (declared or inherited) with
    // the arity of `functional_type`.
    IrFunction* find_contributed_invoke(TypeId t, TypeId functional_type) const;

    // The invoke member of `argument_type` compatible with
    // `functional_type`, or nullptr for non-class types (e.g. intersections)
    // and non-subtypes.
    IrFunction* find_invoke_member(TypeId argument_type,
                                   TypeId functional_type) const;

   private:
    const TypeStore& types_;
    Builtins& builtins_;

    const FunctionalClassInfo* functional_info(TypeId t) const;
};

}  // namespace kir
