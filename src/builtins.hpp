#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <llvm/ADT/StringMap.h>

#include "ir.hpp"
#include "ir_factory.hpp"
#include "types.hpp"

namespace kir {

// Compiler-injected classes. Functional classes (`Function2`,
// `KSuspendFunction0`, ...) are created on first request.
class Builtins {
   public:
    Builtins(TypeStore& types, IrFactory& factory);

    Builtins(const Builtins&) = delete;
    Builtins& operator=(const Builtins&) = delete;

    TypeId any_type() const { return types_.simple_class(any_, {}); }
    TypeId nothing_type() const { return types_.simple_class(nothing_, {}); }
    TypeId unit_type() const { return types_.simple_class(unit_, {}); }
    TypeId boolean_type() const { return types_.simple_class(boolean_, {}); }
    TypeId char_type() const { return types_.simple_class(char_, {}); }
    TypeId int_type() const { return types_.simple_class(int_, {}); }
    TypeId long_type() const { return types_.simple_class(long_, {}); }
    TypeId string_type() const { return types_.simple_class(string_, {}); }

    TypeId array_type(TypeId element) const;
    TypeId list_type(TypeId element) const;

    // Type of a `vararg x: E` parameter: the primitive array class for
    // primitive elements, `Array<out E>` otherwise.
    TypeId vararg_array_type(TypeId element) const;

    IrClass* function_class(FunctionClassKind kind, std::uint32_t arity);
    TypeId function_type(FunctionClassKind kind,
                         const std::vector<TypeId>& params, TypeId ret);

    const IrClass* list_class() const { return list_; }
    const IrClass* kclass_class() const { return kclass_; }
    const IrClass* ktype_class() const { return ktype_; }
    const IrClass* ktype_parameter_class() const { return ktype_parameter_; }

    const IrClass* find_class(std::string_view name) const;

    bool is_unit(TypeId t) const;

   private:
    TypeStore& types_;
    IrFactory& factory_;

    llvm::StringMap<IrClass*> classes_{};
    std::unordered_map<const IrClass*, IrClass*> primitive_arrays_{};

    IrClass* any_ = nullptr;
    IrClass* nothing_ = nullptr;
    IrClass* unit_ = nullptr;
    IrClass* boolean_ = nullptr;
    IrClass* char_ = nullptr;
    IrClass* int_ = nullptr;
    IrClass* long_ = nullptr;
    IrClass* double_ = nullptr;
    IrClass* string_ = nullptr;
    IrClass* array_ = nullptr;
    IrClass* list_ = nullptr;
    IrClass* kclass_ = nullptr;
    IrClass* ktype_ = nullptr;
    IrClass* ktype_parameter_ = nullptr;

    IrClass* add_class(std::string_view name);
    IrClass* add_generic_class(std::string_view name, Variance variance);
};

}  // namespace kir
