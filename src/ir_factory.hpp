#pragma once

#include <optional>
#include <string>

#include "ir.hpp"

namespace kir {

// Creates IR nodes owned by an IrArena. Declarations are attached to the
// parent passed in; value parameters are not appended to their function,
// callers decide which slot they fill.
class IrFactory {
   public:
    explicit IrFactory(IrArena& arena) : arena_(arena) {}

    IrClass* create_class(Span span, DeclOrigin origin, std::string name,
                          IrDeclaration* parent);
    IrTypeParameter* create_type_parameter(Span span, DeclOrigin origin,
                                           std::string name,
                                           std::uint32_t index,
                                           Variance variance,
                                           IrDeclaration* parent);
    IrFunction* create_function(Span span, DeclOrigin origin,
                                IrFunctionKind fn_kind, std::string name,
                                Visibility visibility, Modality modality,
                                TypeId return_type, FunctionFlags flags,
                                IrDeclaration* parent);
    IrValueParameter* create_value_parameter(
        Span span, DeclOrigin origin, std::string name, std::int32_t index,
        TypeId type, std::optional<TypeId> vararg_element_type,
        bool has_default, IrFunction* parent);
    IrVariable* create_variable(Span span, std::string name, TypeId type,
                                IrDeclaration* parent);

    IrGetValue* create_get_value(Span span, IrValueParameter* param,
                                 StmtOrigin origin = StmtOrigin::None);
    IrGetValue* create_get_value(Span span, IrVariable* var,
                                 StmtOrigin origin = StmtOrigin::None);
    IrConst* create_const(Span span, TypeId type, std::string text);

    // Value-argument slots are sized from the callee's value parameters.
    IrCall* create_call(Span span, TypeId type, IrFunction* callee,
                        StmtOrigin origin = StmtOrigin::None);
    IrConstructorCall* create_constructor_call(Span span, TypeId type,
                                               IrFunction* callee);
    IrFunctionReference* create_function_reference(Span span, TypeId type,
                                                   IrFunction* callee,
                                                   StmtOrigin origin);

    IrVararg* create_vararg(Span span, TypeId array_type, TypeId element_type);
    IrSpreadElement* create_spread_element(Span span, IrExpression* expr);
    IrReturn* create_return(Span span, TypeId nothing_type, IrFunction* target,
                            IrExpression* value);
    IrBlock* create_block(Span span, TypeId type, StmtOrigin origin);
    IrFunctionExpression* create_function_expression(Span span, TypeId type,
                                                     IrFunction* function,
                                                     StmtOrigin origin);

   private:
    IrArena& arena_;
};

}  // namespace kir
