#include "ir_factory.hpp"

#include <utility>

namespace kir {

IrClass* IrFactory::create_class(Span span, DeclOrigin origin, std::string name,
                                 IrDeclaration* parent) {
    IrClass* c = arena_.make<IrClass>(span, origin, std::move(name));
    c->parent = parent;
    return c;
}

IrTypeParameter* IrFactory::create_type_parameter(Span span, DeclOrigin origin,
                                                  std::string name,
                                                  std::uint32_t index,
                                                  Variance variance,
                                                  IrDeclaration* parent) {
    IrTypeParameter* p = arena_.make<IrTypeParameter>(span, origin,
                                                      std::move(name), index,
                                                      variance);
    p->parent = parent;
    return p;
}

IrFunction* IrFactory::create_function(Span span, DeclOrigin origin,
                                       IrFunctionKind fn_kind, std::string name,
                                       Visibility visibility, Modality modality,
                                       TypeId return_type, FunctionFlags flags,
                                       IrDeclaration* parent) {
    IrFunction* f = arena_.make<IrFunction>(span, origin, fn_kind,
                                            std::move(name), return_type);
    f->visibility = visibility;
    f->modality = modality;
    f->flags = flags;
    f->parent = parent;
    return f;
}

IrValueParameter* IrFactory::create_value_parameter(
    Span span, DeclOrigin origin, std::string name, std::int32_t index,
    TypeId type, std::optional<TypeId> vararg_element_type, bool has_default,
    IrFunction* parent) {
    IrValueParameter* p = arena_.make<IrValueParameter>(
        span, origin, std::move(name), index, type);
    p->vararg_element_type = vararg_element_type;
    p->has_default = has_default;
    p->parent = parent;
    return p;
}

IrVariable* IrFactory::create_variable(Span span, std::string name, TypeId type,
                                       IrDeclaration* parent) {
    IrVariable* v =
        arena_.make<IrVariable>(span, DeclOrigin::Defined, std::move(name), type);
    v->parent = parent;
    return v;
}

IrGetValue* IrFactory::create_get_value(Span span, IrValueParameter* param,
                                        StmtOrigin origin) {
    return arena_.make<IrGetValue>(span, param->type, param, origin);
}

IrGetValue* IrFactory::create_get_value(Span span, IrVariable* var,
                                        StmtOrigin origin) {
    return arena_.make<IrGetValue>(span, var->type, var, origin);
}

IrConst* IrFactory::create_const(Span span, TypeId type, std::string text) {
    return arena_.make<IrConst>(span, type, std::move(text));
}

IrCall* IrFactory::create_call(Span span, TypeId type, IrFunction* callee,
                               StmtOrigin origin) {
    return arena_.make<IrCall>(span, type, callee, callee->value_params.size(),
                               origin);
}

IrConstructorCall* IrFactory::create_constructor_call(Span span, TypeId type,
                                                      IrFunction* callee) {
    return arena_.make<IrConstructorCall>(
        span, type, callee, callee->value_params.size(), StmtOrigin::None);
}

IrFunctionReference* IrFactory::create_function_reference(Span span,
                                                          TypeId type,
                                                          IrFunction* callee,
                                                          StmtOrigin origin) {
    return arena_.make<IrFunctionReference>(
        span, type, callee, callee->value_params.size(), origin);
}

IrVararg* IrFactory::create_vararg(Span span, TypeId array_type,
                                   TypeId element_type) {
    return arena_.make<IrVararg>(span, array_type, element_type);
}

IrSpreadElement* IrFactory::create_spread_element(Span span,
                                                  IrExpression* expr) {
    return arena_.make<IrSpreadElement>(span, expr);
}

IrReturn* IrFactory::create_return(Span span, TypeId nothing_type,
                                   IrFunction* target, IrExpression* value) {
    return arena_.make<IrReturn>(span, nothing_type, target, value);
}

IrBlock* IrFactory::create_block(Span span, TypeId type, StmtOrigin origin) {
    return arena_.make<IrBlock>(span, type, origin);
}

IrFunctionExpression* IrFactory::create_function_expression(
    Span span, TypeId type, IrFunction* function, StmtOrigin origin) {
    return arena_.make<IrFunctionExpression>(span, type, function, origin);
}

}  // namespace kir
