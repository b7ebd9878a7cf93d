#pragma once

#include <optional>
#include <string>
#include <vector>

#include "builtins.hpp"
#include "features.hpp"
#include "fn_types.hpp"
#include "ir.hpp"
#include "ir_factory.hpp"
#include "receivers.hpp"
#include "session.hpp"
#include "symbol_table.hpp"
#include "type_converter.hpp"
#include "types.hpp"

namespace kir {

// Collaborators shared by every synthesis call of a compilation unit.
struct AdapterContext {
    Session& session;
    TypeStore& types;
    Builtins& builtins;
    IrFactory& factory;
    SymbolTable& symbols;
    const ConversionScope& scope;
    TypeConverter& converter;
    ReceiverResolver& receivers;
    const FunctionalTypes& fn_types;
    LanguageFeatures features{};
};

// Builds synthetic wrapper functions for callable references and
// function-typed arguments whose signature does not match the expected
// functional type. This covers:
// 1) suspend conversion: a non-suspend function or functional value passed
//    where a suspend functional type is expected;
// 2) coercion to Unit: a reference to a function returning non-Unit passed
//    where the expected functional type returns Unit;
// 3) vararg spread: a reference to a function with a vararg parameter whose
//    expected type supplies the vararg elements as separate parameters.
//
// Internal errors are reported on the session and yield nullptr. Cases that
// cannot be adapted leave the input unchanged.
class AdapterSynthesizer {
   public:
    explicit AdapterSynthesizer(AdapterContext ctx) : ctx_(ctx) {}

    bool needs_adapter(const CallableReferenceAccess& ref, TypeId expected_type,
                       const IrFunction& function) const;

    // `expected_type` is the functional type the reference must have
    // (parameter types followed by the return type). Callers check
    // `needs_adapter` first.
    //
    // Unbound references yield a function expression holding the adapter.
    // Bound references yield a block declaring the adapter followed by a
    // reference to it whose extension receiver is the bound value.
    IrExpression* synthesize_for_callable_reference(
        const CallableReferenceAccess& ref, IrExpression* explicit_receiver,
        FunctionSymbol adaptee, TypeId expected_type);

    // Suspend conversion of an already converted argument. Returns
    // `argument` itself when no conversion applies.
    IrExpression* synthesize_for_argument(
        IrExpression* argument, std::optional<TypeId> expected_parameter_type);

   private:
    AdapterContext ctx_;

    struct ExpectedSignature {
        std::vector<TypeId> params{};
        TypeId ret = 0;
    };

    bool need_suspend_conversion(TypeId expected_type,
                                 const IrFunction& function) const;
    bool need_coercion_to_unit(TypeId expected_type,
                               const IrFunction& function) const;
    bool need_vararg_spread(const CallableReferenceAccess& ref,
                            TypeId expected_type,
                            const IrFunction& function) const;

    std::optional<ExpectedSignature> split_functional_type(TypeId type,
                                                           Span span);

    IrFunction* create_adapter_function(Span span, DeclOrigin origin,
                                        std::string name,
                                        const ExpectedSignature& sig,
                                        FunctionFlags flags,
                                        std::optional<TypeId> receiver_type,
                                        std::string receiver_name);
    IrValueParameter* create_adapter_parameter(IrFunction* adapter,
                                               std::string name,
                                               std::int32_t index, TypeId type,
                                               DeclOrigin origin);

    IrMemberAccess* create_adaptee_call_for_callable_reference(
        const CallableReferenceAccess& ref, IrFunction* adaptee,
        IrFunction* adapter, IrExpression* bound_dispatch_receiver,
        IrExpression* bound_extension_receiver);
    IrExpression* adapt_vararg_argument(Span span,
                                        const IrValueParameter& param,
                                        const IrFunction& adapter,
                                        size_t& next_adapter_param);

    IrCall* create_adaptee_call_for_argument(Span span, IrFunction* adapter,
                                             IrFunction* invoke);

    void set_single_statement_body(IrFunction* adapter, IrExpression* call,
                                   TypeId expected_return_type);
};

}  // namespace kir
