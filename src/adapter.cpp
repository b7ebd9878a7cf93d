#include "adapter.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace kir {
namespace {

enum class VarargState : std::uint8_t {
    ConsumingElements,
    FoundWholeArray,
    Exhausted,
    Mismatch,
};

DeclOrigin parameter_origin(DeclOrigin function_origin) {
    if (function_origin == DeclOrigin::AdapterForSuspendConversion)
        return DeclOrigin::AdapterParameterForSuspendConversion;
    return DeclOrigin::AdapterParameterForCallableReference;
}

bool is_adapter_block(const IrExpression* e) {
    if (e->kind != IrNodeKind::Block) return false;
    const StmtOrigin origin = static_cast<const IrBlock*>(e)->origin;
    return origin == StmtOrigin::AdaptedFunctionReference ||
           origin == StmtOrigin::SuspendConversion;
}

}  // namespace

// ---- Adapter detection ----

bool AdapterSynthesizer::needs_adapter(const CallableReferenceAccess& ref,
                                       TypeId expected_type,
                                       const IrFunction& function) const {
    return need_suspend_conversion(expected_type, function) ||
           need_coercion_to_unit(expected_type, function) ||
           need_vararg_spread(ref, expected_type, function);
}

// fun consumer(f: suspend () -> Unit)
// fun plain() {}
// consumer(::plain)  // adapter: suspend { plain() }
bool AdapterSynthesizer::need_suspend_conversion(
    TypeId expected_type, const IrFunction& function) const {
    if (!ctx_.features.suspend_conversion) return false;
    return ctx_.fn_types.is_suspend_functional_type(expected_type) &&
           !function.flags.is_suspend;
}

// fun consumer(f: () -> Unit)
// fun produce(): Any
// consumer(::produce)  // adapter: { produce() }
bool AdapterSynthesizer::need_coercion_to_unit(
    TypeId expected_type, const IrFunction& function) const {
    const TypeData& d = ctx_.types.get(expected_type);
    if (d.kind != TypeKind::Class || d.args.empty()) return false;
    std::optional<TypeId> expected_ret = d.args.back().type_or_null();
    return expected_ret && ctx_.builtins.is_unit(*expected_ret) &&
           !ctx_.builtins.is_unit(function.return_type);
}

// fun consumer(f: (Char, Char) -> String)
// fun join(vararg xs: Char): String
// consumer(::join)  // adapter: { a, b -> join(a, b) }
bool AdapterSynthesizer::need_vararg_spread(const CallableReferenceAccess& ref,
                                            TypeId expected_type,
                                            const IrFunction& function) const {
    const TypeData& d = ctx_.types.get(expected_type);
    if (d.kind != TypeKind::Class) return false;

    // `A::foo` takes its receiver as the first functional parameter.
    const size_t shift = ref.has_static_qualifier() ? 1 : 0;
    if (d.args.size() < 1 + shift) return false;
    const size_t expected_param_count = d.args.size() - 1 - shift;
    if (expected_param_count < function.value_params.size()) return false;

    for (size_t i = 0; i < function.value_params.size(); i++) {
        const IrValueParameter* p = function.value_params[i];
        if (p->is_vararg() &&
            d.args[shift + i].type_or_null() == p->vararg_element_type)
            return true;
    }
    return false;
}

std::optional<AdapterSynthesizer::ExpectedSignature>
AdapterSynthesizer::split_functional_type(TypeId type, Span span) {
    const TypeData& d = ctx_.types.get(type);
    if (d.kind != TypeKind::Class || d.args.empty()) {
        ctx_.session.internal_error(span, "expected type `" +
                                              ctx_.types.to_string(type) +
                                              "` is not a functional type");
        return std::nullopt;
    }

    ExpectedSignature sig{};
    for (size_t i = 0; i < d.args.size(); i++) {
        std::optional<TypeId> t = d.args[i].type_or_null();
        if (!t) {
            ctx_.session.internal_error(
                span, "expected type `" + ctx_.types.to_string(type) +
                          "` has a star-projected argument");
            return std::nullopt;
        }
        if (i + 1 == d.args.size())
            sig.ret = *t;
        else
            sig.params.push_back(*t);
    }
    return sig;
}

// ---- Adapter declarations ----

IrFunction* AdapterSynthesizer::create_adapter_function(
    Span span, DeclOrigin origin, std::string name, const ExpectedSignature& sig,
    FunctionFlags flags, std::optional<TypeId> receiver_type,
    std::string receiver_name) {
    IrDeclaration* parent = ctx_.scope.parent();
    if (!parent) {
        ctx_.session.internal_error(
            span, "no enclosing declaration for adapter `" + name + "`");
        return nullptr;
    }

    IrFunction* adapter = ctx_.factory.create_function(
        span, origin, IrFunctionKind::Simple, std::move(name),
        Visibility::Local, Modality::Final, sig.ret, flags, parent);

    const DeclOrigin param_origin = parameter_origin(origin);
    SymbolTable::ScopeGuard guard(ctx_.symbols, adapter);
    if (receiver_type) {
        adapter->extension_receiver =
            create_adapter_parameter(adapter, std::move(receiver_name), -1,
                                     *receiver_type, param_origin);
        if (!adapter->extension_receiver) return nullptr;
    }
    for (size_t i = 0; i < sig.params.size(); i++) {
        IrValueParameter* p = create_adapter_parameter(
            adapter, "p" + std::to_string(i), static_cast<std::int32_t>(i),
            sig.params[i], param_origin);
        if (!p) return nullptr;
        adapter->value_params.push_back(p);
    }
    return adapter;
}

IrValueParameter* AdapterSynthesizer::create_adapter_parameter(
    IrFunction* adapter, std::string name, std::int32_t index, TypeId type,
    DeclOrigin origin) {
    IrValueParameter* p = ctx_.factory.create_value_parameter(
        adapter->span, origin, std::move(name), index, type,
        /*vararg_element_type=*/std::nullopt, /*has_default=*/false, adapter);
    if (!ctx_.symbols.declare_value_parameter(p)) return nullptr;
    return p;
}

void AdapterSynthesizer::set_single_statement_body(
    IrFunction* adapter, IrExpression* call, TypeId expected_return_type) {
    adapter->has_body = true;
    adapter->body.clear();
    if (ctx_.builtins.is_unit(expected_return_type)) {
        adapter->body.push_back(call);
    } else {
        adapter->body.push_back(ctx_.factory.create_return(
            call->span, ctx_.builtins.nothing_type(), adapter, call));
    }
}

// ---- Callable references ----

IrExpression* AdapterSynthesizer::synthesize_for_callable_reference(
    const CallableReferenceAccess& ref, IrExpression* explicit_receiver,
    FunctionSymbol adaptee_symbol, TypeId expected_type) {
    if (!adaptee_symbol.is_bound()) {
        ctx_.session.internal_error(
            ref.span, "unbound adaptee symbol for `" + render(ref) + "`");
        return nullptr;
    }
    IrFunction* adaptee = adaptee_symbol.owner;
    switch (adaptee->fn_kind) {
        case IrFunctionKind::Simple:
        case IrFunctionKind::Constructor:
            break;
        case IrFunctionKind::PropertyAccessor:
            ctx_.session.internal_error(ref.span, "unknown callee kind: `" +
                                                      adaptee->name + "` in `" +
                                                      render(ref) + "`");
            return nullptr;
    }

    std::optional<ExpectedSignature> sig =
        split_functional_type(expected_type, ref.span);
    if (!sig) return nullptr;

    IrExpression* bound_dispatch_receiver = ctx_.receivers.find_bound_receiver(
        ref, explicit_receiver, /*is_dispatch=*/true);
    IrExpression* bound_extension_receiver = ctx_.receivers.find_bound_receiver(
        ref, explicit_receiver, /*is_dispatch=*/false);
    if (bound_dispatch_receiver && bound_extension_receiver) {
        ctx_.session.internal_error(
            ref.span,
            "bound callable references can't have both receivers: `" +
                render(ref) + "`");
        return nullptr;
    }
    IrExpression* bound_receiver = bound_dispatch_receiver
                                       ? bound_dispatch_receiver
                                       : bound_extension_receiver;

    FunctionFlags flags = adaptee->flags;
    flags.is_suspend = adaptee->flags.is_suspend ||
                       ctx_.fn_types.is_suspend_functional_type(expected_type);

    std::optional<TypeId> receiver_type{};
    if (bound_receiver) receiver_type = bound_receiver->type;

    IrFunction* adapter = create_adapter_function(
        ref.span, DeclOrigin::AdapterForCallableReference, adaptee->name, *sig,
        flags, receiver_type, "receiver");
    if (!adapter) return nullptr;

    IrMemberAccess* call = create_adaptee_call_for_callable_reference(
        ref, adaptee, adapter, bound_dispatch_receiver,
        bound_extension_receiver);
    if (!call) return nullptr;
    set_single_statement_body(adapter, call, sig->ret);
    ctx_.symbols.declare_function(adapter);

    if (!bound_receiver) {
        return ctx_.factory.create_function_expression(
            ref.span, expected_type, adapter,
            StmtOrigin::AdaptedFunctionReference);
    }

    IrFunctionReference* adapter_ref = ctx_.factory.create_function_reference(
        ref.span, expected_type, adapter, StmtOrigin::AdaptedFunctionReference);
    adapter_ref->extension_receiver = bound_receiver;

    IrBlock* block = ctx_.factory.create_block(
        ref.span, expected_type, StmtOrigin::AdaptedFunctionReference);
    block->statements.push_back(adapter);
    block->statements.push_back(adapter_ref);
    return block;
}

IrMemberAccess* AdapterSynthesizer::create_adaptee_call_for_callable_reference(
    const CallableReferenceAccess& ref, IrFunction* adaptee, IrFunction* adapter,
    IrExpression* bound_dispatch_receiver,
    IrExpression* bound_extension_receiver) {
    const Span span = ref.span;

    IrMemberAccess* call = nullptr;
    switch (adaptee->fn_kind) {
        case IrFunctionKind::Constructor:
            call = ctx_.factory.create_constructor_call(
                span, adaptee->return_type, adaptee);
            break;
        case IrFunctionKind::Simple:
            call = ctx_.factory.create_call(span, adaptee->return_type, adaptee);
            break;
        case IrFunctionKind::PropertyAccessor:
            ctx_.session.internal_error(
                span, "unknown callee kind: `" + adaptee->name + "`");
            return nullptr;
    }

    // Cursor into the adapter's value parameters. The adaptee's parameters
    // are walked by the loop below at their own pace.
    size_t next_adapter_param = 0;

    if (bound_dispatch_receiver || bound_extension_receiver) {
        IrGetValue* receiver = ctx_.factory.create_get_value(
            span, adapter->extension_receiver,
            StmtOrigin::AdaptedFunctionReference);
        if (bound_dispatch_receiver)
            call->dispatch_receiver = receiver;
        else
            call->extension_receiver = receiver;
    } else if (ref.has_static_qualifier()) {
        // Unbound `A::foo`: the first adapter parameter is the receiver.
        if (adapter->value_params.empty()) {
            ctx_.session.internal_error(
                span, "adapter for `" + render(ref) +
                          "` has no parameter for the qualifier receiver");
            return nullptr;
        }
        IrGetValue* receiver =
            ctx_.factory.create_get_value(span, adapter->value_params[0]);
        if (adaptee->extension_receiver)
            call->extension_receiver = receiver;
        else
            call->dispatch_receiver = receiver;
        next_adapter_param = 1;
    }

    for (size_t i = 0; i < adaptee->value_params.size(); i++) {
        const IrValueParameter& param = *adaptee->value_params[i];
        if (param.is_vararg()) {
            call->put_value_argument(
                i, adapt_vararg_argument(span, param, *adapter,
                                         next_adapter_param));
            continue;
        }
        if (param.has_default) {
            call->put_value_argument(i, nullptr);
            continue;
        }
        if (next_adapter_param >= adapter->value_params.size()) {
            ctx_.session.internal_error(
                span, "adapter for `" + render(ref) +
                          "` has no parameter for `" + param.name + "`");
            return nullptr;
        }
        call->put_value_argument(
            i, ctx_.factory.create_get_value(
                   span, adapter->value_params[next_adapter_param++]));
    }

    call->type_args = ref.type_args;
    return call;
}

// Collects adapter parameters into a vararg argument. A parameter typed as
// the whole array is spread and ends the vararg; parameters typed as the
// element type become individual elements. Returns nullptr ("no argument")
// when no parameter is left or a parameter matches neither type. On a
// mismatch the cursor stays past the elements already taken.
IrExpression* AdapterSynthesizer::adapt_vararg_argument(
    Span span, const IrValueParameter& param, const IrFunction& adapter,
    size_t& next_adapter_param) {
    const std::vector<IrValueParameter*>& params = adapter.value_params;
    if (next_adapter_param >= params.size()) return nullptr;

    const TypeId element_type = *param.vararg_element_type;
    IrVararg* vararg =
        ctx_.factory.create_vararg(span, param.type, element_type);

    VarargState state = VarargState::ConsumingElements;
    while (state == VarargState::ConsumingElements) {
        if (next_adapter_param >= params.size()) {
            state = VarargState::Exhausted;
            break;
        }
        IrValueParameter* candidate = params[next_adapter_param];
        if (candidate->type == param.type) {
            vararg->add_element(ctx_.factory.create_spread_element(
                span, ctx_.factory.create_get_value(span, candidate)));
            next_adapter_param++;
            state = VarargState::FoundWholeArray;
        } else if (candidate->type == element_type) {
            vararg->add_element(ctx_.factory.create_get_value(span, candidate));
            next_adapter_param++;
        } else {
            state = VarargState::Mismatch;
        }
    }

    if (state == VarargState::Mismatch) return nullptr;
    return vararg;
}

// ---- Suspend conversion of arguments ----

// fun consumer(f: suspend () -> Unit)
// val plain: () -> Unit = ...
// consumer(plain)  // adapter: suspend fun (callee: () -> Unit) { callee() }
//
// Any subtype of the functional type works too, through its `invoke`.
IrExpression* AdapterSynthesizer::synthesize_for_argument(
    IrExpression* argument, std::optional<TypeId> expected_parameter_type) {
    if (is_adapter_block(argument)) return argument;
    if (!expected_parameter_type) return argument;
    if (!ctx_.features.suspend_conversion) return argument;

    const TypeId expected_type = *expected_parameter_type;
    if (!ctx_.fn_types.is_suspend_functional_type(expected_type) ||
        ctx_.fn_types.is_suspend_functional_type(argument->type))
        return argument;

    std::optional<TypeId> functional_type =
        ctx_.fn_types.to_non_suspend_functional_supertype(expected_type);
    if (!functional_type) return argument;

    IrFunction* invoke =
        ctx_.fn_types.find_invoke_member(argument->type, *functional_type);
    if (!invoke) return argument;

    const Span span = argument->span;
    const TypeId suspend_type = ctx_.converter.to_runtime_type(expected_type);
    std::optional<ExpectedSignature> sig =
        split_functional_type(suspend_type, span);
    if (!sig) return nullptr;

    IrFunction* adapter = create_adapter_function(
        span, DeclOrigin::AdapterForSuspendConversion, "suspendConversion",
        *sig, FunctionFlags{.is_suspend = true}, argument->type, "callee");
    if (!adapter) return nullptr;

    IrCall* call = create_adaptee_call_for_argument(span, adapter, invoke);
    if (!call) return nullptr;
    set_single_statement_body(adapter, call, sig->ret);
    ctx_.symbols.declare_function(adapter);

    IrFunctionReference* adapter_ref = ctx_.factory.create_function_reference(
        span, suspend_type, adapter, StmtOrigin::SuspendConversion);
    adapter_ref->extension_receiver = argument;

    IrBlock* block = ctx_.factory.create_block(span, suspend_type,
                                               StmtOrigin::SuspendConversion);
    block->statements.push_back(adapter);
    block->statements.push_back(adapter_ref);
    return block;
}

IrCall* AdapterSynthesizer::create_adaptee_call_for_argument(
    Span span, IrFunction* adapter, IrFunction* invoke) {
    if (invoke->value_params.size() != adapter->value_params.size()) {
        ctx_.session.internal_error(
            span, "`invoke` takes " +
                      std::to_string(invoke->value_params.size()) +
                      " parameters, adapter provides " +
                      std::to_string(adapter->value_params.size()));
        return nullptr;
    }

    IrCall* call =
        ctx_.factory.create_call(span, adapter->return_type, invoke);
    call->dispatch_receiver =
        ctx_.factory.create_get_value(span, adapter->extension_receiver);
    for (IrValueParameter* p : adapter->value_params) {
        call->put_value_argument(static_cast<size_t>(p->index),
                                 ctx_.factory.create_get_value(span, p));
    }
    return call;
}

}  // namespace kir
