// Shared fixture for the kir unit tests: one compilation unit with builtins,
// a symbol table and a conversion scope rooted at a local function `main`.
#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "adapter.hpp"
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

namespace kir::test {

class KirTest : public ::testing::Test {
   protected:
    Session session{};
    TypeStore types{};
    IrArena arena{};
    IrFactory factory{arena};
    Builtins builtins{types, factory};
    SymbolTable symbols{session};
    ConversionScope scope{};
    DefaultTypeConverter converter{types, builtins};
    DefaultReceiverResolver receivers{};
    FunctionalTypes fn_types{types, builtins};
    IrFunction* enclosing = nullptr;

    KirTest() {
        enclosing = factory.create_function(
            Span{}, DeclOrigin::Defined, IrFunctionKind::Simple, "main",
            Visibility::Public, Modality::Final, builtins.unit_type(),
            FunctionFlags{}, nullptr);
        symbols.declare_function(enclosing);
        scope.push_parent(enclosing);
    }

    AdapterSynthesizer synthesizer(LanguageFeatures features = {}) {
        return AdapterSynthesizer(AdapterContext{
            .session = session,
            .types = types,
            .builtins = builtins,
            .factory = factory,
            .symbols = symbols,
            .scope = scope,
            .converter = converter,
            .receivers = receivers,
            .fn_types = fn_types,
            .features = features,
        });
    }

    TypeId fn_type(std::vector<TypeId> params, TypeId ret) {
        return builtins.function_type(FunctionClassKind::Function, params, ret);
    }
    TypeId suspend_fn_type(std::vector<TypeId> params, TypeId ret) {
        return builtins.function_type(FunctionClassKind::SuspendFunction,
                                      params, ret);
    }

    IrClass* declare_class(std::string name) {
        IrClass* c = factory.create_class(Span{}, DeclOrigin::Defined,
                                          std::move(name), nullptr);
        c->supertypes.push_back(builtins.any_type());
        return c;
    }

    IrFunction* declare_fn(std::string name, TypeId ret,
                           FunctionFlags flags = {},
                           IrFunctionKind kind = IrFunctionKind::Simple,
                           IrDeclaration* parent = nullptr) {
        IrFunction* f = factory.create_function(
            Span{}, DeclOrigin::Defined, kind, std::move(name),
            Visibility::Public, Modality::Final, ret, flags, parent);
        symbols.declare_function(f);
        return f;
    }

    IrValueParameter* add_param(IrFunction* f, std::string name, TypeId type,
                                bool has_default = false) {
        IrValueParameter* p = factory.create_value_parameter(
            Span{}, DeclOrigin::Defined, std::move(name),
            static_cast<std::int32_t>(f->value_params.size()), type,
            std::nullopt, has_default, f);
        f->value_params.push_back(p);
        return p;
    }

    IrValueParameter* add_vararg_param(IrFunction* f, std::string name,
                                       TypeId element) {
        IrValueParameter* p = factory.create_value_parameter(
            Span{}, DeclOrigin::Defined, std::move(name),
            static_cast<std::int32_t>(f->value_params.size()),
            builtins.vararg_array_type(element), element, false, f);
        f->value_params.push_back(p);
        return p;
    }

    IrValueParameter* receiver_param(IrFunction* f, TypeId type) {
        return factory.create_value_parameter(Span{}, DeclOrigin::Defined,
                                              "<this>", -1, type, std::nullopt,
                                              false, f);
    }

    IrGetValue* local_value(std::string name, TypeId type) {
        IrVariable* v = factory.create_variable(Span{}, std::move(name), type,
                                                enclosing);
        return factory.create_get_value(Span{}, v);
    }

    static CallableReferenceAccess unbound_ref(std::string name) {
        CallableReferenceAccess ref{};
        ref.callee_name = std::move(name);
        return ref;
    }

    bool has_internal_error(std::string_view fragment) const {
        for (const Diagnostic& d : session.diags) {
            if (d.is_internal() &&
                d.message.find(fragment) != std::string::npos)
                return true;
        }
        return false;
    }

    std::string dump(const IrNode* node) const {
        return ir_to_string(types, node);
    }
};

// The adapter held by a synthesized unbound reference.
inline IrFunction* adapter_of(IrExpression* e) {
    if (!e || e->kind != IrNodeKind::FunctionExpression) return nullptr;
    return static_cast<IrFunctionExpression*>(e)->function;
}

// The call an adapter body forwards to, unwrapping a `return`.
inline IrMemberAccess* forwarded_call(const IrFunction* adapter) {
    if (!adapter || adapter->body.size() != 1) return nullptr;
    IrNode* s = adapter->body[0];
    if (s->kind == IrNodeKind::Return) s = static_cast<IrReturn*>(s)->value;
    if (s->kind != IrNodeKind::Call && s->kind != IrNodeKind::ConstructorCall)
        return nullptr;
    return static_cast<IrMemberAccess*>(s);
}

inline const IrDeclaration* read_value(const IrNode* e) {
    if (!e || e->kind != IrNodeKind::GetValue) return nullptr;
    return static_cast<const IrGetValue*>(e)->value;
}

}  // namespace kir::test
