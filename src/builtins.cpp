#include "builtins.hpp"

#include <string>
#include <utility>

namespace kir {
namespace {

std::string_view function_class_prefix(FunctionClassKind kind) {
    switch (kind) {
        case FunctionClassKind::Function:
            return "Function";
        case FunctionClassKind::SuspendFunction:
            return "SuspendFunction";
        case FunctionClassKind::KFunction:
            return "KFunction";
        case FunctionClassKind::KSuspendFunction:
            return "KSuspendFunction";
    }
    return "Function";
}

bool is_suspend_kind(FunctionClassKind kind) {
    return kind == FunctionClassKind::SuspendFunction ||
           kind == FunctionClassKind::KSuspendFunction;
}

}  // namespace

Builtins::Builtins(TypeStore& types, IrFactory& factory)
    : types_(types), factory_(factory) {
    any_ = add_class("Any");
    nothing_ = add_class("Nothing");
    unit_ = add_class("Unit");
    boolean_ = add_class("Boolean");
    char_ = add_class("Char");
    int_ = add_class("Int");
    long_ = add_class("Long");
    double_ = add_class("Double");
    string_ = add_class("String");

    array_ = add_generic_class("Array", Variance::Invariant);
    list_ = add_generic_class("List", Variance::Out);

    const std::pair<IrClass*, std::string_view> primitive_arrays[] = {
        {boolean_, "BooleanArray"}, {char_, "CharArray"},
        {int_, "IntArray"},         {long_, "LongArray"},
        {double_, "DoubleArray"},
    };
    for (const auto& [elem, name] : primitive_arrays)
        primitive_arrays_.insert({elem, add_class(name)});

    ktype_ = add_class("KType");
    ktype_parameter_ = add_class("KTypeParameter");
    kclass_ = add_generic_class("KClass", Variance::Invariant);

    // `KClass<T>.typeParameters: List<KTypeParameter>`
    IrFunction* type_parameters = factory_.create_function(
        Span{}, DeclOrigin::Builtin, IrFunctionKind::PropertyAccessor,
        "typeParameters", Visibility::Public, Modality::Final,
        list_type(types_.simple_class(ktype_parameter_, {})), FunctionFlags{},
        kclass_);
    type_parameters->dispatch_receiver = factory_.create_value_parameter(
        Span{}, DeclOrigin::Builtin, "<this>", -1,
        types_.class_(kclass_, {TypeArg::star()}), std::nullopt, false,
        type_parameters);
    kclass_->functions.push_back(type_parameters);
}

IrClass* Builtins::add_class(std::string_view name) {
    IrClass* c = factory_.create_class(Span{}, DeclOrigin::Builtin,
                                       std::string(name), nullptr);
    if (any_ && c != any_) c->supertypes.push_back(any_type());
    classes_[name] = c;
    return c;
}

IrClass* Builtins::add_generic_class(std::string_view name, Variance variance) {
    IrClass* c = add_class(name);
    c->type_params.push_back(factory_.create_type_parameter(
        Span{}, DeclOrigin::Builtin, name == "Array" ? "T" : "E", 0, variance,
        c));
    return c;
}

TypeId Builtins::array_type(TypeId element) const {
    return types_.simple_class(array_, {element});
}

TypeId Builtins::list_type(TypeId element) const {
    return types_.simple_class(list_, {element});
}

TypeId Builtins::vararg_array_type(TypeId element) const {
    if (const IrClass* c = types_.class_of(element)) {
        if (auto it = primitive_arrays_.find(c); it != primitive_arrays_.end())
            return types_.simple_class(it->second, {});
    }
    return types_.class_(array_, {TypeArg::projection(Variance::Out, element)});
}

IrClass* Builtins::function_class(FunctionClassKind kind, std::uint32_t arity) {
    std::string name =
        std::string(function_class_prefix(kind)) + std::to_string(arity);
    if (auto it = classes_.find(name); it != classes_.end()) return it->second;

    IrClass* c = add_class(name);
    c->functional = FunctionalClassInfo{.kind = kind, .arity = arity};

    std::vector<TypeId> params{};
    for (std::uint32_t i = 0; i < arity; i++) {
        IrTypeParameter* p = factory_.create_type_parameter(
            Span{}, DeclOrigin::Builtin, "P" + std::to_string(i + 1), i,
            Variance::In, c);
        c->type_params.push_back(p);
        params.push_back(types_.type_param(p));
    }
    IrTypeParameter* r = factory_.create_type_parameter(
        Span{}, DeclOrigin::Builtin, "R", arity, Variance::Out, c);
    c->type_params.push_back(r);
    const TypeId ret = types_.type_param(r);

    std::vector<TypeId> all = params;
    all.push_back(ret);
    if (kind == FunctionClassKind::KFunction) {
        c->supertypes.push_back(types_.simple_class(
            function_class(FunctionClassKind::Function, arity), all));
    } else if (kind == FunctionClassKind::KSuspendFunction) {
        c->supertypes.push_back(types_.simple_class(
            function_class(FunctionClassKind::SuspendFunction, arity), all));
    }

    FunctionFlags flags{.is_suspend = is_suspend_kind(kind), .is_operator = true};
    IrFunction* invoke = factory_.create_function(
        Span{}, DeclOrigin::Builtin, IrFunctionKind::Simple, "invoke",
        Visibility::Public, Modality::Abstract, ret, flags, c);
    invoke->dispatch_receiver = factory_.create_value_parameter(
        Span{}, DeclOrigin::Builtin, "<this>", -1, types_.simple_class(c, all),
        std::nullopt, false, invoke);
    for (std::uint32_t i = 0; i < arity; i++) {
        invoke->value_params.push_back(factory_.create_value_parameter(
            Span{}, DeclOrigin::Builtin, "p" + std::to_string(i + 1),
            static_cast<std::int32_t>(i), params[i], std::nullopt, false,
            invoke));
    }
    c->functions.push_back(invoke);
    return c;
}

TypeId Builtins::function_type(FunctionClassKind kind,
                               const std::vector<TypeId>& params, TypeId ret) {
    IrClass* c = function_class(kind, static_cast<std::uint32_t>(params.size()));
    std::vector<TypeId> args = params;
    args.push_back(ret);
    return types_.simple_class(c, std::move(args));
}

const IrClass* Builtins::find_class(std::string_view name) const {
    if (auto it = classes_.find(name); it != classes_.end()) return it->second;
    return nullptr;
}

bool Builtins::is_unit(TypeId t) const {
    const TypeData& d = types_.get(t);
    return d.kind == TypeKind::Class && d.class_def == unit_ && !d.nullable;
}

}  // namespace kir
