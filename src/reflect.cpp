#include "reflect.hpp"

#include <llvm/ADT/Hashing.h>

#include <type_traits>
#include <utility>

namespace kir {
namespace {

// `KClass<T>.typeParameters` returns `List<KTypeParameter>`; its element class
// is the one describing type parameters at run time.
const IrClass* find_ktype_parameter_class(IrInterpreter& interp) {
    const TypeStore& types = interp.types();
    const IrClass* kclass = interp.builtins().kclass_class();
    const IrFunction* getter =
        kclass ? kclass->find_function("typeParameters") : nullptr;
    if (!getter) {
        interp.session().internal_error(
            Span{}, "`KClass` has no `typeParameters` member");
        return nullptr;
    }
    const TypeData& list = types.get(getter->return_type);
    if (list.kind != TypeKind::Class || list.args.size() != 1) {
        interp.session().internal_error(
            Span{}, "`KClass.typeParameters` is not a list: `" +
                        types.to_string(getter->return_type) + "`");
        return nullptr;
    }
    std::optional<TypeId> element = list.args[0].type_or_null();
    const IrClass* cls = element ? types.class_of(*element) : nullptr;
    if (!cls) {
        interp.session().internal_error(
            Span{}, "`KClass.typeParameters` has no element class");
        return nullptr;
    }
    return cls;
}

}  // namespace

std::optional<Classifier> ReflectedType::classifier(
    IrInterpreter& interp) const {
    if (classifier_) return classifier_;

    const TypeData& d = interp.types().get(type_);
    switch (d.kind) {
        case TypeKind::Class:
            classifier_ = ClassProxy{
                ClassState{d.class_def, interp.builtins().kclass_class()}};
            return classifier_;
        case TypeKind::TypeParam: {
            const IrTypeParameter* param = d.type_param;
            const IrClass* ktype_parameter = find_ktype_parameter_class(interp);
            if (!ktype_parameter) return std::nullopt;
            classifier_ =
                TypeParameterProxy{TypeParameterState{param, ktype_parameter}};
            return classifier_;
        }
        case TypeKind::Error:
        case TypeKind::Intersection:
            break;
    }
    interp.session().internal_error(
        Span{}, "type `" + to_string(interp.types()) + "` has no classifier");
    return std::nullopt;
}

const std::vector<TypeProjection>* ReflectedType::arguments(
    IrInterpreter& interp) const {
    if (arguments_) return &*arguments_;

    const TypeData& d = interp.types().get(type_);
    switch (d.kind) {
        case TypeKind::Class:
            break;
        case TypeKind::TypeParam:
            arguments_.emplace();
            return &*arguments_;
        case TypeKind::Error:
        case TypeKind::Intersection:
            interp.session().internal_error(
                Span{}, "type `" + to_string(interp.types()) +
                            "` has no type arguments");
            return nullptr;
    }

    std::vector<TypeProjection> out{};
    out.reserve(d.args.size());
    for (const TypeArg& arg : d.args) {
        std::visit(
            [&](const auto& a) {
                using T = std::decay_t<decltype(a)>;
                if constexpr (std::is_same_v<T, TypeArg::Simple>) {
                    out.push_back(TypeProjection::invariant(wrap(a.type)));
                } else if constexpr (std::is_same_v<T, TypeArg::Projection>) {
                    switch (a.variance) {
                        case Variance::In:
                            out.push_back(
                                TypeProjection::contravariant(wrap(a.type)));
                            break;
                        case Variance::Out:
                            out.push_back(
                                TypeProjection::covariant(wrap(a.type)));
                            break;
                        case Variance::Invariant:
                            out.push_back(
                                TypeProjection::invariant(wrap(a.type)));
                            break;
                    }
                } else {
                    out.push_back(TypeProjection::star());
                }
            },
            arg.data);
    }
    arguments_ = std::move(out);
    return &*arguments_;
}

std::shared_ptr<const ReflectedType> ReflectedType::wrap(TypeId t) const {
    return std::make_shared<const ReflectedType>(t, reflection_class_);
}

std::size_t ReflectedType::hash() const {
    return static_cast<std::size_t>(llvm::hash_value(type_));
}

std::string ReflectedType::to_string(const TypeStore& types) const {
    return types.to_string(type_);
}

}  // namespace kir
