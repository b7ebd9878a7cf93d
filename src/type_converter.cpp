#include "type_converter.hpp"

#include <utility>
#include <vector>

namespace kir {

TypeId DefaultTypeConverter::to_runtime_type(TypeId source) {
    const TypeData& d = types_.get(source);
    switch (d.kind) {
        case TypeKind::Error:
        case TypeKind::TypeParam:
            return source;
        case TypeKind::Intersection: {
            std::vector<TypeId> components = d.components;
            for (TypeId& c : components) c = to_runtime_type(c);
            return types_.intersection(std::move(components));
        }
        case TypeKind::Class:
            break;
    }

    // Copy first: converting arguments may grow the store and invalidate `d`.
    const IrClass* cls = d.class_def;
    const bool nullable = d.nullable;
    std::vector<TypeArg> args = d.args;

    for (TypeArg& a : args) {
        if (auto* s = std::get_if<TypeArg::Simple>(&a.data)) {
            s->type = to_runtime_type(s->type);
        } else if (auto* p = std::get_if<TypeArg::Projection>(&a.data)) {
            p->type = to_runtime_type(p->type);
        }
    }

    if (cls && cls->functional) {
        switch (cls->functional->kind) {
            case FunctionClassKind::KFunction:
                cls = builtins_.function_class(FunctionClassKind::Function,
                                               cls->functional->arity);
                break;
            case FunctionClassKind::KSuspendFunction:
                cls = builtins_.function_class(
                    FunctionClassKind::SuspendFunction, cls->functional->arity);
                break;
            case FunctionClassKind::Function:
            case FunctionClassKind::SuspendFunction:
                break;
        }
    }
    return types_.class_(cls, std::move(args), nullable);
}

}  // namespace kir
