#include "types.hpp"

#include <llvm/ADT/Hashing.h>

#include <sstream>
#include <type_traits>
#include <utility>

#include "ir.hpp"

namespace kir {

std::optional<TypeId> TypeArg::type_or_null() const {
    if (auto* s = std::get_if<Simple>(&data)) return s->type;
    if (auto* p = std::get_if<Projection>(&data)) return p->type;
    return std::nullopt;
}

static llvm::hash_code hash_arg(const TypeArg& a) {
    return std::visit(
        [](const auto& v) -> llvm::hash_code {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, TypeArg::Simple>) {
                return llvm::hash_combine(0, v.type);
            } else if constexpr (std::is_same_v<T, TypeArg::Projection>) {
                return llvm::hash_combine(
                    1, static_cast<std::uint8_t>(v.variance), v.type);
            } else {
                return llvm::hash_value(2);
            }
        },
        a.data);
}

static llvm::hash_code structural_hash(const TypeData& d) {
    llvm::hash_code h = llvm::hash_combine(static_cast<std::uint8_t>(d.kind),
                                           d.nullable, d.class_def,
                                           d.type_param);
    for (const TypeArg& a : d.args) h = llvm::hash_combine(h, hash_arg(a));
    return llvm::hash_combine(
        h, llvm::hash_combine_range(d.components.begin(), d.components.end()));
}

static bool same_arg(const TypeArg& a, const TypeArg& b) {
    if (a.data.index() != b.data.index()) return false;
    if (auto* sa = std::get_if<TypeArg::Simple>(&a.data))
        return sa->type == std::get<TypeArg::Simple>(b.data).type;
    if (auto* pa = std::get_if<TypeArg::Projection>(&a.data)) {
        const auto& pb = std::get<TypeArg::Projection>(b.data);
        return pa->variance == pb.variance && pa->type == pb.type;
    }
    return true;
}

// Shallow: nested types are already interned, so comparing ids suffices.
static bool same_structure(const TypeData& a, const TypeData& b) {
    if (a.kind != b.kind || a.nullable != b.nullable) return false;
    if (a.class_def != b.class_def || a.type_param != b.type_param)
        return false;
    if (a.components != b.components) return false;
    if (a.args.size() != b.args.size()) return false;
    for (size_t i = 0; i < a.args.size(); i++) {
        if (!same_arg(a.args[i], b.args[i])) return false;
    }
    return true;
}

TypeId TypeStore::intern(TypeData d) const {
    const std::size_t h = structural_hash(d);
    std::vector<TypeId>& bucket = interned_[h];
    for (TypeId candidate : bucket) {
        if (same_structure(types_[candidate], d)) return candidate;
    }
    TypeId id = static_cast<TypeId>(types_.size());
    types_.push_back(std::move(d));
    bucket.push_back(id);
    return id;
}

TypeId TypeStore::error() const {
    if (cached_error_) return *cached_error_;
    cached_error_ = intern(TypeData{.kind = TypeKind::Error});
    return *cached_error_;
}

TypeId TypeStore::class_(const IrClass* def, std::vector<TypeArg> args,
                         bool nullable) const {
    TypeData d{.kind = TypeKind::Class, .nullable = nullable, .class_def = def};
    d.args = std::move(args);
    return intern(std::move(d));
}

TypeId TypeStore::simple_class(const IrClass* def,
                               std::vector<TypeId> args) const {
    std::vector<TypeArg> out{};
    out.reserve(args.size());
    for (TypeId a : args) out.push_back(TypeArg::simple(a));
    return class_(def, std::move(out));
}

TypeId TypeStore::type_param(const IrTypeParameter* param,
                             bool nullable) const {
    return intern(TypeData{.kind = TypeKind::TypeParam,
                           .nullable = nullable,
                           .type_param = param});
}

TypeId TypeStore::intersection(std::vector<TypeId> components) const {
    TypeData d{.kind = TypeKind::Intersection};
    d.components = std::move(components);
    return intern(std::move(d));
}

TypeId TypeStore::with_nullability(TypeId t, bool nullable) const {
    const TypeData& d = get(t);
    if (d.nullable == nullable) return t;
    if (d.kind == TypeKind::Error || d.kind == TypeKind::Intersection)
        return t;
    TypeData copy = d;
    copy.nullable = nullable;
    return intern(std::move(copy));
}

const IrClass* TypeStore::class_of(TypeId t) const {
    const TypeData& d = get(t);
    if (d.kind != TypeKind::Class) return nullptr;
    return d.class_def;
}

static void print_arg(std::ostringstream& out, const TypeStore& ts,
                      const TypeArg& a) {
    if (auto* s = std::get_if<TypeArg::Simple>(&a.data)) {
        out << ts.to_string(s->type);
    } else if (auto* p = std::get_if<TypeArg::Projection>(&a.data)) {
        if (p->variance == Variance::In) out << "in ";
        if (p->variance == Variance::Out) out << "out ";
        out << ts.to_string(p->type);
    } else {
        out << "*";
    }
}

std::string TypeStore::to_string(TypeId t) const {
    const TypeData& d = get(t);
    std::ostringstream out;
    switch (d.kind) {
        case TypeKind::Error:
            return "<error>";
        case TypeKind::TypeParam:
            out << (d.type_param ? d.type_param->name : "<T>");
            break;
        case TypeKind::Intersection: {
            out << "{";
            for (size_t i = 0; i < d.components.size(); i++) {
                if (i) out << " & ";
                out << to_string(d.components[i]);
            }
            out << "}";
            return out.str();
        }
        case TypeKind::Class: {
            const IrClass* c = d.class_def;
            // `Function`/`SuspendFunction` print in arrow form.
            if (c && c->functional && !d.args.empty() &&
                (c->functional->kind == FunctionClassKind::Function ||
                 c->functional->kind == FunctionClassKind::SuspendFunction)) {
                if (d.nullable) out << "(";
                if (c->functional->kind == FunctionClassKind::SuspendFunction)
                    out << "suspend ";
                out << "(";
                for (size_t i = 0; i + 1 < d.args.size(); i++) {
                    if (i) out << ", ";
                    print_arg(out, *this, d.args[i]);
                }
                out << ") -> ";
                print_arg(out, *this, d.args.back());
                if (d.nullable) out << ")";
                break;
            }
            out << (c ? c->name : "<class>");
            if (!d.args.empty()) {
                out << "<";
                for (size_t i = 0; i < d.args.size(); i++) {
                    if (i) out << ", ";
                    print_arg(out, *this, d.args[i]);
                }
                out << ">";
            }
            break;
        }
    }
    if (d.nullable) out << "?";
    return out.str();
}

}  // namespace kir
