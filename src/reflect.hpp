#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "interp.hpp"
#include "ir.hpp"
#include "types.hpp"

namespace kir {

// Interpreter state behind a `KClass` instance.
struct ClassState {
    const IrClass* cls = nullptr;
    const IrClass* kclass = nullptr;
};

// Interpreter state behind a `KTypeParameter` instance.
struct TypeParameterState {
    const IrTypeParameter* param = nullptr;
    const IrClass* ktype_parameter = nullptr;
};

struct ClassProxy {
    ClassState state{};
};

struct TypeParameterProxy {
    TypeParameterState state{};
};

using Classifier = std::variant<ClassProxy, TypeParameterProxy>;

class ReflectedType;

// `KTypeProjection`: either `*` or a type with a variance.
struct TypeProjection {
    enum class Variance : std::uint8_t { Invariant, Contravariant, Covariant };

    struct Star {};
    struct Typed {
        Variance variance = Variance::Invariant;
        std::shared_ptr<const ReflectedType> type{};
    };

    std::variant<Star, Typed> data{};

    static TypeProjection invariant(std::shared_ptr<const ReflectedType> t) {
        return TypeProjection{Typed{Variance::Invariant, std::move(t)}};
    }
    static TypeProjection contravariant(std::shared_ptr<const ReflectedType> t) {
        return TypeProjection{Typed{Variance::Contravariant, std::move(t)}};
    }
    static TypeProjection covariant(std::shared_ptr<const ReflectedType> t) {
        return TypeProjection{Typed{Variance::Covariant, std::move(t)}};
    }
    static TypeProjection star() { return TypeProjection{Star{}}; }

    bool is_star() const { return std::holds_alternative<Star>(data); }
    const Typed* typed() const { return std::get_if<Typed>(&data); }
};

// A `KType` value seen by interpreted code. The classifier and the argument
// list are computed on first request and cached; two proxies are equal iff
// they wrap the same type, whatever their caches hold.
class ReflectedType {
   public:
    explicit ReflectedType(TypeId type, const IrClass* reflection_class)
        : type_(type), reflection_class_(reflection_class) {}

    TypeId type() const { return type_; }
    const IrClass* reflection_class() const { return reflection_class_; }

    // nullopt (after an internal error) for types without a classifier.
    std::optional<Classifier> classifier(IrInterpreter& interp) const;

    // nullptr (after an internal error) for types that take no arguments.
    const std::vector<TypeProjection>* arguments(IrInterpreter& interp) const;

    bool is_classifier_cached() const { return classifier_.has_value(); }
    bool is_arguments_cached() const { return arguments_.has_value(); }

    bool operator==(const ReflectedType& other) const {
        return type_ == other.type_;
    }
    bool operator!=(const ReflectedType& other) const {
        return !(*this == other);
    }

    std::size_t hash() const;
    std::string to_string(const TypeStore& types) const;

   private:
    TypeId type_ = 0;
    const IrClass* reflection_class_ = nullptr;

    mutable std::optional<Classifier> classifier_{};
    mutable std::optional<std::vector<TypeProjection>> arguments_{};

    std::shared_ptr<const ReflectedType> wrap(TypeId t) const;
};

}  // namespace kir

namespace std {
template <>
struct hash<kir::ReflectedType> {
    size_t operator()(const kir::ReflectedType& t) const { return t.hash(); }
};
}  // namespace std
