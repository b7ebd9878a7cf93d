#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kir {

using TypeId = std::uint32_t;

struct IrClass;
struct IrTypeParameter;

enum class Variance : std::uint8_t {
    Invariant,
    In,
    Out,
};

struct SimpleTypeArg {
    TypeId type = 0;
};
struct ProjectedTypeArg {
    Variance variance = Variance::Invariant;
    TypeId type = 0;
};
struct StarTypeArg {};

// A type argument as written: a bare type, a type with an explicit variance
// projection (`in T`, `out T`), or a star projection (`*`).
struct TypeArg {
    using Simple = SimpleTypeArg;
    using Projection = ProjectedTypeArg;
    using Star = StarTypeArg;

    std::variant<Simple, Projection, Star> data{};

    static TypeArg simple(TypeId t) { return TypeArg{Simple{t}}; }
    static TypeArg projection(Variance v, TypeId t) {
        return TypeArg{Projection{v, t}};
    }
    static TypeArg star() { return TypeArg{Star{}}; }

    std::optional<TypeId> type_or_null() const;
};

enum class TypeKind : std::uint8_t {
    Error,
    Class,
    TypeParam,
    Intersection,
};

struct TypeData {
    TypeKind kind = TypeKind::Error;
    bool nullable = false;

    // Class
    const IrClass* class_def = nullptr;
    std::vector<TypeArg> args{};

    // TypeParam
    const IrTypeParameter* type_param = nullptr;

    // Intersection
    std::vector<TypeId> components{};
};

// Types are interned: two structurally equal types always get the same
// TypeId, so `a == b` is structural equality.
class TypeStore {
   public:
    TypeStore() = default;

    TypeId error() const;
    TypeId class_(const IrClass* def, std::vector<TypeArg> args = {},
                  bool nullable = false) const;
    TypeId simple_class(const IrClass* def, std::vector<TypeId> args) const;
    TypeId type_param(const IrTypeParameter* param,
                      bool nullable = false) const;
    TypeId intersection(std::vector<TypeId> components) const;
    TypeId with_nullability(TypeId t, bool nullable) const;

    const TypeData& get(TypeId id) const {
        return types_.at(static_cast<size_t>(id));
    }

    // Class of a class type, nullptr for any other kind.
    const IrClass* class_of(TypeId t) const;

    std::string to_string(TypeId t) const;
    size_t size() const { return types_.size(); }

   private:
    mutable std::vector<TypeData> types_{};
    mutable std::optional<TypeId> cached_error_{};

    // structural hash -> candidate ids
    mutable std::unordered_map<std::size_t, std::vector<TypeId>> interned_{};

    TypeId intern(TypeData d) const;
};

}  // namespace kir
