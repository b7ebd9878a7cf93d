#pragma once

#include "builtins.hpp"
#include "types.hpp"

namespace kir {

// Maps resolved front-end types to the types carried by IR nodes.
class TypeConverter {
   public:
    virtual ~TypeConverter() = default;
    virtual TypeId to_runtime_type(TypeId source) = 0;
};

// Reflective function types (`KFunctionN`, `KSuspendFunctionN`) become the
// plain `FunctionN`/`SuspendFunctionN` they implement; everything else is
// kept, with arguments converted recursively.
class DefaultTypeConverter final : public TypeConverter {
   public:
    DefaultTypeConverter(TypeStore& types, Builtins& builtins)
        : types_(types), builtins_(builtins) {}

    TypeId to_runtime_type(TypeId source) override;

   private:
    TypeStore& types_;
    Builtins& builtins_;
};

}  // namespace kir
