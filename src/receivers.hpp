#pragma once

#include <string>
#include <vector>

#include "ir.hpp"
#include "types.hpp"

namespace kir {

// What stands left of `::` in a callable reference.
enum class ExplicitReceiverKind : std::uint8_t {
    None,               // `::foo`
    ResolvedQualifier,  // `A::foo`, unbound
    Expression,         // `a::foo`, bound
};

// Where a resolved receiver slot of the reference comes from.
enum class ReceiverSource : std::uint8_t {
    None,
    Explicit,  // the explicit receiver expression
    Implicit,  // an implicit `this` in scope
};

// A resolved callable reference as handed over by the front end.
struct CallableReferenceAccess {
    Span span{};
    std::string callee_name{};
    ExplicitReceiverKind explicit_receiver = ExplicitReceiverKind::None;
    std::string qualifier{};  // for ResolvedQualifier, the qualifier text

    ReceiverSource dispatch_receiver = ReceiverSource::None;
    ReceiverSource extension_receiver = ReceiverSource::None;

    // Values of implicit receivers, already converted to IR.
    IrExpression* implicit_dispatch_value = nullptr;
    IrExpression* implicit_extension_value = nullptr;

    std::vector<TypeId> type_args{};

    bool has_static_qualifier() const {
        return explicit_receiver == ExplicitReceiverKind::ResolvedQualifier;
    }
};

// One-line rendering used in internal-error messages.
std::string render(const CallableReferenceAccess& ref);

class ReceiverResolver {
   public:
    virtual ~ReceiverResolver() = default;

    // Returns the IR value bound to the dispatch (`is_dispatch`) or extension
    // receiver slot of `ref`, or nullptr if that slot is absent.
    virtual IrExpression* find_bound_receiver(
        const CallableReferenceAccess& ref, IrExpression* explicit_receiver,
        bool is_dispatch) = 0;
};

class DefaultReceiverResolver final : public ReceiverResolver {
   public:
    IrExpression* find_bound_receiver(const CallableReferenceAccess& ref,
                                      IrExpression* explicit_receiver,
                                      bool is_dispatch) override;
};

}  // namespace kir
