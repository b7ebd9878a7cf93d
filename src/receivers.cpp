#include "receivers.hpp"

namespace kir {

std::string render(const CallableReferenceAccess& ref) {
    std::string out{};
    switch (ref.explicit_receiver) {
        case ExplicitReceiverKind::None:
            break;
        case ExplicitReceiverKind::ResolvedQualifier:
            out += ref.qualifier;
            break;
        case ExplicitReceiverKind::Expression:
            out += "<expr>";
            break;
    }
    out += "::";
    out += ref.callee_name;
    return out;
}

IrExpression* DefaultReceiverResolver::find_bound_receiver(
    const CallableReferenceAccess& ref, IrExpression* explicit_receiver,
    bool is_dispatch) {
    const ReceiverSource source =
        is_dispatch ? ref.dispatch_receiver : ref.extension_receiver;
    switch (source) {
        case ReceiverSource::None:
            return nullptr;
        case ReceiverSource::Explicit:
            return explicit_receiver;
        case ReceiverSource::Implicit:
            return is_dispatch ? ref.implicit_dispatch_value
                               : ref.implicit_extension_value;
    }
    return nullptr;
}

}  // namespace kir
