#include "types/value.hpp"

namespace stencil::types {

auto kind_name(ValueKind kind) -> std::string_view {
    switch (kind) {
    case ValueKind::String:
        return "String";
    case ValueKind::Boolean:
        return "Boolean";
    case ValueKind::Integer:
        return "Integer";
    case ValueKind::CommitOrChangeId:
        return "CommitOrChangeId";
    case ValueKind::ShortestIdPrefix:
        return "ShortestIdPrefix";
    case ValueKind::Signature:
        return "Signature";
    case ValueKind::Timestamp:
        return "Timestamp";
    }
    return "Unknown";
}

} // namespace stencil::types
