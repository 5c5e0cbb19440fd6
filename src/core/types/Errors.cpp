#include "core/types/Errors.hpp"

namespace rackscan::core {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotFound:
        return "not_found";
    case ErrorCode::AlreadyPromoted:
        return "already_promoted";
    case ErrorCode::InvalidRequest:
        return "invalid_request";
    case ErrorCode::InvalidSubnet:
        return "invalid_subnet";
    case ErrorCode::NetworkNotFound:
        return "network_not_found";
    case ErrorCode::ConstraintViolation:
        return "constraint_violation";
    case ErrorCode::Storage:
        return "storage";
    }
    return "storage";
}

} // namespace rackscan::core
