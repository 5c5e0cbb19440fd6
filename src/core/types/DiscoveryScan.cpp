#include "core/types/DiscoveryScan.hpp"

#include "core/types/Errors.hpp"

namespace rackscan::core {

std::string scanTypeToString(ScanType type) {
    switch (type) {
    case ScanType::Quick:
        return "quick";
    case ScanType::Full:
        return "full";
    case ScanType::Deep:
        return "deep";
    }
    return "full";
}

ScanType scanTypeFromString(const std::string& str) {
    if (str == "quick")
        return ScanType::Quick;
    if (str == "deep")
        return ScanType::Deep;
    return ScanType::Full;
}

void DiscoveryScan::advanceTo(ScanStatus next) {
    if (next == status) {
        return;
    }

    bool allowed = false;
    switch (status) {
    case ScanStatus::Pending:
        allowed = next == ScanStatus::Running || next == ScanStatus::Failed;
        break;
    case ScanStatus::Running:
        allowed = next == ScanStatus::Completed || next == ScanStatus::Failed;
        break;
    case ScanStatus::Completed:
    case ScanStatus::Failed:
        allowed = false;
        break;
    }

    if (!allowed) {
        throw DiscoveryError(ErrorCode::InvalidRequest,
                             "invalid scan status transition: " + scanStatusToString(status) +
                                 " -> " + scanStatusToString(next));
    }
    status = next;
}

std::string DiscoveryScan::statusToString() const {
    return scanStatusToString(status);
}

std::string DiscoveryScan::scanStatusToString(ScanStatus status) {
    switch (status) {
    case ScanStatus::Pending:
        return "pending";
    case ScanStatus::Running:
        return "running";
    case ScanStatus::Completed:
        return "completed";
    case ScanStatus::Failed:
        return "failed";
    }
    return "pending";
}

ScanStatus DiscoveryScan::statusFromString(const std::string& str) {
    if (str == "running")
        return ScanStatus::Running;
    if (str == "completed")
        return ScanStatus::Completed;
    if (str == "failed")
        return ScanStatus::Failed;
    return ScanStatus::Pending;
}

} // namespace rackscan::core
