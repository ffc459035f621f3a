#include "innerocket/Types.h"
#include <algorithm>
#include <cctype>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// TransferStatus
// ═══════════════════════════════════════════════════════════

const char* transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:        return "pending";
        case TransferStatus::Transferring:   return "transferring";
        case TransferStatus::Verifying:      return "verifying";
        case TransferStatus::Completed:      return "completed";
        case TransferStatus::Failed:         return "failed";
        case TransferStatus::Rejected:       return "rejected";
        case TransferStatus::IntegrityError: return "integrity_error";
        default:                             return "failed";
    }
}

TransferStatus transferStatusFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "pending")         return TransferStatus::Pending;
    if (lower == "transferring")    return TransferStatus::Transferring;
    if (lower == "verifying")       return TransferStatus::Verifying;
    if (lower == "completed")       return TransferStatus::Completed;
    if (lower == "rejected")        return TransferStatus::Rejected;
    if (lower == "integrity_error") return TransferStatus::IntegrityError;
    return TransferStatus::Failed;
}

bool isTerminalStatus(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed:
        case TransferStatus::Failed:
        case TransferStatus::Rejected:
        case TransferStatus::IntegrityError:
            return true;
        default:
            return false;
    }
}

// ═══════════════════════════════════════════════════════════
// TransferDirection
// ═══════════════════════════════════════════════════════════

const char* transferDirectionToString(TransferDirection direction) {
    return direction == TransferDirection::Send ? "send" : "receive";
}

// ═══════════════════════════════════════════════════════════
// TransferErrorKind
// ═══════════════════════════════════════════════════════════

const char* transferErrorKindToString(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::None:      return "none";
        case TransferErrorKind::Transport: return "transport";
        case TransferErrorKind::Protocol:  return "protocol";
        case TransferErrorKind::Integrity: return "integrity";
        case TransferErrorKind::Capacity:  return "capacity";
        case TransferErrorKind::Cancelled: return "cancelled";
        case TransferErrorKind::Timeout:   return "timeout";
        default:                           return "none";
    }
}

// ═══════════════════════════════════════════════════════════
// ConnectionQuality
// ═══════════════════════════════════════════════════════════

const char* connectionQualityToString(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::Slow:   return "slow";
        case ConnectionQuality::Medium: return "medium";
        case ConnectionQuality::Fast:   return "fast";
        default:                        return "medium";
    }
}

} // namespace Innerocket
