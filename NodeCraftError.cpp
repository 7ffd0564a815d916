// NodeCraftError.cpp
#include "NodeCraftError.hpp"
#include <fmt/core.h>

namespace NodeCraft {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CycleDetected: return "CycleDetected";
        case ErrorKind::DanglingReference: return "DanglingReference";
        case ErrorKind::TypeIncompatible: return "TypeIncompatible";
        case ErrorKind::UnboundedRecursion: return "UnboundedRecursion";
        case ErrorKind::TypeResolutionError: return "TypeResolutionError";
        case ErrorKind::AmbiguousOverload: return "AmbiguousOverload";
        case ErrorKind::OperationPanic: return "OperationPanic";
        case ErrorKind::UnsupportedBoundaryType: return "UnsupportedBoundaryType";
        case ErrorKind::BackendUnavailable: return "BackendUnavailable";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::MissingInput: return "MissingInput";
    }
    return "Unknown";
}

ErrorCategory errorCategory(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CycleDetected:
        case ErrorKind::DanglingReference:
        case ErrorKind::TypeIncompatible:
        case ErrorKind::UnboundedRecursion:
            return ErrorCategory::Structural;
        case ErrorKind::TypeResolutionError:
        case ErrorKind::AmbiguousOverload:
            return ErrorCategory::Resolution;
        case ErrorKind::MissingInput:
            return ErrorCategory::Internal;
        default:
            return ErrorCategory::Execution;
    }
}

static std::string describe(ErrorKind kind, const std::string& message, const NodePath& node) {
    if (node.empty()) return fmt::format("{}: {}", errorKindName(kind), message);
    return fmt::format("{} at node {}: {}", errorKindName(kind), formatPath(node), message);
}

FlowError::FlowError(ErrorKind kind, std::string message, NodePath node)
    : std::runtime_error(describe(kind, message, node)),
      errorKind(kind),
      message(std::move(message)),
      nodePath(std::move(node)) {}

} // namespace NodeCraft
