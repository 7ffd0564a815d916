// NodeCraft error taxonomy
//
// Every failure the engine reports is a FlowError: a std::runtime_error that
// also carries the kind of failure and the identity path of the node it is
// attributed to, so the editor can surface it at the right place.
#pragma once
#include "NodeCraftTypes.hpp"
#include <stdexcept>
#include <string>

namespace NodeCraft {

enum class ErrorKind {
    // structural
    CycleDetected,
    DanglingReference,
    TypeIncompatible,
    UnboundedRecursion,
    // resolution
    TypeResolutionError,
    AmbiguousOverload,
    // execution
    OperationPanic,
    UnsupportedBoundaryType,
    BackendUnavailable,
    TypeMismatch,
    Cancelled,
    // internal invariant violations
    MissingInput,
};

enum class ErrorCategory { Structural, Resolution, Execution, Internal };

const char* errorKindName(ErrorKind kind);
ErrorCategory errorCategory(ErrorKind kind);

class FlowError : public std::runtime_error {
public:
    FlowError(ErrorKind kind, std::string message, NodePath node = {});

    ErrorKind kind() const { return errorKind; }
    ErrorCategory category() const { return errorCategory(errorKind); }
    // Node the error is attributed to; empty when it concerns the whole graph.
    const NodePath& node() const { return nodePath; }
    const std::string& detail() const { return message; }
    bool isInternal() const { return category() == ErrorCategory::Internal; }

    FlowError withNode(NodePath path) const { return FlowError(errorKind, message, std::move(path)); }

private:
    ErrorKind errorKind;
    std::string message;
    NodePath nodePath;
};

} // namespace NodeCraft
