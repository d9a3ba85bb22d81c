#ifndef CMDTREE_DIAGNOSTIC_HPP
#define CMDTREE_DIAGNOSTIC_HPP

#include <string>
#include <vector>

namespace cmdtree {

enum class ErrorKind {
    UnknownCommand,
    UnknownAction,
    NoActionSpecified,
    UnknownOption,
    UnexpectedArgument,
    MissingRequiredParameter,
    ConversionFailure,
    ValidationFailure,
    MutualExclusionConflict,
    ExecutionCancelled,
    ExecutionFailed,
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::UnknownCommand: return "UnknownCommand";
        case ErrorKind::UnknownAction: return "UnknownAction";
        case ErrorKind::NoActionSpecified: return "NoActionSpecified";
        case ErrorKind::UnknownOption: return "UnknownOption";
        case ErrorKind::UnexpectedArgument: return "UnexpectedArgument";
        case ErrorKind::MissingRequiredParameter: return "MissingRequiredParameter";
        case ErrorKind::ConversionFailure: return "ConversionFailure";
        case ErrorKind::ValidationFailure: return "ValidationFailure";
        case ErrorKind::MutualExclusionConflict: return "MutualExclusionConflict";
        case ErrorKind::ExecutionCancelled: return "ExecutionCancelled";
        case ErrorKind::ExecutionFailed: return "ExecutionFailed";
    }
    return "ExecutionFailed";
}

// Resolution and binding report failures as values of this type.
struct Diagnostic {
    ErrorKind kind{ErrorKind::ExecutionFailed};
    std::string message;
    std::vector<std::string> suggestions;
    std::string expected;
    std::string found;

    // Resolution and binding failures; these map to the usage exit code.
    [[nodiscard]] bool isUsageError() const {
        return kind != ErrorKind::ExecutionCancelled && kind != ErrorKind::ExecutionFailed;
    }
};

} // namespace cmdtree

#endif // CMDTREE_DIAGNOSTIC_HPP
