#ifndef CMDTREE_EXIT_CODE_HPP
#define CMDTREE_EXIT_CODE_HPP

namespace cmdtree {

// Conventional process exit codes. Values 64..78 follow BSD sysexits.h.
enum class ExitCode : int {
    Success = 0,
    Error = 1,
    InvalidArguments = 2,
    FileNotFound = 3,
    PermissionDenied = 4,
    NetworkError = 5,
    Cancelled = 6,
    ConfigurationError = 7,
    ResourceUnavailable = 8,

    Usage = 64,
    DataError = 65,
    NoInput = 66,
    NoUser = 67,
    NoHost = 68,
    Unavailable = 69,
    Software = 70,
    OSError = 71,
    OSFile = 72,
    CantCreate = 73,
    IOError = 74,
    TempFail = 75,
    Protocol = 76,
    NoPermission = 77,
    Config = 78,
};

constexpr int toInt(ExitCode code) { return static_cast<int>(code); }

} // namespace cmdtree

#endif // CMDTREE_EXIT_CODE_HPP
