#include "ExitCoordinator.hpp"

#include <iostream>
#include <sstream>

int ExitCoordinator::ExitCodeFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::OK:
        return 0;
    case ErrorKind::INVALID_ARGUMENTS:
    case ErrorKind::CONFIG_INVALID:
        return 2;
    case ErrorKind::SOURCE_NOT_FOUND:
        return 3;
    case ErrorKind::CLONE_FAILED:
    case ErrorKind::INSTALL_FAILED:
        return 4;
    case ErrorKind::POST_CLONE_CONFIG_FAILED:
    case ErrorKind::HEALTH_CHECK_FAILED:
    case ErrorKind::SNAPSHOT_FAILED:
        return 5;
    case ErrorKind::SHUTDOWN_TIMEOUT:
    case ErrorKind::START_TIMEOUT:
        return 6;
    case ErrorKind::UNCLASSIFIED:
        return 1;
    }
    return 1;
}

int ExitCoordinator::Finish(const StageResult& result, const std::string& workflow, int ctid) {
    const int exitCode = ExitCodeFor(result.kind);
    if (result.Ok()) {
        std::cout << "[INFO] " << workflow << " completed for CTID " << ctid << std::endl;
    } else {
        std::cerr << "[ERROR] " << workflow << " failed for CTID " << ctid << ": " << FormatDiagnostic(result)
                  << " (exit " << exitCode << ")" << std::endl;
    }
    return exitCode;
}

std::string ExitCoordinator::FormatDiagnostic(const StageResult& result) {
    std::ostringstream out;
    out << ToString(result.kind) << " at stage '" << (result.stage.empty() ? "unknown" : result.stage)
        << "', tool exit code " << result.toolExitCode;
    if (!result.message.empty()) {
        out << ": " << result.message;
    }
    return out.str();
}
