#pragma once

#include "ProvisionTypes.hpp"

#include <string>

class ExitCoordinator {
public:
    static int ExitCodeFor(ErrorKind kind);

    // Logs the terminal record for a workflow and returns the process exit code.
    static int Finish(const StageResult& result, const std::string& workflow, int ctid);

    static std::string FormatDiagnostic(const StageResult& result);
};
