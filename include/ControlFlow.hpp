#pragma once

#include "ConfigParser.hpp"
#include "ImportOrchestrator.hpp"

// Command-line driver: config, recovery, one import session, report.
class ControlFlow
{
public:
    ControlFlow() = default;

    int Run();

    static int ExitCodeFor(SessionState Status);

private:
    ConfigParser Parser;

    void LogSourcesDestExcludes();
    void ReportSession(const ImportSession& Session);
};
