#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>

#include "ControlFlow.hpp"
#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "HardwareProfile.hpp"
#include "ArchiveIndex.hpp"
#include "Deduplicator.hpp"
#include "SessionRecovery.hpp"
#include "RetryPolicy.hpp"

namespace
{
    volatile std::sig_atomic_t InterruptRequested = 0;

    void OnInterrupt(int)
    {
        InterruptRequested = 1;
    }

    std::string FormatDouble(double Value, int Precision)
    {
        std::ostringstream Stream;
        Stream << std::fixed << std::setprecision(Precision) << Value;
        return Stream.str();
    }
}

int ControlFlow::ExitCodeFor(SessionState Status)
{
    switch (Status)
    {
    case SessionState::Complete:      return 0;
    case SessionState::Failed:        return 1;
    case SessionState::FailedPartial: return 2;
    case SessionState::Cancelled:     return 130;
    default:                          return 1;
    }
}

int ControlFlow::Run()
{
    bool ConfigOk = Parser.Parse(ConfigGlobal::ConfigFile);

    LogLevel Level;
    if (Logger::LevelFromString(ConfigGlobal::LogLevel, Level))
    {
        Log.SetMinLevel(Level);
    }
    Log.Init(ConfigGlobal::LogDir);
    std::cout << "Starting ArchIngest \n";

    if (!ConfigOk)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error(Error);
        }
        std::cerr << "Check Errors and Fix Them, Exiting Import.\n";
        Log.Error("Check Errors and Fix Them, Exiting Import");
        return 1;
    }
    Log.Info("Config Parsed Successfully.");
    std::cout << "Config Parsed Successfully.\n";

    for (const auto& Info : Parser.GetInfos())
    {
        std::cout << "Config Info: " << Info << "\n";
        Log.Info(Info);
    }

    Log.CleanupOldLogs();
    LogSourcesDestExcludes();

    CapabilityTier Tier = HardwareProfile::ResolveTier(ConfigGlobal::Tier);
    WorkerLimits Limits = HardwareProfile::LimitsFor(Tier);
    std::cout << "Capability Tier: " << TierToString(Tier) << "\n";

    ArchiveIndex Index(ConfigGlobal::IndexFileName.string());
    if (!Index.Load())
    {
        std::cerr << "Failed to load archive index: " << Index.GetFilePath() << "\n";
        Log.Error("Failed to load archive index: " + Index.GetFilePath());
        return 1;
    }
    std::cout << "Archive Index Loaded: " << Index.Size() << " entries\n";

    RecoveryReport Recovery = SessionRecovery::RecoverInterruptedSessions(ConfigGlobal::DestinationPath, &Index);
    if (Recovery.StaleSessions > 0)
    {
        std::cout << "Detected " << Recovery.StaleSessions << " interrupted session(s). Removed " << Recovery.RemovedTempFiles << " staged file(s) and " << Recovery.RemovedUnindexedFiles << " unindexed archive file(s).\n";
        Log.Info("[Recovery] Interrupted sessions: " + std::to_string(Recovery.StaleSessions) +
            " | Staged files removed: " + std::to_string(Recovery.RemovedTempFiles) +
            " | Unindexed files removed: " + std::to_string(Recovery.RemovedUnindexedFiles) +
            " | Errors: " + std::to_string(Recovery.Errors));
    }

    Deduplicator Dedup(Index);
    ImportOrchestrator Orchestrator(Limits, Dedup, TransportRules::FromConfig(), RetryPolicy::FromConfig(), ConfigGlobal::CopyBufferSize);

    Orchestrator.SetCompletionListener([](const FileCompletionEvent& Event)
    {
        std::cout << "[" << FileOutcomeToString(Event.Outcome) << "] " << Event.Path;
        if (!Event.Identity.empty())
        {
            std::cout << " (" << Event.Identity << ")";
        }
        if (!Event.ErrorReason.empty())
        {
            std::cout << " : " << Event.ErrorReason;
        }
        std::cout << "\n";
    });

    ImportRequest Request;
    Request.SourceRoots = Parser.GetSources();
    Request.DestinationRoot = ConfigGlobal::DestinationPath;
    Request.Collection = ConfigGlobal::Collection;
    Request.Excludes = Parser.GetExcludes();

    // Ctrl+C requests a cooperative cancel instead of killing mid-write
    std::signal(SIGINT, OnInterrupt);
    std::atomic<bool> RunFinished{ false };
    std::thread InterruptWatcher([&Orchestrator, &RunFinished]()
    {
        while (!RunFinished)
        {
            if (InterruptRequested)
            {
                std::cout << "Interrupt received, finishing in-flight files and cleaning up...\n";
                Orchestrator.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    Log.Info("Importing...");
    std::cout << "Importing...\n";

    ImportSession Session = Orchestrator.Run(Request);

    RunFinished = true;
    InterruptWatcher.join();
    std::signal(SIGINT, SIG_DFL);

    ReportSession(Session);

    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    return ExitCodeFor(Session.Status);
}

void ControlFlow::LogSourcesDestExcludes()
{
    Log.Info("Sources:");
    for (const auto& Source : Parser.GetSources())
    {
        Log.Info("  " + Source);
    }

    Log.Info("Destination:");
    Log.Info("  " + ConfigGlobal::DestinationPath);
    Log.Info("Collection: " + ConfigGlobal::Collection);

    if (Parser.GetExcludes().size() > 0)
    {
        Log.Info("Excludes:");
        for (const auto& Exclude : Parser.GetExcludes())
        {
            Log.Info("  " + Exclude);
        }
    }
}

void ControlFlow::ReportSession(const ImportSession& Session)
{
    const SessionMetrics& Metrics = Session.Metrics;

    std::vector<std::string> Lines;
    Lines.push_back("Session " + Session.SessionID + " : " + SessionStateToString(Session.Status));
    Lines.push_back("Transport       : " + TransportToString(Session.Transport));
    Lines.push_back("Files Scanned   : " + std::to_string(Metrics.FilesScanned));
    Lines.push_back("Succeeded       : " + std::to_string(Metrics.Succeeded));
    Lines.push_back("Duplicates      : " + std::to_string(Metrics.Duplicates));
    Lines.push_back("Failed          : " + std::to_string(Metrics.Failed));
    Lines.push_back("Retries         : " + std::to_string(Metrics.Retries));
    Lines.push_back("Bytes Processed : " + std::to_string(Metrics.BytesProcessed));
    Lines.push_back("Elapsed         : " + FormatDouble(Metrics.ElapsedSeconds, 2) + " s");
    Lines.push_back("Throughput      : " + FormatDouble(Metrics.ThroughputMBps, 2) + " MB/s");

    for (const auto& Line : Lines)
    {
        std::cout << Line << "\n";
        Log.Info("[Report] " + Line);
    }

    for (const auto& Failed : Session.GetFailedFiles())
    {
        std::string Line = "FAILED " + Failed.Path + " [" + FailureCategoryToString(Failed.Category) + "] " + Failed.Reason;
        std::cerr << Line << "\n";
        Log.Error("[Report] " + Line);
    }
}
