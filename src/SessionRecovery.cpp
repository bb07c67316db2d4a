#include "SessionRecovery.hpp"
#include "FileCopier.hpp"
#include "ArchiveIndex.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <vector>
#include <mutex>
#include <cerrno>
#include <csignal>
#include <sys/types.h>
#include <unistd.h>

namespace FS = std::filesystem;

namespace
{
    const std::string MarkerExtension = ".session";
    const std::string PublishedKey = "published=";

    std::mutex MarkerAppendMutex;

    std::vector<std::string> ReadMarkerPublished(const std::string& MarkerPath)
    {
        std::vector<std::string> Published;
        std::ifstream ifs(MarkerPath);
        std::string Line;
        while (std::getline(ifs, Line))
        {
            if (Line.rfind(PublishedKey, 0) == 0)
            {
                Published.push_back(Line.substr(PublishedKey.size()));
            }
        }
        return Published;
    }

    // Archive names are "<identity>" or "<identity>.<ext>"
    bool IsCommitted(const ArchiveIndex& Index, const std::string& RelativePath)
    {
        ArchiveEntry Entry;
        const std::string Identity = RelativePath.substr(0, RelativePath.find('.'));
        return Index.Lookup(Identity, Entry) && Entry.RelativePath == RelativePath;
    }

    bool ReadMarkerPid(const std::string& MarkerPath, long& OutPid)
    {
        std::ifstream ifs(MarkerPath);
        if (!ifs.is_open())
        {
            return false;
        }

        std::string Line;
        while (std::getline(ifs, Line))
        {
            if (Line.rfind("pid=", 0) == 0)
            {
                try
                {
                    OutPid = std::stol(Line.substr(4));
                    return true;
                }
                catch (const std::exception&)
                {
                    return false;
                }
            }
        }
        return false;
    }
}

namespace SessionRecovery
{
    std::string MarkerPathFor(const std::string& DestinationRoot, const std::string& SessionID)
    {
        return (FS::path(DestinationRoot) / FileCopier::TempDirName / (SessionID + MarkerExtension)).string();
    }

    bool MarkSessionStarted(const std::string& DestinationRoot, const std::string& SessionID)
    {
        std::error_code ec;
        FS::create_directories(FS::path(DestinationRoot) / FileCopier::TempDirName, ec);
        if (ec)
        {
            Log.Error("[Recovery] Failed to create staging directory under " + DestinationRoot + ": " + ec.message());
            return false;
        }

        std::ofstream ofs(MarkerPathFor(DestinationRoot, SessionID), std::ios::trunc);
        if (!ofs.good())
        {
            Log.Error("[Recovery] Failed to write session marker for " + SessionID);
            return false;
        }
        ofs << "pid=" << static_cast<long>(getpid()) << "\n";
        ofs << "started=" << NowUnixSeconds() << "\n";
        return ofs.good();
    }

    bool MarkSessionFinished(const std::string& DestinationRoot, const std::string& SessionID)
    {
        std::error_code ec;
        FS::remove(MarkerPathFor(DestinationRoot, SessionID), ec);
        if (ec)
        {
            Log.Error("[Recovery] Failed to remove session marker for " + SessionID + ": " + ec.message());
            return false;
        }

        // Leave no empty staging directory behind
        FS::path TempDir = FS::path(DestinationRoot) / FileCopier::TempDirName;
        if (FS::is_empty(TempDir, ec) && !ec)
        {
            FS::remove(TempDir, ec);
        }
        return true;
    }

    bool RecordPublished(const std::string& DestinationRoot, const std::string& SessionID, const std::string& RelativePath)
    {
        const std::string MarkerPath = MarkerPathFor(DestinationRoot, SessionID);
        std::lock_guard<std::mutex> Lock(MarkerAppendMutex);

        std::error_code ec;
        if (!FS::exists(MarkerPath, ec))
        {
            return true;
        }

        std::ofstream ofs(MarkerPath, std::ios::app);
        ofs << PublishedKey << RelativePath << "\n";
        if (!ofs.good())
        {
            Log.Error("[Recovery] Failed to note published file " + RelativePath + " for " + SessionID);
            return false;
        }
        return true;
    }

    bool IsSessionAlive(const std::string& MarkerPath)
    {
        long Pid = 0;
        if (!ReadMarkerPid(MarkerPath, Pid) || Pid <= 0)
        {
            return false;
        }
        if (kill(static_cast<pid_t>(Pid), 0) == 0)
        {
            return true;
        }
        return errno == EPERM;
    }

    RecoveryReport RecoverInterruptedSessions(const std::string& DestinationRoot, const ArchiveIndex* Index)
    {
        RecoveryReport Report;
        FS::path TempDir = FS::path(DestinationRoot) / FileCopier::TempDirName;

        std::error_code ec;
        if (!FS::exists(TempDir, ec))
        {
            return Report;
        }

        std::vector<std::string> StaleSessionIDs;
        for (FS::directory_iterator It(TempDir, ec), End; !ec && It != End; It.increment(ec))
        {
            const FS::path& Entry = It->path();
            if (Entry.extension() != MarkerExtension)
            {
                continue;
            }
            if (IsSessionAlive(Entry.string()))
            {
                Log.Info("[Recovery] Session still running, leaving it alone: " + Entry.stem().string());
                continue;
            }
            StaleSessionIDs.push_back(Entry.stem().string());
        }
        if (ec)
        {
            Log.Error("[Recovery] Failed to list " + TempDir.string() + ": " + ec.message());
            ++Report.Errors;
            return Report;
        }

        for (const auto& SessionID : StaleSessionIDs)
        {
            Log.Info("[Recovery] Cleaning up interrupted session " + SessionID);
            ++Report.StaleSessions;

            const std::string Prefix = SessionID + "-";
            std::vector<FS::path> Leftovers;
            for (FS::directory_iterator It(TempDir, ec), End; !ec && It != End; It.increment(ec))
            {
                const std::string Name = It->path().filename().string();
                if (Name.rfind(Prefix, 0) == 0 && It->path().extension() == ".tmp")
                {
                    Leftovers.push_back(It->path());
                }
            }

            for (const auto& Leftover : Leftovers)
            {
                std::error_code RemoveError;
                if (FS::remove(Leftover, RemoveError))
                {
                    ++Report.RemovedTempFiles;
                    Log.Info("[Recovery] Removed staged file " + Leftover.string());
                }
                else if (RemoveError)
                {
                    ++Report.Errors;
                    Log.Error("[Recovery] Failed to remove " + Leftover.string() + ": " + RemoveError.message());
                }
            }

            if (Index != nullptr)
            {
                for (const auto& RelativePath : ReadMarkerPublished(MarkerPathFor(DestinationRoot, SessionID)))
                {
                    if (RelativePath.empty() || RelativePath.find('/') != std::string::npos || IsCommitted(*Index, RelativePath))
                    {
                        continue;
                    }

                    FS::path Orphan = FS::path(DestinationRoot) / RelativePath;
                    std::error_code RemoveError;
                    if (FS::remove(Orphan, RemoveError))
                    {
                        ++Report.RemovedUnindexedFiles;
                        Log.Info("[Recovery] Removed unindexed archive file " + Orphan.string());
                    }
                    else if (RemoveError)
                    {
                        ++Report.Errors;
                        Log.Error("[Recovery] Failed to remove " + Orphan.string() + ": " + RemoveError.message());
                    }
                }
            }

            if (!MarkSessionFinished(DestinationRoot, SessionID))
            {
                ++Report.Errors;
            }
        }

        return Report;
    }
}
