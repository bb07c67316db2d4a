#pragma once

#include <string>
#include <cstddef>

class ArchiveIndex;

struct RecoveryReport
{
    size_t StaleSessions = 0;
    size_t RemovedTempFiles = 0;
    size_t RemovedUnindexedFiles = 0;
    size_t Errors = 0;
};

// Marker files under <dest>/.ingest-tmp/ that let an interrupted session be
// detected and its staged files removed by the next run.
namespace SessionRecovery
{
    std::string MarkerPathFor(const std::string& DestinationRoot, const std::string& SessionID);

    bool MarkSessionStarted(const std::string& DestinationRoot, const std::string& SessionID);
    bool MarkSessionFinished(const std::string& DestinationRoot, const std::string& SessionID);

    // Notes an archive file renamed into place but not yet in the index. No-op
    // when the session has no marker.
    bool RecordPublished(const std::string& DestinationRoot, const std::string& SessionID, const std::string& RelativePath);

    // True if the marker names a process that is still running.
    bool IsSessionAlive(const std::string& MarkerPath);

    // Removes temp files and markers left by sessions whose process is gone.
    // With an index, archive files those sessions published but never
    // committed are removed as well.
    RecoveryReport RecoverInterruptedSessions(const std::string& DestinationRoot, const ArchiveIndex* Index = nullptr);
}
