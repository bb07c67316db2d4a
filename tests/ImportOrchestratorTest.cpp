#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>

#include "ImportOrchestrator.hpp"
#include "ContentHasher.hpp"
#include "FileCopier.hpp"
#include "TestSupport.hpp"

using namespace TestSupport;

namespace
{
    std::string IdentityOf(const std::string& Data)
    {
        return ContentHasher::HashBuffer(reinterpret_cast<const uint8_t*>(Data.data()), Data.size());
    }

    WorkerLimits TestLimits()
    {
        WorkerLimits Limits;
        Limits.HashWorkers = 4;
        Limits.CopyWorkersLocal = 4;
        Limits.CopyWorkersNetwork = 2;
        Limits.ValidateWorkersLocal = 4;
        Limits.ValidateWorkersNetwork = 2;
        return Limits;
    }

    class ImportOrchestratorTest : public ::testing::Test
    {
    protected:
        TempDir Dir;
        FS::path LocalSource;
        FS::path NetworkShare;
        FS::path NetworkSource;
        FS::path Dest;

        ArchiveIndex Index;
        Deduplicator Dedup{ Index };
        std::shared_ptr<FaultInjectingReader> Reader = std::make_shared<FaultInjectingReader>();
        std::vector<FileCompletionEvent> Events;

        void SetUp() override
        {
            LocalSource = Dir.Sub("src");
            NetworkShare = Dir.Sub("share");
            NetworkSource = Dir.Sub("share/nas/photos");
            Dest = Dir.Sub("dest");
        }

        // Everything under NetworkShare classifies as network, the rest as local
        TransportRules Rules() const
        {
            TransportRules TestRules;
            TestRules.NetworkRoots = { NetworkShare.string() };
            return TestRules;
        }

        std::unique_ptr<ImportOrchestrator> MakeOrchestrator(const WorkerLimits& Limits = TestLimits())
        {
            auto Orchestrator = std::make_unique<ImportOrchestrator>(Limits, Dedup, Rules(), RetryPolicy::NoDelay(3), 64 * 1024, Reader);
            Orchestrator->SetCompletionListener([this](const FileCompletionEvent& Event) { Events.push_back(Event); });
            return Orchestrator;
        }

        ImportRequest RequestFor(const FS::path& Source) const
        {
            ImportRequest Request;
            Request.SourceRoots = { Source.string() };
            Request.DestinationRoot = Dest.string();
            Request.Collection = "holiday";
            return Request;
        }

        const FileDescriptor& FindFile(const ImportSession& Session, const FS::path& Path) const
        {
            auto It = std::find_if(Session.Files.begin(), Session.Files.end(),
                [&Path](const FileDescriptor& File) { return File.SourcePath == Path.string(); });
            EXPECT_NE(It, Session.Files.end()) << Path;
            return *It;
        }
    };
}

TEST_F(ImportOrchestratorTest, LocalRoundTripArchivesVerifiedCopies)
{
    const std::string A = Payload(300000, 1);
    const std::string B = Payload(1024, 2);
    const std::string C = "";
    WriteFile(LocalSource / "a.JPG", A);
    WriteFile(LocalSource / "sub" / "b.png", B);
    WriteFile(LocalSource / "notes", C);

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(LocalSource));

    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Session.Transport, TransportClass::Local);
    EXPECT_EQ(Session.Metrics.FilesScanned, 3u);
    EXPECT_EQ(Session.Metrics.Succeeded, 3u);
    EXPECT_EQ(Session.Metrics.Failed, 0u);
    EXPECT_EQ(Session.Metrics.BytesProcessed, A.size() + B.size());
    EXPECT_EQ(Index.Size(), 3u);
    ASSERT_EQ(Session.IngestedEntries.size(), 3u);

    EXPECT_EQ(ReadFile(Dest / (IdentityOf(A) + ".jpg")), A);
    EXPECT_EQ(ReadFile(Dest / (IdentityOf(B) + ".png")), B);
    EXPECT_TRUE(FS::exists(Dest / IdentityOf(C)));

    ArchiveEntry Entry;
    ASSERT_TRUE(Index.Lookup(IdentityOf(A), Entry));
    EXPECT_EQ(Entry.RelativePath, IdentityOf(A) + ".jpg");
    EXPECT_EQ(Entry.Collection, "holiday");
    EXPECT_EQ(Entry.Size, A.size());
    EXPECT_GT(Entry.IngestedAt, 0);

    EXPECT_FALSE(FS::exists(Dest / FileCopier::TempDirName));
    EXPECT_EQ(Dedup.GetInFlightCount(), 0u);
}

TEST_F(ImportOrchestratorTest, LocalStateHistoryHashesBeforeCopy)
{
    WriteFile(LocalSource / "a.txt", "a");
    ImportSession Session = MakeOrchestrator()->Run(RequestFor(LocalSource));

    std::vector<SessionState> Expected = {
        SessionState::Scanning, SessionState::Classifying, SessionState::Hashing, SessionState::Deduplicating,
        SessionState::Copying, SessionState::Validating, SessionState::Finalizing, SessionState::Complete };
    EXPECT_EQ(Session.StateHistory, Expected);
}

TEST_F(ImportOrchestratorTest, NetworkStateHistorySkipsHashing)
{
    WriteFile(NetworkSource / "a.txt", "a");
    ImportSession Session = MakeOrchestrator()->Run(RequestFor(NetworkSource));

    EXPECT_EQ(Session.Transport, TransportClass::Network);
    std::vector<SessionState> Expected = {
        SessionState::Scanning, SessionState::Classifying, SessionState::Copying, SessionState::Deduplicating,
        SessionState::Validating, SessionState::Finalizing, SessionState::Complete };
    EXPECT_EQ(Session.StateHistory, Expected);
}

TEST_F(ImportOrchestratorTest, DuplicateAndUnreadableFilesGiveFailedPartial)
{
    const std::string Content = Payload(2 * 1024 * 1024, 42);
    WriteFile(LocalSource / "A.jpg", Content);
    WriteFile(LocalSource / "B.jpg", Content);
    WriteFile(LocalSource / "C.jpg", Payload(1000, 43));
    Reader->DenyPath((LocalSource / "C.jpg").string());

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(LocalSource));
    const std::string H1 = IdentityOf(Content);

    EXPECT_EQ(Session.Status, SessionState::FailedPartial);
    EXPECT_EQ(Session.Metrics.Succeeded, 1u);
    EXPECT_EQ(Session.Metrics.Duplicates, 1u);
    EXPECT_EQ(Session.Metrics.Failed, 1u);

    const FileDescriptor& A = FindFile(Session, LocalSource / "A.jpg");
    const FileDescriptor& B = FindFile(Session, LocalSource / "B.jpg");
    const FileDescriptor& C = FindFile(Session, LocalSource / "C.jpg");

    // Whichever of A and B claimed the identity first is the original
    const FileDescriptor& Original = A.GetPhase() == FilePhase::Complete ? A : B;
    const FileDescriptor& Copy = A.GetPhase() == FilePhase::Complete ? B : A;
    EXPECT_EQ(Original.GetPhase(), FilePhase::Complete);
    EXPECT_EQ(Original.Identity, H1);
    EXPECT_EQ(Copy.GetPhase(), FilePhase::Duplicate);
    EXPECT_TRUE(Copy.IsDuplicate);
    EXPECT_EQ(Copy.DuplicateOf, H1 + ".jpg");

    EXPECT_EQ(C.GetPhase(), FilePhase::Failed);
    EXPECT_EQ(C.Error.Code, EACCES);
    EXPECT_NE(C.Error.Reason.find("Permission denied"), std::string::npos);

    EXPECT_EQ(Index.Size(), 1u);
    ArchiveEntry Entry;
    EXPECT_TRUE(Index.Lookup(H1, Entry));
    EXPECT_EQ(ListArchiveFiles(Dest).size(), 1u);

    ASSERT_EQ(Events.size(), 3u);
    size_t Succeeded = std::count_if(Events.begin(), Events.end(), [](const FileCompletionEvent& E) { return E.Outcome == FileOutcome::Succeeded; });
    size_t Duplicates = std::count_if(Events.begin(), Events.end(), [](const FileCompletionEvent& E) { return E.Outcome == FileOutcome::Duplicate; });
    EXPECT_EQ(Succeeded, 1u);
    EXPECT_EQ(Duplicates, 1u);
}

TEST_F(ImportOrchestratorTest, SecondImportReportsDuplicates)
{
    WriteFile(LocalSource / "a.jpg", Payload(5000, 1));
    WriteFile(LocalSource / "b.jpg", Payload(6000, 2));

    auto Orchestrator = MakeOrchestrator();
    ImportSession First = Orchestrator->Run(RequestFor(LocalSource));
    ASSERT_EQ(First.Status, SessionState::Complete);
    ASSERT_EQ(Index.Size(), 2u);

    Events.clear();
    ImportSession Second = Orchestrator->Run(RequestFor(LocalSource));
    EXPECT_EQ(Second.Status, SessionState::Complete);
    EXPECT_EQ(Second.Metrics.Duplicates, 2u);
    EXPECT_EQ(Second.Metrics.Succeeded, 0u);
    EXPECT_EQ(Index.Size(), 2u);
    EXPECT_EQ(ListArchiveFiles(Dest).size(), 2u);
    EXPECT_NE(First.SessionID, Second.SessionID);

    for (const auto& Event : Events)
    {
        EXPECT_EQ(Event.Outcome, FileOutcome::Duplicate);
    }
}

TEST_F(ImportOrchestratorTest, LocalDuplicatesAreNeverCopied)
{
    const std::string Content = Payload(40000, 8);
    WriteFile(LocalSource / "a.jpg", Content);

    auto Orchestrator = MakeOrchestrator();
    ASSERT_EQ(Orchestrator->Run(RequestFor(LocalSource)).Status, SessionState::Complete);

    FS::path Other = Dir.Sub("other");
    WriteFile(Other / "copy.jpg", Content);
    ImportSession Session = Orchestrator->Run(RequestFor(Other));

    const FileDescriptor& Copy = FindFile(Session, Other / "copy.jpg");
    EXPECT_EQ(Copy.GetPhase(), FilePhase::Duplicate);
    EXPECT_EQ(Copy.DuplicateOf, IdentityOf(Content) + ".jpg");
    EXPECT_EQ(Copy.BytesProcessed, 0u);
    EXPECT_TRUE(Copy.ArchivePath.empty());
}

TEST_F(ImportOrchestratorTest, NetworkSourceIsReadExactlyOnce)
{
    std::vector<std::pair<FS::path, std::string>> Files = {
        { NetworkSource / "one.cr2", Payload(700000, 1) },
        { NetworkSource / "two.cr2", Payload(300000, 2) },
        { NetworkSource / "deep" / "three.mov", Payload(1500000, 3) },
    };
    for (const auto& [Path, Data] : Files)
    {
        WriteFile(Path, Data);
    }

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(NetworkSource));

    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Session.Transport, TransportClass::Network);
    EXPECT_EQ(Index.Size(), 3u);
    for (const auto& [Path, Data] : Files)
    {
        EXPECT_EQ(Reader->OpenCount(Path.string()), 1) << Path;
        EXPECT_EQ(Reader->BytesReadFrom(Path.string()), Data.size()) << Path;
        EXPECT_EQ(ReadFile(Dest / (IdentityOf(Data) + Path.extension().string())), Data);
    }
}

TEST_F(ImportOrchestratorTest, NetworkDuplicateStagingIsDeleted)
{
    const std::string Content = Payload(90000, 12);
    WriteFile(NetworkSource / "a.jpg", Content);
    WriteFile(NetworkSource / "b.jpg", Content);

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(NetworkSource));

    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Session.Metrics.Succeeded, 1u);
    EXPECT_EQ(Session.Metrics.Duplicates, 1u);
    EXPECT_EQ(ListArchiveFiles(Dest).size(), 1u);
    EXPECT_FALSE(FS::exists(Dest / FileCopier::TempDirName));
}

TEST_F(ImportOrchestratorTest, NetworkPhasesStayWithinNetworkLimit)
{
    for (int i = 0; i < 12; ++i)
    {
        WriteFile(NetworkSource / ("f" + std::to_string(i) + ".bin"), Payload(20000, 100 + i));
    }
    Reader->TrackConcurrencyUnder(NetworkShare.string(), std::chrono::milliseconds(5));

    WorkerLimits Limits = TestLimits();
    Limits.HashWorkers = 16;
    Limits.CopyWorkersLocal = 16;
    Limits.ValidateWorkersLocal = 16;
    Limits.CopyWorkersNetwork = 2;

    ImportSession Session = MakeOrchestrator(Limits)->Run(RequestFor(NetworkSource));

    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Session.Metrics.Succeeded, 12u);
    EXPECT_GE(Reader->MaxConcurrentTracked(), 1);
    EXPECT_LE(Reader->MaxConcurrentTracked(), 2);
}

TEST_F(ImportOrchestratorTest, LocalSourceIntoNetworkArchiveCopiesWithinNetworkLimit)
{
    for (int i = 0; i < 12; ++i)
    {
        WriteFile(LocalSource / ("f" + std::to_string(i) + ".raw"), Payload(4 * 1024 * 1024, 500 + i));
    }
    FS::path NetworkArchive = Dir.Sub("share/archive");
    Reader->TrackConcurrencyUnder(LocalSource.string(), std::chrono::milliseconds(2));

    WorkerLimits Limits = TestLimits();
    Limits.HashWorkers = 1;
    Limits.CopyWorkersLocal = 16;
    Limits.CopyWorkersNetwork = 2;

    ImportRequest Request = RequestFor(LocalSource);
    Request.DestinationRoot = NetworkArchive.string();
    ImportSession Session = MakeOrchestrator(Limits)->Run(Request);

    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Session.Transport, TransportClass::Local);
    EXPECT_EQ(Session.DestinationTransport, TransportClass::Network);
    EXPECT_EQ(Session.Metrics.Succeeded, 12u);
    EXPECT_GE(Reader->MaxConcurrentTracked(), 1);
    EXPECT_LE(Reader->MaxConcurrentTracked(), 2);
}

TEST_F(ImportOrchestratorTest, ValidationOfNetworkArchiveStaysWithinNetworkLimit)
{
    for (int i = 0; i < 12; ++i)
    {
        WriteFile(LocalSource / ("f" + std::to_string(i) + ".bin"), Payload(20000, 600 + i));
    }
    FS::path NetworkArchive = Dir.Sub("share/archive");
    Reader->TrackConcurrencyUnder(NetworkArchive.string(), std::chrono::milliseconds(5));

    WorkerLimits Limits = TestLimits();
    Limits.ValidateWorkersLocal = 16;
    Limits.ValidateWorkersNetwork = 2;

    ImportRequest Request = RequestFor(LocalSource);
    Request.DestinationRoot = NetworkArchive.string();
    ImportSession Session = MakeOrchestrator(Limits)->Run(Request);

    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Index.Size(), 12u);
    EXPECT_GE(Reader->MaxConcurrentTracked(), 1);
    EXPECT_LE(Reader->MaxConcurrentTracked(), 2);
}

TEST_F(ImportOrchestratorTest, DuplicateTakesOverWhenClaimantCopyFails)
{
    const std::string Content = Payload(200000, 21);
    WriteFile(LocalSource / "a.jpg", Content);
    WriteFile(LocalSource / "b.jpg", Content);

    // A source's first open hashes it, the second copies it. Refuse the first copy only.
    std::atomic<bool> Refused{ false };
    Reader->FailOpenWhen([&Refused](const std::string&, int OpenNumber)
    {
        return OpenNumber == 2 && !Refused.exchange(true) ? EACCES : 0;
    });

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(LocalSource));
    const std::string Identity = IdentityOf(Content);

    EXPECT_EQ(Session.Status, SessionState::FailedPartial);
    EXPECT_EQ(Session.Metrics.Succeeded, 1u);
    EXPECT_EQ(Session.Metrics.Duplicates, 0u);
    EXPECT_EQ(Session.Metrics.Failed, 1u);

    const FileDescriptor& A = FindFile(Session, LocalSource / "a.jpg");
    const FileDescriptor& B = FindFile(Session, LocalSource / "b.jpg");
    const FileDescriptor& Failed = A.GetPhase() == FilePhase::Failed ? A : B;
    const FileDescriptor& Archived = A.GetPhase() == FilePhase::Failed ? B : A;
    EXPECT_EQ(Failed.Error.Code, EACCES);
    EXPECT_EQ(Archived.GetPhase(), FilePhase::Complete);
    EXPECT_FALSE(Archived.IsAwaitingClaim());

    EXPECT_EQ(Index.Size(), 1u);
    EXPECT_EQ(ReadFile(Dest / (Identity + ".jpg")), Content);
    EXPECT_EQ(Session.FailedPaths(), std::vector<std::string>{ Failed.SourcePath });
    EXPECT_EQ(Dedup.GetInFlightCount(), 0u);
    EXPECT_EQ(std::count(Session.StateHistory.begin(), Session.StateHistory.end(), SessionState::Copying), 2);
    EXPECT_EQ(Events.size(), 2u);
}

TEST_F(ImportOrchestratorTest, NetworkDuplicateTakesOverWhenClaimantFailsValidation)
{
    const std::string Content = Payload(150000, 22);
    WriteFile(NetworkSource / "a.jpg", Content);
    WriteFile(NetworkSource / "b.jpg", Content);

    // The first validation read of the shared archive path fails, so the claimant's copy is rejected
    const FS::path ArchivePath = Dest / (IdentityOf(Content) + ".jpg");
    Reader->FailReads(ArchivePath.string(), 1, EACCES);

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(NetworkSource));

    EXPECT_EQ(Session.Status, SessionState::FailedPartial);
    EXPECT_EQ(Session.Metrics.Succeeded, 1u);
    EXPECT_EQ(Session.Metrics.Duplicates, 0u);
    EXPECT_EQ(Session.Metrics.Failed, 1u);
    ASSERT_EQ(Session.GetFailedFiles().size(), 1u);
    EXPECT_EQ(Session.GetFailedFiles()[0].Category, FailureCategory::Integrity);

    EXPECT_EQ(Index.Size(), 1u);
    EXPECT_EQ(ReadFile(ArchivePath), Content);
    EXPECT_FALSE(FS::exists(Dest / FileCopier::TempDirName));

    // The waiting file published the bytes it had already staged
    EXPECT_EQ(Reader->OpenCount((NetworkSource / "a.jpg").string()), 1);
    EXPECT_EQ(Reader->OpenCount((NetworkSource / "b.jpg").string()), 1);
}

TEST_F(ImportOrchestratorTest, TransientNetworkErrorIsRetried)
{
    const std::string Content = Payload(50000, 77);
    WriteFile(NetworkSource / "flaky.jpg", Content);
    Reader->FailReads((NetworkSource / "flaky.jpg").string(), 1, ECONNRESET);

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(NetworkSource));

    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Session.Metrics.Retries, 1u);
    EXPECT_EQ(ReadFile(Dest / (IdentityOf(Content) + ".jpg")), Content);
}

TEST_F(ImportOrchestratorTest, OneFailureDoesNotAffectOtherFiles)
{
    for (int i = 0; i < 5; ++i)
    {
        WriteFile(LocalSource / ("f" + std::to_string(i) + ".dat"), Payload(10000, 200 + i));
    }
    const FS::path Broken = LocalSource / "f3.dat";
    Reader->DenyPath(Broken.string());

    auto Orchestrator = MakeOrchestrator();
    ImportSession Session = Orchestrator->Run(RequestFor(LocalSource));

    EXPECT_EQ(Session.Status, SessionState::FailedPartial);
    EXPECT_EQ(Session.Metrics.Succeeded, 4u);
    EXPECT_EQ(Session.Metrics.Failed, 1u);
    ASSERT_EQ(Session.FailedPaths(), std::vector<std::string>{ Broken.string() });

    std::vector<FailedFile> Failed = Session.GetFailedFiles();
    ASSERT_EQ(Failed.size(), 1u);
    EXPECT_EQ(Failed[0].Category, FailureCategory::Permanent);

    // Retrying just the failed subset once the problem is gone
    Reader = std::make_shared<FaultInjectingReader>();
    ImportRequest Retry = RequestFor(LocalSource);
    Retry.SourceRoots = Session.FailedPaths();
    ImportSession Second = MakeOrchestrator()->Run(Retry);
    EXPECT_EQ(Second.Status, SessionState::Complete);
    EXPECT_EQ(Second.Metrics.Succeeded, 1u);
    EXPECT_EQ(Index.Size(), 5u);
}

TEST_F(ImportOrchestratorTest, NothingSucceedsGivesFailed)
{
    WriteFile(LocalSource / "only.jpg", "x");
    Reader->DenyPath((LocalSource / "only.jpg").string());

    ImportSession Session = MakeOrchestrator()->Run(RequestFor(LocalSource));
    EXPECT_EQ(Session.Status, SessionState::Failed);
    EXPECT_EQ(Index.Size(), 0u);
}

TEST_F(ImportOrchestratorTest, EmptySourceCompletes)
{
    ImportSession Session = MakeOrchestrator()->Run(RequestFor(LocalSource));
    EXPECT_EQ(Session.Status, SessionState::Complete);
    EXPECT_EQ(Session.Metrics.FilesScanned, 0u);
    EXPECT_TRUE(Events.empty());
}

TEST_F(ImportOrchestratorTest, ScanErrorsAreReportedAsFailedFiles)
{
    WriteFile(LocalSource / "a.jpg", "a");
    ImportRequest Request = RequestFor(LocalSource);
    Request.SourceRoots.push_back((Dir.Path() / "missing").string());

    ImportSession Session = MakeOrchestrator()->Run(Request);

    EXPECT_EQ(Session.Status, SessionState::FailedPartial);
    ASSERT_EQ(Session.ScanErrors.size(), 1u);
    EXPECT_EQ(Session.Metrics.FilesScanned, 2u);
    EXPECT_EQ(Session.Metrics.Failed, 1u);
    const FileDescriptor& Missing = FindFile(Session, Dir.Path() / "missing");
    EXPECT_EQ(Missing.Error.Category, FailureCategory::Scan);
}

TEST_F(ImportOrchestratorTest, CancelCleansUpAndReportsCancelled)
{
    for (int i = 0; i < 4; ++i)
    {
        WriteFile(LocalSource / ("f" + std::to_string(i) + ".jpg"), Payload(100000, 300 + i));
    }

    WorkerLimits Limits = TestLimits();
    Limits.HashWorkers = 1;
    auto Orchestrator = MakeOrchestrator(Limits);
    ImportOrchestrator* Raw = Orchestrator.get();
    Reader->OnFirstRead([Raw]() { Raw->Cancel(); });

    ImportSession Session = Orchestrator->Run(RequestFor(LocalSource));

    EXPECT_EQ(Session.Status, SessionState::Cancelled);
    EXPECT_EQ(Session.StateHistory.back(), SessionState::Cancelled);
    EXPECT_EQ(Index.Size(), 0u);
    EXPECT_TRUE(ListArchiveFiles(Dest).empty());
    EXPECT_FALSE(FS::exists(Dest / FileCopier::TempDirName));
    EXPECT_EQ(Dedup.GetInFlightCount(), 0u);

    for (const auto& File : Session.Files)
    {
        EXPECT_EQ(File.GetPhase(), FilePhase::Failed);
        EXPECT_EQ(File.Error.Category, FailureCategory::Cancelled);
    }
}

TEST_F(ImportOrchestratorTest, CancelDuringNetworkCopyRemovesStagedFiles)
{
    for (int i = 0; i < 6; ++i)
    {
        WriteFile(NetworkSource / ("f" + std::to_string(i) + ".jpg"), Payload(100000, 400 + i));
    }

    auto Orchestrator = MakeOrchestrator();
    ImportOrchestrator* Raw = Orchestrator.get();
    Reader->OnFirstRead([Raw]() { Raw->Cancel(); });

    ImportSession Session = Orchestrator->Run(RequestFor(NetworkSource));

    EXPECT_EQ(Session.Status, SessionState::Cancelled);
    EXPECT_EQ(Index.Size(), 0u);
    EXPECT_TRUE(ListArchiveFiles(Dest).empty());
    EXPECT_FALSE(FS::exists(Dest / FileCopier::TempDirName));
}
