#include <gtest/gtest.h>

#include "SessionRecovery.hpp"
#include "FileCopier.hpp"
#include "ArchiveIndex.hpp"
#include "ContentHasher.hpp"
#include "TestSupport.hpp"

using namespace TestSupport;

TEST(SessionRecoveryTest, MarkerLifecycle)
{
    TempDir Dir;
    ASSERT_TRUE(SessionRecovery::MarkSessionStarted(Dir.Str(), "20250101_000000-1-0"));

    const std::string Marker = SessionRecovery::MarkerPathFor(Dir.Str(), "20250101_000000-1-0");
    EXPECT_TRUE(FS::exists(Marker));
    EXPECT_TRUE(SessionRecovery::IsSessionAlive(Marker));

    ASSERT_TRUE(SessionRecovery::MarkSessionFinished(Dir.Str(), "20250101_000000-1-0"));
    EXPECT_FALSE(FS::exists(Marker));
    EXPECT_FALSE(FS::exists(Dir.Path() / FileCopier::TempDirName));
}

TEST(SessionRecoveryTest, DeadSessionLeftoversAreRemoved)
{
    TempDir Dir;
    FS::path Staging = Dir.Path() / FileCopier::TempDirName;

    // pid 0 never names a live session
    WriteFile(Staging / "dead-7.session", "pid=0\nstarted=1\n");
    WriteFile(Staging / "dead-7-0.tmp", "partial");
    WriteFile(Staging / "dead-7-1.tmp", "partial");
    WriteFile(Staging / "dead-70-0.tmp", "belongs to another session");

    ASSERT_TRUE(SessionRecovery::MarkSessionStarted(Dir.Str(), "alive-1"));
    WriteFile(Staging / "alive-1-0.tmp", "in progress");

    RecoveryReport Report = SessionRecovery::RecoverInterruptedSessions(Dir.Str());

    EXPECT_EQ(Report.StaleSessions, 1u);
    EXPECT_EQ(Report.RemovedTempFiles, 2u);
    EXPECT_EQ(Report.Errors, 0u);
    EXPECT_FALSE(FS::exists(Staging / "dead-7.session"));
    EXPECT_FALSE(FS::exists(Staging / "dead-7-0.tmp"));
    EXPECT_TRUE(FS::exists(Staging / "dead-70-0.tmp"));
    EXPECT_TRUE(FS::exists(Staging / "alive-1.session"));
    EXPECT_TRUE(FS::exists(Staging / "alive-1-0.tmp"));
}

TEST(SessionRecoveryTest, NoStagingDirectoryIsNothingToDo)
{
    TempDir Dir;
    RecoveryReport Report = SessionRecovery::RecoverInterruptedSessions(Dir.Str());
    EXPECT_EQ(Report.StaleSessions, 0u);
    EXPECT_EQ(Report.RemovedTempFiles, 0u);
}

TEST(SessionRecoveryTest, PublishedFilesAreNotedInTheMarker)
{
    TempDir Dir;
    const std::string Data = Payload(5000, 3);
    WriteFile(Dir.Path() / "src" / "a.JPG", Data);
    FS::path Dest = Dir.Sub("dest");

    ASSERT_TRUE(SessionRecovery::MarkSessionStarted(Dest.string(), "s9"));
    FileCopier Copier(Dest.string(), "s9", MakePosixFileReader(), RetryPolicy::NoDelay(0), 4096);

    FileDescriptor File;
    File.SourcePath = (Dir.Path() / "src" / "a.JPG").string();
    File.Extension = "jpg";
    File.Identity = ContentHasher::HashBuffer(reinterpret_cast<const uint8_t*>(Data.data()), Data.size());
    ASSERT_TRUE(File.AdvanceTo(FilePhase::Hashed));
    ASSERT_TRUE(Copier.CopyLocal(File));

    std::string Marker = ReadFile(SessionRecovery::MarkerPathFor(Dest.string(), "s9"));
    EXPECT_NE(Marker.find("published=" + File.Identity + ".jpg\n"), std::string::npos);
}

TEST(SessionRecoveryTest, UncommittedArchiveFilesOfDeadSessionAreRemoved)
{
    TempDir Dir;
    FS::path Staging = Dir.Path() / FileCopier::TempDirName;

    WriteFile(Staging / "dead-8.session", "pid=0\nstarted=1\npublished=aaaa.jpg\npublished=bbbb.jpg\npublished=cccc\n");
    WriteFile(Dir.Path() / "aaaa.jpg", "renamed, never indexed");
    WriteFile(Dir.Path() / "bbbb.jpg", "indexed");
    WriteFile(Dir.Path() / "cccc", "indexed under another name");

    ArchiveIndex Index;
    ArchiveEntry Committed;
    Committed.Identity = "bbbb";
    Committed.RelativePath = "bbbb.jpg";
    ASSERT_EQ(Index.Insert(Committed), InsertResult::Inserted);
    ArchiveEntry OtherName;
    OtherName.Identity = "cccc";
    OtherName.RelativePath = "cccc.png";
    ASSERT_EQ(Index.Insert(OtherName), InsertResult::Inserted);

    RecoveryReport Report = SessionRecovery::RecoverInterruptedSessions(Dir.Str(), &Index);

    EXPECT_EQ(Report.StaleSessions, 1u);
    EXPECT_EQ(Report.RemovedUnindexedFiles, 2u);
    EXPECT_EQ(Report.Errors, 0u);
    EXPECT_FALSE(FS::exists(Dir.Path() / "aaaa.jpg"));
    EXPECT_TRUE(FS::exists(Dir.Path() / "bbbb.jpg"));
    EXPECT_FALSE(FS::exists(Dir.Path() / "cccc"));
    EXPECT_FALSE(FS::exists(Staging));
}

TEST(SessionRecoveryTest, WithoutIndexPublishedFilesAreKept)
{
    TempDir Dir;
    WriteFile(Dir.Path() / FileCopier::TempDirName / "dead-9.session", "pid=0\npublished=dddd.jpg\n");
    WriteFile(Dir.Path() / "dddd.jpg", "unknown");

    RecoveryReport Report = SessionRecovery::RecoverInterruptedSessions(Dir.Str());

    EXPECT_EQ(Report.StaleSessions, 1u);
    EXPECT_EQ(Report.RemovedUnindexedFiles, 0u);
    EXPECT_TRUE(FS::exists(Dir.Path() / "dddd.jpg"));
}
