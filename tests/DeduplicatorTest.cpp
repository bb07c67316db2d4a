#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "Deduplicator.hpp"

namespace
{
    ArchiveEntry MakeEntry(const std::string& Identity)
    {
        ArchiveEntry Entry;
        Entry.Identity = Identity;
        Entry.RelativePath = Identity + ".png";
        Entry.Collection = "default";
        return Entry;
    }
}

TEST(DeduplicatorTest, FirstClaimIsNewSecondIsInFlightDuplicate)
{
    ArchiveIndex Index;
    Deduplicator Dedup(Index);

    EXPECT_EQ(Dedup.Claim("1111111111111111", "/src/a").Verdict, DedupVerdict::New);

    DedupDecision Second = Dedup.Claim("1111111111111111", "/src/b");
    EXPECT_EQ(Second.Verdict, DedupVerdict::DuplicateInFlight);
    EXPECT_EQ(Second.InFlightSource, "/src/a");
    EXPECT_EQ(Dedup.GetInFlightCount(), 1u);
}

TEST(DeduplicatorTest, CommittedIdentityIsArchiveDuplicate)
{
    ArchiveIndex Index;
    Deduplicator Dedup(Index);

    ASSERT_EQ(Dedup.Claim("2222222222222222", "/src/a").Verdict, DedupVerdict::New);
    EXPECT_EQ(Dedup.Commit(MakeEntry("2222222222222222")), InsertResult::Inserted);
    EXPECT_EQ(Dedup.GetInFlightCount(), 0u);

    DedupDecision Later = Dedup.Claim("2222222222222222", "/src/c");
    EXPECT_EQ(Later.Verdict, DedupVerdict::DuplicateOfArchive);
    EXPECT_EQ(Later.Existing.RelativePath, "2222222222222222.png");
}

TEST(DeduplicatorTest, ReleaseOnlyDropsOwnClaim)
{
    ArchiveIndex Index;
    Deduplicator Dedup(Index);

    ASSERT_EQ(Dedup.Claim("3333333333333333", "/src/a").Verdict, DedupVerdict::New);
    Dedup.Release("3333333333333333", "/src/other");
    EXPECT_EQ(Dedup.GetInFlightCount(), 1u);

    Dedup.Release("3333333333333333", "/src/a");
    EXPECT_EQ(Dedup.GetInFlightCount(), 0u);
    EXPECT_EQ(Dedup.Claim("3333333333333333", "/src/b").Verdict, DedupVerdict::New);
}

TEST(DeduplicatorTest, ConcurrentClaimsHaveExactlyOneWinner)
{
    ArchiveIndex Index;
    Deduplicator Dedup(Index);

    std::atomic<int> Winners{ 0 };
    std::vector<std::thread> Threads;
    for (int i = 0; i < 16; ++i)
    {
        Threads.emplace_back([&Dedup, &Winners, i]()
        {
            if (Dedup.Claim("4444444444444444", "/src/" + std::to_string(i)).Verdict == DedupVerdict::New)
            {
                ++Winners;
            }
        });
    }
    for (auto& Thread : Threads)
    {
        Thread.join();
    }
    EXPECT_EQ(Winners.load(), 1);
}
