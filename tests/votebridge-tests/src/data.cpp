#include "votebridge/data.hpp"

#include <gtest/gtest.h>

using votebridge::data::AuditRecord;
using votebridge::data::Tally;

TEST(TallyTest, ZeroHasOneCountPerCandidate)
{
    auto tally = Tally::zero(4);
    EXPECT_EQ(tally.candidateCount(), 4U);
    EXPECT_EQ(tally.total(), 0U);
    EXPECT_FALSE(tally.contains(0));
    EXPECT_TRUE(tally.contains(1));
    EXPECT_TRUE(tally.contains(4));
    EXPECT_FALSE(tally.contains(5));
}

TEST(TallyTest, IndexesByCandidate)
{
    Tally tally {.counts = {2, 0, 1, 1}};
    EXPECT_EQ(tally[1], 2U);
    EXPECT_EQ(tally[3], 1U);
    EXPECT_EQ(tally.total(), 4U);
}

TEST(ReconcileTest, TakesMaximumPerCandidate)
{
    Tally remote {.counts = {5, 3, 2, 1}};
    Tally local {.counts = {4, 3, 3, 1}};
    auto seed = votebridge::data::reconcile(local, remote);
    EXPECT_EQ(seed, (Tally {.counts = {5, 3, 3, 1}}));
}

TEST(ReconcileTest, IsIdempotent)
{
    Tally remote {.counts = {5, 3, 2, 1}};
    Tally local {.counts = {4, 3, 3, 1}};
    auto once = votebridge::data::reconcile(local, remote);
    EXPECT_EQ(votebridge::data::reconcile(once, remote), once);
    EXPECT_EQ(votebridge::data::reconcile(once, once), once);
    EXPECT_EQ(votebridge::data::reconcile(remote, local), once);
}

TEST(ReconcileTest, TreatsMissingCountsAsZero)
{
    Tally shorter {.counts = {7}};
    Tally longer {.counts = {1, 2, 3}};
    EXPECT_EQ(votebridge::data::reconcile(shorter, longer), (Tally {.counts = {7, 2, 3}}));
}

TEST(ReplayTest, RebuildsCommittedCounts)
{
    auto now = std::chrono::system_clock::now();
    std::vector<AuditRecord> records = {
        {.sequence = 1, .timestamp = now, .candidate = 1, .resultingCount = 1},
        {.sequence = 2, .timestamp = now, .candidate = 3, .resultingCount = 1},
        {.sequence = 3, .timestamp = now, .candidate = 1, .resultingCount = 2},
        {.sequence = 4, .timestamp = now, .candidate = 4, .resultingCount = 1},
    };
    EXPECT_EQ(votebridge::data::replay(records, 4), (Tally {.counts = {2, 0, 1, 1}}));
}

TEST(ReplayTest, KeepsSeededCounts)
{
    // A store seeded with 5 votes for candidate 1 logs the sixth as resulting count 6.
    std::vector<AuditRecord> records = {
        {.sequence = 1,
         .timestamp = std::chrono::system_clock::now(),
         .candidate = 1,
         .resultingCount = 6},
    };
    EXPECT_EQ(votebridge::data::replay(records, 2), (Tally {.counts = {6, 0}}));
}

TEST(ReplayTest, IgnoresUnknownCandidates)
{
    std::vector<AuditRecord> records = {
        {.sequence = 1,
         .timestamp = std::chrono::system_clock::now(),
         .candidate = 9,
         .resultingCount = 1},
    };
    EXPECT_EQ(votebridge::data::replay(records, 2), Tally::zero(2));
}

TEST(CandidateNameTest, FallsBackToNumber)
{
    std::vector<std::string> names = {"Japan", ""};
    EXPECT_EQ(votebridge::data::candidateName(names, 1), "Japan");
    EXPECT_EQ(votebridge::data::candidateName(names, 2), "Candidate 2");
    EXPECT_EQ(votebridge::data::candidateName(names, 3), "Candidate 3");
}
