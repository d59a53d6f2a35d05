#include "votebridge/tally_store.hpp"

#include <thread>

#include <gtest/gtest.h>

#include "mocks/persister.hpp"

using votebridge::data::Tally;
using votebridge::data::VoteEvent;

class TallyStoreTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        persister_ = std::make_shared<votebridge::testing::MemoryPersister>();
        store_ = std::make_unique<votebridge::TallyStore>(persister_, 4);
    }

    static VoteEvent vote(votebridge::data::CandidateId candidate)
    {
        return VoteEvent {.candidate = candidate, .receivedAt = std::chrono::system_clock::now()};
    }

    std::shared_ptr<votebridge::testing::MemoryPersister> persister_;
    std::unique_ptr<votebridge::TallyStore> store_;
};

TEST_F(TallyStoreTest, StartsAtZero)
{
    EXPECT_EQ(store_->currentTally(), Tally::zero(4));
    EXPECT_EQ(store_->candidateCount(), 4U);

    auto snapshot = store_->loadSnapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(*snapshot, Tally::zero(4));
}

TEST_F(TallyStoreTest, AppliesVotes)
{
    ASSERT_TRUE(store_->initialize(Tally::zero(4)).has_value());

    for (votebridge::data::CandidateId candidate : {1U, 3U, 1U, 4U})
    {
        ASSERT_TRUE(store_->apply(vote(candidate)).has_value());
    }
    EXPECT_EQ(store_->currentTally(), (Tally {.counts = {2, 0, 1, 1}}));

    auto records = store_->auditRecords();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 4U);
    EXPECT_EQ(records->at(2).sequence, 3U);
    EXPECT_EQ(records->at(2).candidate, 1U);
    EXPECT_EQ(records->at(2).resultingCount, 2U);
}

TEST_F(TallyStoreTest, ApplyReturnsNewCount)
{
    ASSERT_TRUE(store_->initialize(Tally {.counts = {5, 3, 3, 1}}).has_value());
    auto count = store_->apply(vote(2));
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 4U);
}

TEST_F(TallyStoreTest, ApplyChangesOnlyTheVotedCandidate)
{
    Tally seed {.counts = {5, 3, 3, 1}};
    ASSERT_TRUE(store_->initialize(seed).has_value());
    ASSERT_TRUE(store_->apply(vote(3)).has_value());

    auto tally = store_->currentTally();
    for (votebridge::data::CandidateId candidate = 1; candidate <= 4; ++candidate)
    {
        EXPECT_EQ(tally[candidate], seed[candidate] + (candidate == 3 ? 1 : 0));
    }
}

TEST_F(TallyStoreTest, RejectsInvalidCandidate)
{
    for (votebridge::data::CandidateId candidate : {0U, 5U, 99U})
    {
        auto result = store_->apply(vote(candidate));
        ASSERT_FALSE(result.has_value());
        auto const* error = std::get_if<votebridge::errors::InvalidCandidate>(&result.error());
        ASSERT_NE(error, nullptr);
        EXPECT_EQ(error->candidate, candidate);
        EXPECT_EQ(error->candidateCount, 4U);
    }
    EXPECT_EQ(store_->currentTally(), Tally::zero(4));
    EXPECT_EQ(persister_->applyCalls.load(), 0U);
}

TEST_F(TallyStoreTest, RollsBackWhenPersistenceFails)
{
    ASSERT_TRUE(store_->initialize(Tally {.counts = {1, 1, 1, 1}}).has_value());
    persister_->failWrites = true;

    auto result = store_->apply(vote(2));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<votebridge::errors::PersistenceFailed>(result.error()));
    EXPECT_EQ(store_->currentTally(), (Tally {.counts = {1, 1, 1, 1}}));

    // The failed vote does not consume a sequence number.
    persister_->failWrites = false;
    ASSERT_TRUE(store_->apply(vote(2)).has_value());
    auto records = store_->auditRecords();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1U);
    EXPECT_EQ(records->at(0).sequence, 1U);
    EXPECT_EQ(store_->currentTally(), (Tally {.counts = {1, 2, 1, 1}}));
}

TEST_F(TallyStoreTest, InitializePersistsSeed)
{
    ASSERT_TRUE(store_->initialize(Tally {.counts = {5, 3, 3, 1}}).has_value());
    auto snapshot = persister_->loadSnapshot();
    ASSERT_TRUE(snapshot.has_value() && snapshot->has_value());
    EXPECT_EQ(**snapshot, (Tally {.counts = {5, 3, 3, 1}}));
    EXPECT_EQ(store_->currentTally(), (Tally {.counts = {5, 3, 3, 1}}));
}

TEST_F(TallyStoreTest, InitializeAfterVoteFails)
{
    ASSERT_TRUE(store_->initialize(Tally::zero(4)).has_value());
    ASSERT_TRUE(store_->apply(vote(1)).has_value());

    auto result = store_->initialize(Tally {.counts = {9, 9, 9, 9}});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<votebridge::errors::AlreadyInitialized>(result.error()));
    EXPECT_EQ(store_->currentTally(), (Tally {.counts = {1, 0, 0, 0}}));
}

TEST_F(TallyStoreTest, InitializeRejectsWrongSize)
{
    auto result = store_->initialize(Tally::zero(3));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<votebridge::errors::InvalidArgument>(result.error()));
}

TEST_F(TallyStoreTest, InitializeFailureKeepsMemory)
{
    persister_->failWrites = true;
    auto result = store_->initialize(Tally {.counts = {1, 2, 3, 4}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(store_->currentTally(), Tally::zero(4));
}

TEST_F(TallyStoreTest, LoadSnapshotPadsSmallerSnapshot)
{
    votebridge::PersistedTransaction transaction;
    transaction.setSnapshot(Tally {.counts = {2, 1}});
    ASSERT_TRUE(persister_->apply(transaction).has_value());

    auto snapshot = store_->loadSnapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(*snapshot, (Tally {.counts = {2, 1, 0, 0}}));
}

TEST_F(TallyStoreTest, LoadSnapshotRejectsVotesBeyondCandidates)
{
    votebridge::PersistedTransaction transaction;
    transaction.setSnapshot(Tally {.counts = {1, 1, 1, 1, 0, 2}});
    ASSERT_TRUE(persister_->apply(transaction).has_value());

    auto snapshot = store_->loadSnapshot();
    ASSERT_FALSE(snapshot.has_value());
    EXPECT_TRUE(std::holds_alternative<votebridge::errors::InvalidArgument>(snapshot.error()));
}

TEST_F(TallyStoreTest, ConcurrentVotesAreAllCounted)
{
    ASSERT_TRUE(store_->initialize(Tally::zero(4)).has_value());

    constexpr int VOTES_PER_THREAD = 50;
    std::vector<std::thread> threads;
    for (votebridge::data::CandidateId candidate = 1; candidate <= 4; ++candidate)
    {
        threads.emplace_back(
            [this, candidate]
            {
                for (int i = 0; i < VOTES_PER_THREAD; ++i)
                {
                    EXPECT_TRUE(store_->apply(vote(candidate)).has_value());
                    // Readers never observe a partially applied vote.
                    EXPECT_LE(store_->currentTally().total(), 4U * VOTES_PER_THREAD);
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(store_->currentTally(), (Tally {.counts = {50, 50, 50, 50}}));
    auto records = store_->auditRecords();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 200U);
    for (size_t i = 0; i < records->size(); ++i)
    {
        EXPECT_EQ(records->at(i).sequence, i + 1);
    }
}
