#include "votebridge/synchronizer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks/remote.hpp"

using ::testing::_;
using ::testing::Return;
using votebridge::PushOutcome;
using votebridge::data::Tally;

class SynchronizerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        endpoint_ = std::make_shared<StrictEndpoint>();
        synchronizer_ = std::make_unique<votebridge::Synchronizer>(
            endpoint_,
            votebridge::SynchronizerConfig {.candidateCount = 4,
                                            .minPushInterval = std::chrono::seconds(15)});
    }

    using StrictEndpoint = ::testing::StrictMock<votebridge::testing::MockRemoteEndpoint>;

    std::shared_ptr<StrictEndpoint> endpoint_;
    std::unique_ptr<votebridge::Synchronizer> synchronizer_;
    std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
};

TEST_F(SynchronizerTest, PullInitialReturnsRemoteTally)
{
    EXPECT_CALL(*endpoint_, readLatest(4)).WillOnce(Return(Tally {.counts = {5, 3, 2, 1}}));

    auto pulled = synchronizer_->pullInitial();
    EXPECT_TRUE(pulled.available());
    EXPECT_EQ(pulled.tally, (Tally {.counts = {5, 3, 2, 1}}));
    EXPECT_EQ(synchronizer_->state().lastPushedTally, (Tally {.counts = {5, 3, 2, 1}}));
}

TEST_F(SynchronizerTest, PullInitialFailureYieldsZeroTally)
{
    EXPECT_CALL(*endpoint_, readLatest(4))
        .WillOnce(Return(tl::make_unexpected(votebridge::errors::Timeout {})));

    auto pulled = synchronizer_->pullInitial();
    EXPECT_FALSE(pulled.available());
    EXPECT_EQ(pulled.tally, Tally::zero(4));
    ASSERT_TRUE(pulled.error.has_value());
    EXPECT_TRUE(std::holds_alternative<votebridge::errors::SyncUnavailable>(*pulled.error));
    EXPECT_EQ(synchronizer_->state().lastPushedTally, Tally::zero(4));
}

TEST_F(SynchronizerTest, PullInitialRejectsWrongSize)
{
    EXPECT_CALL(*endpoint_, readLatest(4)).WillOnce(Return(Tally {.counts = {1, 2}}));

    auto pulled = synchronizer_->pullInitial();
    EXPECT_FALSE(pulled.available());
    EXPECT_EQ(pulled.tally, Tally::zero(4));
}

TEST_F(SynchronizerTest, PushesChangedTally)
{
    Tally tally {.counts = {2, 0, 1, 1}};
    EXPECT_CALL(*endpoint_, write(tally)).WillOnce(Return(uint64_t {1}));

    EXPECT_EQ(synchronizer_->maybePush(tally, start_), PushOutcome::Pushed);
    auto state = synchronizer_->state();
    EXPECT_EQ(state.lastPushedTally, tally);
    EXPECT_EQ(state.lastPushTime, start_);
    EXPECT_TRUE(state.lastPushSucceeded);
}

TEST_F(SynchronizerTest, RateFloorSkipsSecondPush)
{
    Tally first {.counts = {1, 0, 0, 0}};
    Tally second {.counts = {2, 0, 0, 0}};
    EXPECT_CALL(*endpoint_, write(first)).WillOnce(Return(uint64_t {1}));

    EXPECT_EQ(synchronizer_->maybePush(first, start_), PushOutcome::Pushed);
    EXPECT_EQ(synchronizer_->maybePush(second, start_ + std::chrono::seconds(14)),
              PushOutcome::Skipped);
    EXPECT_EQ(synchronizer_->state().lastPushedTally, first);
}

TEST_F(SynchronizerTest, PushesAgainAfterInterval)
{
    Tally first {.counts = {1, 0, 0, 0}};
    Tally second {.counts = {2, 0, 0, 0}};
    EXPECT_CALL(*endpoint_, write(first)).WillOnce(Return(uint64_t {1}));
    EXPECT_CALL(*endpoint_, write(second)).WillOnce(Return(uint64_t {2}));

    EXPECT_EQ(synchronizer_->maybePush(first, start_), PushOutcome::Pushed);
    EXPECT_EQ(synchronizer_->maybePush(second, start_ + std::chrono::seconds(15)),
              PushOutcome::Pushed);
}

TEST_F(SynchronizerTest, RedundantPushIsSkipped)
{
    Tally tally {.counts = {1, 0, 0, 0}};
    EXPECT_CALL(*endpoint_, write(tally)).WillOnce(Return(uint64_t {1}));

    EXPECT_EQ(synchronizer_->maybePush(tally, start_), PushOutcome::Pushed);
    EXPECT_EQ(synchronizer_->maybePush(tally, start_ + std::chrono::hours(1)),
              PushOutcome::Skipped);
}

TEST_F(SynchronizerTest, ZeroTallyIsNotPushedBeforeAnyVote)
{
    EXPECT_EQ(synchronizer_->maybePush(Tally::zero(4), start_), PushOutcome::Skipped);
}

TEST_F(SynchronizerTest, PulledTallyIsNotPushedBack)
{
    Tally remote {.counts = {5, 3, 2, 1}};
    EXPECT_CALL(*endpoint_, readLatest(4)).WillOnce(Return(remote));

    synchronizer_->pullInitial();
    EXPECT_EQ(synchronizer_->maybePush(remote, start_), PushOutcome::Skipped);
}

TEST_F(SynchronizerTest, FailedPushIsRetriedWithoutWaiting)
{
    Tally tally {.counts = {1, 0, 0, 0}};
    EXPECT_CALL(*endpoint_, write(tally))
        .WillOnce(Return(tl::make_unexpected(votebridge::errors::PushFailed {.message = "503"})))
        .WillOnce(Return(uint64_t {7}));

    EXPECT_EQ(synchronizer_->maybePush(tally, start_), PushOutcome::Failed);
    auto state = synchronizer_->state();
    EXPECT_FALSE(state.lastPushSucceeded);
    EXPECT_FALSE(state.lastPushTime.has_value());
    EXPECT_EQ(state.lastPushedTally, Tally::zero(4));

    EXPECT_EQ(synchronizer_->maybePush(tally, start_ + std::chrono::seconds(1)),
              PushOutcome::Pushed);
    EXPECT_TRUE(synchronizer_->state().lastPushSucceeded);
}

TEST_F(SynchronizerTest, FailureKeepsRateFloorOfLastSuccess)
{
    Tally first {.counts = {1, 0, 0, 0}};
    Tally second {.counts = {2, 0, 0, 0}};
    EXPECT_CALL(*endpoint_, write(first)).WillOnce(Return(uint64_t {1}));
    EXPECT_CALL(*endpoint_, write(second))
        .WillOnce(Return(tl::make_unexpected(votebridge::errors::PushFailed {.message = "0"})));

    EXPECT_EQ(synchronizer_->maybePush(first, start_), PushOutcome::Pushed);
    EXPECT_EQ(synchronizer_->maybePush(second, start_ + std::chrono::seconds(20)),
              PushOutcome::Failed);
    EXPECT_EQ(synchronizer_->state().lastPushTime, start_);
}
