#include "remote/feed.hpp"

#include <string>

#include <gtest/gtest.h>

#include "utils/http.hpp"

using votebridge::data::Tally;

TEST(LastFeedTest, ParsesFieldsByHeader)
{
    auto csv =
        "created_at,entry_id,field1,field2,field3,field4\n"
        "2024-03-01 12:30:05 UTC,42,5,3,2,1\n";
    auto tally = votebridge::remote::parseLastFeed(csv, 4);
    ASSERT_TRUE(tally.has_value());
    EXPECT_EQ(*tally, (Tally {.counts = {5, 3, 2, 1}}));
}

TEST(LastFeedTest, FollowsColumnOrder)
{
    auto csv = "field2,entry_id,field1\r\n7,3,4\r\n";
    auto tally = votebridge::remote::parseLastFeed(csv, 2);
    ASSERT_TRUE(tally.has_value());
    EXPECT_EQ(*tally, (Tally {.counts = {4, 7}}));
}

TEST(LastFeedTest, EmptyCellsAndMissingColumnsCountAsZero)
{
    auto csv = "created_at,entry_id,field1,field2,field3\n2024-03-01,1,,9,\n";
    auto tally = votebridge::remote::parseLastFeed(csv, 4);
    ASSERT_TRUE(tally.has_value());
    EXPECT_EQ(*tally, (Tally {.counts = {0, 9, 0, 0}}));
}

TEST(LastFeedTest, EmptyChannelIsZero)
{
    for (auto csv : {"-1", "", "created_at,entry_id,field1\n"})
    {
        auto tally = votebridge::remote::parseLastFeed(csv, 3);
        ASSERT_TRUE(tally.has_value()) << csv;
        EXPECT_EQ(*tally, Tally::zero(3));
    }
}

TEST(LastFeedTest, RejectsUnexpectedBody)
{
    auto tally = votebridge::remote::parseLastFeed("<html>error</html>", 4);
    ASSERT_FALSE(tally.has_value());
    EXPECT_TRUE(std::holds_alternative<votebridge::errors::SyncUnavailable>(tally.error()));

    tally = votebridge::remote::parseLastFeed("entry_id,field1\n1,abc\n", 4);
    ASSERT_FALSE(tally.has_value());
    EXPECT_TRUE(std::holds_alternative<votebridge::errors::SyncUnavailable>(tally.error()));
}

TEST(UpdateTest, FormatsEveryField)
{
    EXPECT_EQ(votebridge::remote::formatUpdate("KEY1", Tally {.counts = {2, 0, 1, 1}}),
              "api_key=KEY1&field1=2&field2=0&field3=1&field4=1");
    EXPECT_EQ(votebridge::remote::formatUpdate("a b&c", Tally {.counts = {1}}),
              "api_key=a%20b%26c&field1=1");
}

TEST(UpdateTest, ParsesEntryId)
{
    auto entry = votebridge::remote::parseUpdateResponse("17\n");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(*entry, 17U);
}

TEST(UpdateTest, ZeroMeansRejected)
{
    for (auto body : {"0", "", "error"})
    {
        auto entry = votebridge::remote::parseUpdateResponse(body);
        ASSERT_FALSE(entry.has_value()) << body;
        EXPECT_TRUE(std::holds_alternative<votebridge::errors::PushFailed>(entry.error()));
    }
}

TEST(HttpTest, ParsesContentLengthBody)
{
    auto response = votebridge::utils::parseResponse(
        "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 2\r\n\r\n42");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
    EXPECT_EQ(response->body, "42");
}

TEST(HttpTest, ParsesChunkedBody)
{
    auto response = votebridge::utils::parseResponse(
        "HTTP/1.1 200 OK\r\ntransfer-encoding: chunked\r\n\r\n3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->body, "abcde");
}

TEST(HttpTest, ParsesErrorStatus)
{
    auto response =
        votebridge::utils::parseResponse("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 404);
    EXPECT_TRUE(response->body.empty());
}

TEST(HttpTest, RejectsGarbage)
{
    EXPECT_FALSE(votebridge::utils::parseResponse("hello").has_value());
    EXPECT_FALSE(votebridge::utils::parseResponse("SMTP 220\r\n\r\n").has_value());
    EXPECT_FALSE(votebridge::utils::parseResponse(
                     "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort")
                     .has_value());
}

TEST(HttpTest, RejectsTruncatedChunkedBody)
{
    EXPECT_FALSE(votebridge::utils::parseResponse(
                     "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n")
                     .has_value());
}

TEST(HttpTest, CompleteResponseEndsAtContentLength)
{
    using votebridge::utils::isCompleteResponse;
    EXPECT_FALSE(isCompleteResponse("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n"));
    EXPECT_FALSE(isCompleteResponse("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n4"));
    EXPECT_TRUE(isCompleteResponse("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n42"));
    EXPECT_TRUE(isCompleteResponse("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n"));
}

TEST(HttpTest, CompleteResponseEndsAtLastChunk)
{
    using votebridge::utils::isCompleteResponse;
    std::string head = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
    EXPECT_FALSE(isCompleteResponse(head));
    EXPECT_FALSE(isCompleteResponse(head + "3\r\nab"));
    EXPECT_FALSE(isCompleteResponse(head + "3\r\nabc\r\n"));
    EXPECT_TRUE(isCompleteResponse(head + "3\r\nabc\r\n0\r\n\r\n"));
}

TEST(HttpTest, ResponseWithoutLengthEndsAtClose)
{
    EXPECT_FALSE(votebridge::utils::isCompleteResponse("HTTP/1.0 200 OK\r\n\r\nbody"));
    // Nothing more can fix a malformed head, so reading stops.
    EXPECT_TRUE(votebridge::utils::isCompleteResponse("SMTP 220\r\n\r\n"));
}

TEST(HttpTest, EncodesReservedCharacters)
{
    EXPECT_EQ(votebridge::utils::urlEncode("AZaz09-_.~"), "AZaz09-_.~");
    EXPECT_EQ(votebridge::utils::urlEncode("a/b?c=d"), "a%2Fb%3Fc%3Dd");
}
