#pragma once

#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "votebridge/data.hpp"
#include "votebridge/errors.hpp"

namespace votebridge::remote
{
    // Parses the body of a "feeds/last.csv" request: a header row naming the columns
    // (created_at, entry_id, field1, ...) and at most one data row. A channel without entries
    // answers with the header only or with "-1"; both yield the zero tally. Empty cells count
    // as zero.
    tl::expected<data::Tally, Error> parseLastFeed(std::string_view csv, uint32_t candidateCount);

    // Builds the form body of an update request: the API key followed by field1..fieldN.
    std::string formatUpdate(std::string_view apiKey, data::Tally const& tally);

    // Parses the body of an update response, which is the new entry ID. ThingSpeak answers "0"
    // when it rejects the write, usually because the rate floor was not respected.
    tl::expected<uint64_t, Error> parseUpdateResponse(std::string_view body);
}  // namespace votebridge::remote
