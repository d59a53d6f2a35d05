#pragma once
#include <memory>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "votebridge/errors.hpp"
#include "votebridge/persister.hpp"

namespace votebridge::fs
{
    /// The file name of the database inside the storage directory.
    constexpr std::string_view DATABASE_FILE_NAME = "votebridge.db";

    /// Creates a SQLite-based persister for the tally snapshot and audit log.
    ///
    /// This function initializes a SQLite database at the specified path and creates
    /// the necessary tables. The database will be created if it doesn't exist.
    /// @param path The file path where the SQLite database should be stored.
    /// @return A shared pointer to the persister on success, or an error on failure.
    tl::expected<std::shared_ptr<Persister>, Error> createSQLitePersister(const std::string& path);
}  // namespace votebridge::fs
