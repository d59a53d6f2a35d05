#include "votebridge/fs/sqlite.hpp"

#include <spdlog/spdlog.h>

#include "SQLiteCpp/Database.h"
#include "SQLiteCpp/Transaction.h"
#include "votebridge/data.hpp"

namespace votebridge::fs
{
    namespace
    {
        int64_t toMicroseconds(std::chrono::system_clock::time_point timestamp)
        {
            return std::chrono::duration_cast<std::chrono::microseconds>(
                       timestamp.time_since_epoch())
                .count();
        }

        std::chrono::system_clock::time_point fromMicroseconds(int64_t micros)
        {
            return std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::microseconds(micros)));
        }

        class SQLitePersister final : public Persister
        {
          public:
            explicit SQLitePersister(const std::string& path)
                : path_(path)
            {
            }

            tl::expected<void, Error> init()
            {
                try
                {
                    db_ = SQLite::Database(path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
                    // The audit log is the durability anchor, so each commit must reach the disk.
                    db_->exec("PRAGMA journal_mode = WAL;");
                    db_->exec("PRAGMA synchronous = FULL;");
                    db_->exec(
                        "CREATE TABLE IF NOT EXISTS tally_snapshot ("
                        "candidate INTEGER PRIMARY KEY CHECK (candidate >= 1),"
                        "vote_count INTEGER NOT NULL CHECK (vote_count >= 0));");

                    db_->exec(
                        "CREATE TABLE IF NOT EXISTS audit_log ("
                        "sequence INTEGER PRIMARY KEY,"
                        "received_at INTEGER NOT NULL,"
                        "candidate INTEGER NOT NULL,"
                        "resulting_count INTEGER NOT NULL);");
                }
                catch (const SQLite::Exception& e)
                {
                    spdlog::error("[{}] {}", path_, e.what());
                    return tl::make_unexpected(errors::FailedToStart {.message = e.what()});
                }
                return {};
            }

            [[nodiscard]] tl::expected<std::optional<data::Tally>, Error> loadSnapshot()
                const override
            {
                try
                {
                    SQLite::Statement query(*db_,
                                            "SELECT candidate, vote_count FROM tally_snapshot "
                                            "ORDER BY candidate");
                    std::optional<data::Tally> tally;
                    while (query.executeStep())
                    {
                        if (!tally)
                        {
                            tally = data::Tally {};
                        }
                        auto candidate = static_cast<size_t>(query.getColumn(0).getInt64());
                        if (tally->counts.size() < candidate)
                        {
                            tally->counts.resize(candidate, 0);
                        }
                        tally->counts[candidate - 1] =
                            static_cast<uint64_t>(query.getColumn(1).getInt64());
                    }
                    return tally;
                }
                catch (const std::exception& e)
                {
                    spdlog::error("[{}] failed to load snapshot: {}", path_, e.what());
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
            }

            [[nodiscard]] tl::expected<std::vector<data::AuditRecord>, Error> getRecords()
                const override
            {
                try
                {
                    SQLite::Statement query(*db_,
                                            "SELECT sequence, received_at, candidate, "
                                            "resulting_count FROM audit_log ORDER BY sequence");
                    std::vector<data::AuditRecord> records;
                    while (query.executeStep())
                    {
                        records.push_back(data::AuditRecord {
                            .sequence = static_cast<uint64_t>(query.getColumn(0).getInt64()),
                            .timestamp = fromMicroseconds(query.getColumn(1).getInt64()),
                            .candidate =
                                static_cast<data::CandidateId>(query.getColumn(2).getInt64()),
                            .resultingCount = static_cast<uint64_t>(query.getColumn(3).getInt64()),
                        });
                    }
                    return records;
                }
                catch (const std::exception& e)
                {
                    spdlog::error("[{}] failed to read audit log: {}", path_, e.what());
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
            }

            [[nodiscard]] std::optional<uint64_t> getLastSequence() const override
            {
                try
                {
                    SQLite::Statement query(*db_, "SELECT MAX(sequence) FROM audit_log");
                    if (query.executeStep() && !query.getColumn(0).isNull())
                    {
                        return static_cast<uint64_t>(query.getColumn(0).getInt64());
                    }
                }
                catch (const std::exception& e)
                {
                    spdlog::error("[{}] failed to get last sequence: {}", path_, e.what());
                }
                return std::nullopt;
            }

            tl::expected<void, Error> apply(PersistedTransaction const& transaction) override
            {
                try
                {
                    SQLite::Transaction dbTransaction(*db_);

                    if (transaction.record.has_value())
                    {
                        const auto& record = *transaction.record;
                        SQLite::Statement insertRecord(
                            *db_,
                            "INSERT INTO audit_log (sequence, received_at, candidate, "
                            "resulting_count) VALUES (?, ?, ?, ?)");
                        insertRecord.bind(1, static_cast<int64_t>(record.sequence));
                        insertRecord.bind(2, toMicroseconds(record.timestamp));
                        insertRecord.bind(3, static_cast<int64_t>(record.candidate));
                        insertRecord.bind(4, static_cast<int64_t>(record.resultingCount));
                        insertRecord.exec();
                    }

                    if (transaction.updateSnapshot)
                    {
                        // Candidates beyond the new tally are dropped so the snapshot is never
                        // sparse or stale.
                        SQLite::Statement deleteSnapshot(*db_, "DELETE FROM tally_snapshot");
                        deleteSnapshot.exec();

                        data::CandidateId candidate = 1;
                        for (auto count : transaction.snapshot.counts)
                        {
                            SQLite::Statement insertCount(
                                *db_,
                                "INSERT INTO tally_snapshot (candidate, vote_count) VALUES (?, ?)");
                            insertCount.bind(1, static_cast<int64_t>(candidate));
                            insertCount.bind(2, static_cast<int64_t>(count));
                            insertCount.exec();
                            candidate++;
                        }
                    }

                    dbTransaction.commit();
                }
                catch (const std::exception& e)
                {
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
                return {};
            }

          private:
            std::string path_;
            std::optional<SQLite::Database> db_;
        };
    }  // namespace

    tl::expected<std::shared_ptr<Persister>, Error> createSQLitePersister(const std::string& path)
    {
        auto sqlitePersister = std::make_shared<SQLitePersister>(path);
        auto initResult = sqlitePersister->init();
        if (!initResult.has_value())
        {
            return tl::make_unexpected(initResult.error());
        }
        return sqlitePersister;
    }
}  // namespace votebridge::fs
