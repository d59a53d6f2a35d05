#pragma once
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <fmt/format.h>

#include "config/config.hpp"
#include "serve.hpp"
#include "votebridge/data.hpp"
#include "votebridge/report.hpp"

namespace votebridge_cli
{
    namespace detail
    {
        // Opens the store of an existing storage directory without creating one.
        inline tl::expected<std::shared_ptr<votebridge::TallyStore>, Error> openExistingStore(
            config::Tally const& tally)
        {
            auto path =
                std::filesystem::path(tally.storagePath) / votebridge::fs::DATABASE_FILE_NAME;
            if (!std::filesystem::exists(path))
            {
                return tl::unexpected(errors::Unknown {
                    .message = fmt::format("no tally database at {}", path.string())});
            }
            return openStore(tally);
        }
    }  // namespace detail

    // Prints the persisted snapshot and checks it against the audit log.
    inline int status(std::string const& configPath)
    {
        auto config = config::loadConfig(configPath);
        if (!config)
        {
            std::cerr << fmt::format("{}\n", config.error());
            return 1;
        }

        auto store = detail::openExistingStore(config->tally);
        if (!store)
        {
            std::cerr << fmt::format("{}\n", store.error());
            return 1;
        }

        auto snapshot = (*store)->loadSnapshot();
        if (!snapshot)
        {
            std::cerr << fmt::format("Failed to read snapshot: {}\n", snapshot.error());
            return 1;
        }
        for (auto const& row : votebridge::report::formatTally(*snapshot, config->tally.candidates))
        {
            std::cout << row << '\n';
        }

        auto records = (*store)->auditRecords();
        if (!records)
        {
            std::cerr << fmt::format("Failed to read audit log: {}\n", records.error());
            return 1;
        }
        std::cout << fmt::format("{} audit records\n", records->size());

        // Seeded votes (from the remote) have no audit record, so the log may trail the snapshot
        // but never exceed it.
        auto replayed = votebridge::data::replay(*records, config->tally.candidateCount);
        for (uint32_t candidate = 1; candidate <= snapshot->candidateCount(); ++candidate)
        {
            if (replayed[candidate] > (*snapshot)[candidate])
            {
                std::cerr << fmt::format(
                    "audit log holds {} votes for {} but the snapshot only {}\n",
                    replayed[candidate],
                    votebridge::data::candidateName(config->tally.candidates, candidate),
                    (*snapshot)[candidate]);
                return 1;
            }
        }
        return 0;
    }

    // Writes the audit log as CSV.
    inline int exportAudit(std::string const& configPath, std::string const& outputPath)
    {
        auto config = config::loadConfig(configPath);
        if (!config)
        {
            std::cerr << fmt::format("{}\n", config.error());
            return 1;
        }

        auto store = detail::openExistingStore(config->tally);
        if (!store)
        {
            std::cerr << fmt::format("{}\n", store.error());
            return 1;
        }

        auto records = (*store)->auditRecords();
        if (!records)
        {
            std::cerr << fmt::format("Failed to read audit log: {}\n", records.error());
            return 1;
        }

        std::ofstream out(outputPath, std::ios::trunc);
        if (!out)
        {
            std::cerr << fmt::format("Failed to open {} for writing\n", outputPath);
            return 1;
        }
        out << votebridge::report::AUDIT_CSV_HEADER << '\n';
        for (auto const& record : *records)
        {
            out << votebridge::report::formatAuditRow(record, config->tally.candidates) << '\n';
        }
        out.flush();
        if (!out)
        {
            std::cerr << fmt::format("Failed to write {}\n", outputPath);
            return 1;
        }

        std::cout << fmt::format("Exported {} records to {}\n", records->size(), outputPath);
        return 0;
    }
}  // namespace votebridge_cli
