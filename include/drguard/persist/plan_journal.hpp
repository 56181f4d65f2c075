#pragma once
/**
 * @file plan_journal.hpp
 * @brief Append-only audit trail of cutover plans and their outcomes (JSON lines).
 */

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/cutover/cutover_plan.hpp"

namespace drguard::persist {

struct JournalEntry {
    TimestampMs           recorded_ms{0};
    cutover::CutoverPlan  plan;
    cutover::PlanProgress progress;
};

class PlanJournal {
public:
    explicit PlanJournal(std::filesystem::path path,
                         std::uint64_t retention_ms = drguard::config::constants::PLAN_RETENTION_MS);

    /// Append one record. Each terminal plan is recorded once by the engine.
    Result<void> append(const cutover::CutoverPlan& plan, const cutover::PlanProgress& progress,
                        TimestampMs now);

    /// All entries, oldest first. Unparsable lines are skipped with a warning.
    Result<std::vector<JournalEntry>> entries() const;

    /**
     * @brief Rewrite the journal without entries older than the retention window.
     *
     * Lines that cannot be parsed are kept byte for byte.
     * @return Number of entries removed.
     */
    Result<std::size_t> prune(TimestampMs now);

private:
    std::filesystem::path path_;
    std::uint64_t retention_ms_;
    mutable std::mutex mu_;
};

} // namespace drguard::persist
