#pragma once
/**
 * @file consistency_guard.hpp
 * @brief Resumes, aborts or flags in-flight workflows after a cutover.
 *
 * The guard keeps a small ledger of workflow progress (step commits and the
 * idempotency token of the in-progress step) and merges it with what the
 * workflow engine reports. For each non-terminal workflow the downstream
 * system is asked whether the in-progress step's side effect happened:
 *
 *   APPLIED      -> resume from the next step
 *   NOT_APPLIED  -> resume from the same step (abort if the workflow is pinned)
 *   UNKNOWN      -> flag for manual reconciliation, never retried
 *
 * A (workflow, step, token) triple is resumed at most once per process.
 * Ledger records survive reconciliation: a resumed workflow stays in the
 * ledger with the resumed step in progress until finish() or an abort.
 *
 * Thread-safety: all member functions lock an internal mutex.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "drguard/backend/workflow_engine.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"

namespace drguard::obs { class AlertDispatcher; }

namespace drguard::workflow {

enum class ReconcileAction : std::uint8_t {
    ResumedNext,   ///< Side effect confirmed; resumed after the in-progress step
    ResumedSame,   ///< Side effect absent (or none); in-progress step retried
    Aborted,       ///< Side effect absent and workflow not resumable
    ManualReview,  ///< Side effect unknown or engine call failed
    Skipped        ///< Already resumed, or awaiting manual resolution
};

struct ReconcileEntry {
    std::string     workflow_id;
    ReconcileAction action{ReconcileAction::Skipped};
    int             from_step{-1}; ///< Step passed to resume(); -1 when not resumed
    std::string     detail;
};

struct ReconcileReport {
    RegionId region{kPrimaryRegion};
    std::vector<ReconcileEntry> entries;

    [[nodiscard]] std::size_t count(ReconcileAction a) const noexcept;
};

/// Operator decision for a workflow flagged for manual review.
enum class ManualResolution : std::uint8_t {
    SideEffectApplied,    ///< Operator confirmed the effect; resume from the next step
    SideEffectNotApplied, ///< Operator confirmed no effect; retry the same step
    Abort
};

class WorkflowConsistencyGuard {
public:
    explicit WorkflowConsistencyGuard(backend::WorkflowEngine& engine,
                                      obs::AlertDispatcher* alerts = nullptr);

    WorkflowConsistencyGuard(const WorkflowConsistencyGuard&)            = delete;
    WorkflowConsistencyGuard& operator=(const WorkflowConsistencyGuard&) = delete;

    // Ledger ----------------------------------------------------------------

    void begin(const std::string& id, RegionId region, bool resumable = true);

    /// Record the token of the step about to run. InvalidArgument for unknown ids.
    Result<void> start_step(const std::string& id, const std::string& token);

    /// Mark @p step committed and clear the in-progress token.
    Result<void> commit_step(const std::string& id, int step);

    /// Drop a workflow that reached a terminal state, with its resume history.
    Result<void> finish(const std::string& id);

    // Reconciliation --------------------------------------------------------

    /**
     * @brief Resolve every non-terminal workflow that was running in @p region.
     * @param resumed_in Region the resumed workflows continue in; ledger records move there.
     * @return BackendFailure only when the in-flight list itself cannot be read;
     *         per-workflow failures are flagged and reconciliation continues.
     */
    Result<ReconcileReport> reconcile(RegionId region, std::optional<RegionId> resumed_in = std::nullopt);

    /// Workflows awaiting manual reconciliation.
    [[nodiscard]] std::vector<WorkflowExecutionRecord> unresolved() const;
    [[nodiscard]] bool has_unresolved() const;

    Result<void> resolve_manually(const std::string& id, ManualResolution resolution);

    [[nodiscard]] std::optional<WorkflowExecutionRecord> record(const std::string& id) const;
    [[nodiscard]] std::vector<WorkflowExecutionRecord> records() const;

private:
    ReconcileEntry resolve_one(const WorkflowExecutionRecord& rec, std::optional<RegionId> resumed_in);
    Result<void> call_resume(const std::string& id, int from_step);
    Result<void> call_abort(const std::string& id);
    void flag(const WorkflowExecutionRecord& rec, const std::string& why);

    static std::string resume_key(int step, const std::string& token);
    bool already_resumed(const std::string& id, int step, const std::string& token) const;
    void note_resumed(const std::string& id, int step, const std::string& token,
                      std::optional<RegionId> resumed_in);
    void drop(const std::string& id);

private:
    backend::WorkflowEngine& engine_;
    obs::AlertDispatcher*    alerts_{nullptr};

    mutable std::mutex mu_;
    std::map<std::string, WorkflowExecutionRecord> ledger_;
    std::map<std::string, WorkflowExecutionRecord> manual_;
    std::map<std::string, std::set<std::string>> resumed_; ///< workflow id -> "step#token" keys
};

std::string_view to_string(ReconcileAction a) noexcept;
std::string_view to_string(ManualResolution r) noexcept;

} // namespace drguard::workflow
