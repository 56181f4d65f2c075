#pragma once
/**
 * @file coordinator.hpp
 * @brief Executes cutover plans step by step, idempotently, one plan at a time.
 *
 * Every step inspects external state before acting, so re-running a step that
 * already took effect is a no-op. A failing step halts the plan; nothing after
 * it runs. Cancellation is honoured only until the first committing step starts.
 * A plan that halts or is cancelled before then re-enables writes on its
 * source region; after that the source stays blocked until someone releases it.
 *
 * Concurrency model:
 *   - submit() runs the plan on one worker thread; execute() runs it on the caller.
 *   - progress()/current()/cancel() may be called from any thread.
 *   - The progress listener is invoked on the executing thread, outside the
 *     coordinator lock, once per state change.
 */

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "drguard/backend/storage_backend.hpp"
#include "drguard/backend/traffic_router.hpp"
#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"
#include "drguard/cutover/cutover_plan.hpp"
#include "drguard/replication/lag_tracker.hpp"
#include "drguard/workflow/consistency_guard.hpp"

namespace drguard::cutover {

/** @struct CoordinatorConfig
 *  @brief Step bounds.
 */
struct CoordinatorConfig {
    std::uint64_t rpo_bound_ms{drguard::config::constants::RPO_BOUND_MS};
    std::uint64_t accepted_loss_window_ms{drguard::config::constants::ACCEPTED_LOSS_WINDOW_MS}; ///< 0 = none accepted
    std::uint32_t drain_timeout_ms{drguard::config::constants::DRAIN_TIMEOUT_MS};
    std::uint32_t drain_poll_ms{drguard::config::constants::DRAIN_POLL_MS};
    bool          run_inline{false}; ///< submit() executes on the caller (tests, single-threaded tools)
};

class CutoverCoordinator {
public:
    using Clock            = std::function<TimestampMs()>;
    using Sleeper          = std::function<void(std::uint32_t)>;
    using ProgressListener = std::function<void(const CutoverPlan&, const PlanProgress&)>;

    CutoverCoordinator(CoordinatorConfig cfg,
                       backend::StorageBackend& storage,
                       backend::TrafficRouter& router,
                       replication::ReplicationLagTracker& lag,
                       workflow::WorkflowConsistencyGuard& guard,
                       Clock clock = &drguard::now_ms,
                       Sleeper sleeper = {});
    ~CutoverCoordinator();

    CutoverCoordinator(const CutoverCoordinator&)            = delete;
    CutoverCoordinator& operator=(const CutoverCoordinator&) = delete;

    /**
     * @brief Run @p plan to a terminal status on the calling thread.
     * @param resume Progress of a previous attempt of the same plan; succeeded steps are not re-run.
     * @return PlanInProgress if another plan is non-terminal, else the final progress.
     */
    Result<PlanProgress> execute(const CutoverPlan& plan, std::optional<PlanProgress> resume = std::nullopt);

    /// Start @p plan on the worker thread (or inline). PlanInProgress if another plan is non-terminal.
    Result<void> submit(const CutoverPlan& plan, std::optional<PlanProgress> resume = std::nullopt);

    /// Latest progress of the active or a recently finished plan.
    [[nodiscard]] std::optional<PlanProgress> progress(const std::string& plan_id) const;

    /// Progress of the most recently started plan.
    [[nodiscard]] std::optional<PlanProgress> current() const;

    /**
     * @brief Request cancellation of the active plan.
     * @return NoActivePlan if @p plan_id is not running, PlanCommitted once a
     *         committing step has started.
     */
    Result<void> cancel(const std::string& plan_id);

    /**
     * @brief Re-enable writes on the source of a terminal plan that left them blocked.
     * @return PlanInProgress while any plan is running; the router's error otherwise.
     */
    Result<void> release_source_writes(const CutoverPlan& plan);

    void set_progress_listener(ProgressListener listener);

    [[nodiscard]] bool busy() const;

    /// Wait for the worker thread, if any.
    void join();

    [[nodiscard]] const CoordinatorConfig& config() const noexcept { return cfg_; }

private:
    struct Run {
        CutoverPlan  plan;
        PlanProgress progress;
        bool         cancel_requested{false};
        bool         sealed{false}; ///< A committing step started
    };

    Result<void> claim(const CutoverPlan& plan, std::optional<PlanProgress> resume);
    void run();

    Result<std::string> run_step(const CutoverPlan& plan, StepKind kind);
    Result<std::string> stop_writes(const CutoverPlan& plan);
    Result<std::string> drain_replication(const CutoverPlan& plan);
    Result<std::string> promote_storage(const CutoverPlan& plan);
    Result<std::string> redirect_traffic(const CutoverPlan& plan);
    Result<std::string> reconcile_workflows(const CutoverPlan& plan);

    void finish_cancelled(const CutoverPlan& plan);
    Result<void> reopen_writes(RegionId region);

    template <class Fn>
    void update(Fn&& fn);

    bool cancel_requested() const;

private:
    CoordinatorConfig cfg_;
    backend::StorageBackend&            storage_;
    backend::TrafficRouter&             router_;
    replication::ReplicationLagTracker& lag_;
    workflow::WorkflowConsistencyGuard& guard_;
    Clock   clock_;
    Sleeper sleep_;

    mutable std::mutex mu_;
    std::optional<Run> active_;
    std::map<std::string, PlanProgress> history_; ///< Recently finished plans
    std::deque<std::string> history_order_;
    ProgressListener listener_;

    std::mutex  worker_mu_;
    std::thread worker_;
};

} // namespace drguard::cutover
