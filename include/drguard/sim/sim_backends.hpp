#pragma once
/**
 * @file sim_backends.hpp
 * @brief In-memory storage, routing, workflow and alert backends.
 * @details Used by the daemon's dry-run mode and by the tests. Every call is
 *          counted so idempotency can be asserted from the outside. Thread-safe.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "drguard/backend/alert_sink.hpp"
#include "drguard/backend/storage_backend.hpp"
#include "drguard/backend/traffic_router.hpp"
#include "drguard/backend/workflow_engine.hpp"

namespace drguard::sim {

    /**
     * @class SimStorage
     * @brief Replicated stores: writable in the primary region until promoted elsewhere.
     */
    class SimStorage final : public backend::StorageBackend {
    public:
        explicit SimStorage(RegionId writable_region = kPrimaryRegion) : writable_region_(writable_region) {}

        Result<std::uint64_t> current_lag(const std::string& store, RegionId replica) override;
        Result<void> promote_to_writable(RegionId region, const std::string& store) override;
        Result<bool> is_writable(RegionId region, const std::string& store) override;

        void set_lag(const std::string& store, RegionId replica, std::uint64_t lag_ms);
        void set_writable(RegionId region, const std::string& store, bool writable);
        void fail_lag_reads(bool fail);
        void fail_promotion(bool fail);

        /// Promotions that changed state (no-op promotions are not counted).
        [[nodiscard]] std::size_t promotions(RegionId region, const std::string& store) const;
        [[nodiscard]] std::size_t promote_calls() const;

    private:
        using Key = std::pair<RegionId, std::string>;

        RegionId writable_region_;
        mutable std::mutex mu_;
        std::map<Key, std::uint64_t> lag_;
        std::map<Key, bool>          writable_;
        std::map<Key, std::size_t>   promotions_;
        std::size_t promote_calls_{0};
        bool fail_lag_{false};
        bool fail_promotion_{false};
    };

    /**
     * @class SimRouter
     * @brief Active-region pointer, per-region write gate and health-check answers.
     */
    class SimRouter final : public backend::TrafficRouter {
    public:
        explicit SimRouter(RegionId active = kPrimaryRegion) : active_(active) {}

        Result<void> set_active_region(RegionId region) override;
        Result<RegionId> active_region() override;
        Result<bool> health_check_status(RegionId region) override;
        Result<void> block_writes(RegionId region) override;
        Result<void> allow_writes(RegionId region) override;
        Result<bool> writes_blocked(RegionId region) override;

        void set_region_health(RegionId region, bool healthy);
        void fail_redirect(bool fail);

        [[nodiscard]] std::size_t block_calls() const;
        [[nodiscard]] std::size_t allow_calls() const;
        [[nodiscard]] std::size_t redirect_calls() const;
        [[nodiscard]] bool blocked(RegionId region) const;

    private:
        mutable std::mutex mu_;
        RegionId active_;
        std::set<RegionId> blocked_;
        std::map<RegionId, bool> health_;
        std::size_t block_calls_{0};
        std::size_t allow_calls_{0};
        std::size_t redirect_calls_{0};
        bool fail_redirect_{false};
    };

    /**
     * @class SimWorkflowEngine
     * @brief Workflows whose side effects are deduplicated downstream by idempotency token.
     */
    class SimWorkflowEngine final : public backend::WorkflowEngine {
    public:
        Result<std::vector<WorkflowExecutionRecord>> list_in_flight(RegionId region) override;
        Result<void> resume(const std::string& workflow_id, int from_step) override;
        Result<void> abort(const std::string& workflow_id) override;
        backend::SideEffectStatus side_effect_status(const std::string& workflow_id,
                                                     const std::string& token) override;

        /// Register an in-flight workflow.
        void add(WorkflowExecutionRecord rec);
        /// The side effect keyed by @p token reached the downstream system.
        void mark_applied(const std::string& token);
        /// The downstream system cannot tell whether @p token was applied.
        void mark_unknown(const std::string& token);
        void fail_listing(bool fail);
        void fail_resume(const std::string& workflow_id, bool fail);

        /// Times the side effect of @p token was actually applied downstream.
        [[nodiscard]] std::size_t applications(const std::string& token) const;
        [[nodiscard]] std::size_t resume_calls(const std::string& workflow_id) const;
        [[nodiscard]] bool aborted(const std::string& workflow_id) const;
        /// Step the workflow was last resumed from; -1 if never resumed.
        [[nodiscard]] int resumed_from(const std::string& workflow_id) const;

    private:
        mutable std::mutex mu_;
        std::map<std::string, WorkflowExecutionRecord> records_;
        std::set<std::string> applied_;
        std::set<std::string> unknown_;
        std::map<std::string, std::size_t> applications_;
        std::map<std::string, std::size_t> resume_calls_;
        std::map<std::string, int> resumed_from_;
        std::set<std::string> aborted_;
        std::set<std::string> failing_resume_;
        bool fail_listing_{false};
    };

    /**
     * @class RecordingAlertSink
     * @brief Keeps every alert; optionally throws to exercise isolation.
     */
    class RecordingAlertSink final : public backend::AlertSink {
    public:
        struct Entry {
            Severity    severity{Severity::Info};
            std::string message;
        };

        void notify(Severity severity, const std::string& message) override;

        void fail(bool fail);
        [[nodiscard]] std::vector<Entry> entries() const;
        [[nodiscard]] std::size_t count(Severity severity) const;
        /// Alerts of @p severity whose text contains @p needle.
        [[nodiscard]] std::size_t count(Severity severity, const std::string& needle) const;

    private:
        mutable std::mutex mu_;
        std::vector<Entry> entries_;
        bool fail_{false};
    };

} // namespace drguard::sim
