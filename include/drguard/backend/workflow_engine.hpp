#pragma once
/**
 * @file workflow_engine.hpp
 * @brief Capability interface to the workflow execution engine that runs business steps.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"

namespace drguard::backend {

    /**
     * @enum SideEffectStatus
     * @brief What the downstream system knows about a step keyed by its idempotency token.
     */
    enum class SideEffectStatus : std::uint8_t {
        Applied,     ///< Side effect confirmed applied
        NotApplied,  ///< Side effect confirmed absent
        Unknown      ///< Cannot be determined; never guessed at automatically
    };

    class WorkflowEngine {
    public:
        virtual ~WorkflowEngine() = default;

        /// Non-terminal executions that were running in @p region.
        virtual Result<std::vector<WorkflowExecutionRecord>> list_in_flight(RegionId region) = 0;

        /// Continue @p workflow_id starting at step index @p from_step.
        virtual Result<void> resume(const std::string& workflow_id, int from_step) = 0;

        virtual Result<void> abort(const std::string& workflow_id) = 0;

        /// Look up the side effect recorded under @p token for @p workflow_id.
        virtual SideEffectStatus side_effect_status(const std::string& workflow_id,
                                                    const std::string& token) = 0;
    };

    std::string_view to_string(SideEffectStatus s) noexcept;

} // namespace drguard::backend
