#pragma once
/**
 * @file traffic_router.hpp
 * @brief Capability interface to the traffic/DNS routing layer.
 */

#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"

namespace drguard::backend {

    class TrafficRouter {
    public:
        virtual ~TrafficRouter() = default;

        /// Point client traffic at @p region.
        virtual Result<void> set_active_region(RegionId region) = 0;

        /// @return Region currently receiving client traffic.
        virtual Result<RegionId> active_region() = 0;

        /// Routing-layer health check verdict for @p region (used as one probe signal).
        virtual Result<bool> health_check_status(RegionId region) = 0;

        /// Stop admitting new writes into @p region.
        virtual Result<void> block_writes(RegionId region) = 0;

        /// Re-admit writes into @p region.
        virtual Result<void> allow_writes(RegionId region) = 0;

        virtual Result<bool> writes_blocked(RegionId region) = 0;
    };

} // namespace drguard::backend
