#pragma once
/**
 * @file storage_backend.hpp
 * @brief Capability interface to a replicated data store (global tables, global clusters, object replication).
 * @details The core never implements replication; it only reads lag and promotes replicas.
 */

#include <cstdint>
#include <string>

#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"

namespace drguard::backend {

    class StorageBackend {
    public:
        virtual ~StorageBackend() = default;

        /**
         * @brief Current replication lag of @p store into @p replica.
         * @return Lag in milliseconds, or BackendFailure if the metric is unavailable.
         */
        virtual Result<std::uint64_t> current_lag(const std::string& store, RegionId replica) = 0;

        /// Make the @p store replica in @p region accept writes.
        virtual Result<void> promote_to_writable(RegionId region, const std::string& store) = 0;

        /// @return True if the @p store replica in @p region currently accepts writes.
        virtual Result<bool> is_writable(RegionId region, const std::string& store) = 0;
    };

} // namespace drguard::backend
