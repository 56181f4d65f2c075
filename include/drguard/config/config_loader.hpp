#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON configuration of regions, probes, thresholds, bounds and sinks.
 * @details Every field is optional in the document; omitted fields keep the
 *          named defaults from constants.hpp.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"
#include "drguard/cutover/coordinator.hpp"
#include "drguard/engine/failover_engine.hpp"
#include "drguard/health/health_aggregator.hpp"
#include "drguard/obs/logging.hpp"
#include "drguard/replication/lag_tracker.hpp"

namespace drguard::config {

    /// How a configured probe checks its region.
    enum class ProbeType : std::uint8_t { Tcp, Routing };

    /** @struct ProbeConfig
     *  @brief One independent probe of a region.
     */
    struct ProbeConfig {
        ProbeId       id{0};
        ProbeType     type{ProbeType::Routing};
        std::string   host;       ///< Tcp only
        std::uint16_t port{0};    ///< Tcp only
        std::uint32_t timeout_ms{constants::PROBE_TIMEOUT_MS};
    };

    /** @struct RegionConfig
     *  @brief Region identity and its probes.
     */
    struct RegionConfig {
        RegionId    id{kPrimaryRegion};
        std::string name;         ///< e.g. "us-east-1"
        std::vector<ProbeConfig> probes;
    };

    struct PersistenceConfig {
        std::string   state_file{"drguard-state.json"};
        std::string   journal_file{"drguard-plans.jsonl"};
        std::uint64_t plan_retention_ms{constants::PLAN_RETENTION_MS};
    };

    /** @struct DrConfig
     *  @brief Aggregate of sub-configs required by the daemon.
     */
    struct DrConfig {
        std::vector<RegionConfig>      regions;
        std::vector<std::string>       stores;       ///< Replicated stores whose lag bounds the RPO
        health::AggregatorConfig       aggregator;
        replication::LagTrackerConfig  lag;
        engine::EngineConfig           engine;       ///< rpo/rto/auto_failback/region roles
        cutover::CoordinatorConfig     coordinator;  ///< rpo_bound_ms mirrors engine.rpo_bound_ms
        obs::LoggingConfig             logging;
        PersistenceConfig              persistence;
        std::uint32_t decision_tick_ms{constants::DECISION_TICK_MS};
        std::size_t   probe_ring_capacity{constants::PROBE_RING_CAPACITY};
        std::size_t   alert_queue_capacity{constants::ALERT_QUEUE_CAPACITY};

        /// Name of @p region, or its number when unnamed.
        [[nodiscard]] std::string region_name(RegionId region) const;
    };

    /** @class Loader
     *  @brief Source of daemon configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Two regions with two routing-layer probes each, one store, named defaults.
        static DrConfig defaults();

        /**
         * @brief Parse and validate a JSON document.
         * @return Parse on malformed JSON or wrong field types, InvalidConfig on failed validation.
         */
        static Result<DrConfig> parse(std::string_view text);

        /// Read @p path and parse it. Io when the file cannot be read.
        static Result<DrConfig> load_from_file(const std::string& path);

        /// Cross-field checks (R > K + K2, quorum size, bounds, region roles).
        static Result<void> validate(const DrConfig& cfg);
    };

} // namespace drguard::config
