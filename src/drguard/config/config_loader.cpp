/**
 * @file config_loader.cpp
 * @brief nlohmann::json-backed loader; omitted fields fall back to named defaults.
 */
#include "drguard/config/config_loader.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace drguard::config {
    using nlohmann::json;
    using namespace drguard::config::constants;

    namespace {

        template <class T>
        void read(const json& j, const char* key, T& out) {
            if (auto it = j.find(key); it != j.end() && !it->is_null()) it->get_to(out);
        }

        ProbeConfig parse_probe(const json& j) {
            ProbeConfig p;
            read(j, "id", p.id);
            const auto type = j.value("type", std::string("routing"));
            if (type == "tcp") {
                p.type = ProbeType::Tcp;
            } else if (type == "routing") {
                p.type = ProbeType::Routing;
            } else {
                throw std::invalid_argument("unknown probe type '" + type + "'");
            }
            read(j, "host", p.host);
            read(j, "port", p.port);
            read(j, "timeout_ms", p.timeout_ms);
            return p;
        }

        RegionConfig parse_region(const json& j) {
            RegionConfig r;
            read(j, "id", r.id);
            read(j, "name", r.name);
            if (auto it = j.find("probes"); it != j.end()) {
                for (const auto& p : *it) r.probes.push_back(parse_probe(p));
            }
            return r;
        }

        void apply(const json& j, DrConfig& c) {
            if (auto it = j.find("regions"); it != j.end()) {
                c.regions.clear();
                for (const auto& r : *it) c.regions.push_back(parse_region(r));
            }
            read(j, "stores", c.stores);
            read(j, "primary", c.engine.primary);
            read(j, "secondary", c.engine.secondary);
            read(j, "probe_interval_ms", c.aggregator.probe_interval_ms);

            if (auto it = j.find("hysteresis"); it != j.end()) {
                read(*it, "k", c.aggregator.k);
                read(*it, "k2", c.aggregator.k2);
                read(*it, "d", c.aggregator.d);
                read(*it, "r", c.aggregator.r);
                read(*it, "window_ms", c.aggregator.window_ms);
                read(*it, "round_grace_ms", c.aggregator.round_grace_ms);
            }
            if (auto it = j.find("replication"); it != j.end()) {
                read(*it, "report_interval_ms", c.lag.report_interval_ms);
                read(*it, "stale_factor", c.lag.stale_factor);
                read(*it, "smoothing_window_ms", c.lag.smoothing_window_ms);
                read(*it, "history_max", c.lag.history_max);
            }

            read(j, "rpo_bound_ms", c.engine.rpo_bound_ms);
            read(j, "rto_deadline_ms", c.engine.rto_deadline_ms);
            read(j, "auto_failback", c.engine.auto_failback);
            c.coordinator.rpo_bound_ms = c.engine.rpo_bound_ms;

            if (auto it = j.find("cutover"); it != j.end()) {
                read(*it, "drain_timeout_ms", c.coordinator.drain_timeout_ms);
                read(*it, "drain_poll_ms", c.coordinator.drain_poll_ms);
                read(*it, "accepted_loss_window_ms", c.coordinator.accepted_loss_window_ms);
            }

            read(j, "decision_tick_ms", c.decision_tick_ms);
            read(j, "probe_ring_capacity", c.probe_ring_capacity);
            read(j, "alert_queue_capacity", c.alert_queue_capacity);

            if (auto it = j.find("logging"); it != j.end()) {
                read(*it, "level", c.logging.level);
                read(*it, "json", c.logging.json);
                if (auto f = it->find("file"); f != it->end() && f->is_string()) c.logging.file = f->get<std::string>();
                read(*it, "max_bytes", c.logging.max_bytes);
                read(*it, "max_files", c.logging.max_files);
            }
            if (auto it = j.find("persistence"); it != j.end()) {
                read(*it, "state_file", c.persistence.state_file);
                read(*it, "journal_file", c.persistence.journal_file);
                read(*it, "plan_retention_ms", c.persistence.plan_retention_ms);
            }
        }

        Result<void> invalid(std::string msg) { return make_error(ErrorCode::InvalidConfig, std::move(msg)); }

    } // namespace

    std::string DrConfig::region_name(RegionId region) const {
        for (const auto& r : regions) {
            if (r.id == region && !r.name.empty()) return r.name;
        }
        return "region-" + std::to_string(region);
    }

    DrConfig Loader::defaults() {
        DrConfig c;
        c.regions = {
            RegionConfig{kPrimaryRegion, "primary",
                         {ProbeConfig{.id = 1, .type = ProbeType::Routing},
                          ProbeConfig{.id = 2, .type = ProbeType::Routing}}},
            RegionConfig{kSecondaryRegion, "secondary",
                         {ProbeConfig{.id = 1, .type = ProbeType::Routing},
                          ProbeConfig{.id = 2, .type = ProbeType::Routing}}},
        };
        c.stores = {"transactions"};
        c.coordinator.rpo_bound_ms = c.engine.rpo_bound_ms;
        return c;
    }

    Result<void> Loader::validate(const DrConfig& c) {
        if (auto r = health::validate(c.aggregator); !r) return r;

        if (c.regions.size() < 2) return invalid("at least two regions are required");
        std::set<RegionId> ids;
        for (const auto& r : c.regions) {
            if (!ids.insert(r.id).second) return invalid("duplicate region id " + std::to_string(r.id));
            if (r.probes.size() < PROBES_PER_REGION_MIN) {
                return invalid("region " + std::to_string(r.id) + " needs at least " +
                               std::to_string(PROBES_PER_REGION_MIN) + " probes for a quorum");
            }
            std::set<ProbeId> pids;
            for (const auto& p : r.probes) {
                if (!pids.insert(p.id).second) {
                    return invalid("duplicate probe id " + std::to_string(p.id) + " in region " + std::to_string(r.id));
                }
                if (p.type == ProbeType::Tcp && (p.host.empty() || p.port == 0)) {
                    return invalid("tcp probe " + std::to_string(p.id) + " needs host and port");
                }
                if (p.timeout_ms == 0 || p.timeout_ms >= c.aggregator.probe_interval_ms) {
                    return invalid("probe timeout must be > 0 and shorter than the probe interval");
                }
            }
        }
        if (ids.count(c.engine.primary) == 0 || ids.count(c.engine.secondary) == 0) {
            return invalid("primary and secondary must name configured regions");
        }
        if (c.engine.primary == c.engine.secondary) return invalid("primary and secondary must differ");

        if (c.engine.rpo_bound_ms == 0) return invalid("rpo_bound_ms must be > 0");
        if (c.engine.rto_deadline_ms == 0) return invalid("rto_deadline_ms must be > 0");
        if (c.coordinator.drain_poll_ms == 0 || c.coordinator.drain_timeout_ms == 0) {
            return invalid("cutover drain timeout and poll period must be > 0");
        }
        if (c.lag.report_interval_ms == 0 || c.lag.stale_factor == 0) {
            return invalid("replication report interval and stale factor must be > 0");
        }
        if (std::set<std::string>(c.stores.begin(), c.stores.end()).size() != c.stores.size()) {
            return invalid("duplicate store name");
        }
        if (c.probe_ring_capacity < 2 || (c.probe_ring_capacity & (c.probe_ring_capacity - 1)) != 0) {
            return invalid("probe_ring_capacity must be a power of two >= 2");
        }
        if (c.decision_tick_ms == 0) return invalid("decision_tick_ms must be > 0");
        if (c.alert_queue_capacity == 0) return invalid("alert_queue_capacity must be > 0");

        static const std::set<std::string> kLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};
        if (kLevels.count(c.logging.level) == 0) return invalid("unknown log level '" + c.logging.level + "'");
        return {};
    }

    Result<DrConfig> Loader::parse(std::string_view text) {
        DrConfig c = defaults();
        try {
            const json j = json::parse(text);
            if (!j.is_object()) return make_error(ErrorCode::Parse, "configuration must be a JSON object");
            apply(j, c);
        } catch (const std::exception& e) {
            return make_error(ErrorCode::Parse, e.what());
        }
        if (auto v = validate(c); !v) return drguard_detail::unexpected<Error>(v.error());
        return c;
    }

    Result<DrConfig> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return make_error(ErrorCode::Io, "cannot open config file " + path);
        std::ostringstream ss;
        ss << in.rdbuf();
        auto cfg = parse(ss.str());
        if (!cfg) {
            spdlog::error("config: {}: {}", path, cfg.error().message);
            return cfg;
        }
        spdlog::info("config: loaded {} ({} regions, {} stores)", path, cfg->regions.size(), cfg->stores.size());
        return cfg;
    }

} // namespace drguard::config
