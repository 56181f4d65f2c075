#pragma once
/**
 * @file state_store.hpp
 * @brief Durable engine state: operating mode, in-flight plan and operator flags.
 *
 * The engine persists after every change and restores on construction, so the
 * operating mode survives restarts instead of resetting to PRIMARY_ACTIVE.
 */

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"
#include "drguard/cutover/cutover_plan.hpp"

namespace drguard::persist {

/** @struct PersistedState
 *  @brief Everything the engine needs to resume after a restart.
 */
struct PersistedState {
    OperatingMode mode{OperatingMode::PrimaryActive};
    TimestampMs   mode_since_ms{0};
    RegionId      active_region{kPrimaryRegion};
    std::optional<cutover::CutoverPlan>  plan;     ///< Most recent plan
    std::optional<cutover::PlanProgress> progress; ///< Its progress; non-terminal means resume on restart
    bool          failback_confirmed{false};
    bool          automation_halted{false};        ///< Set after FAILED/PARTIAL until acknowledged
    std::uint64_t plan_seq{0};
};

void to_json(nlohmann::json& j, const PersistedState& s);
void from_json(const nlohmann::json& j, PersistedState& s);

class StateStore {
public:
    virtual ~StateStore() = default;

    /// @return std::nullopt when nothing was ever persisted.
    virtual Result<std::optional<PersistedState>> load() = 0;

    virtual Result<void> save(const PersistedState& state) = 0;
};

/** @class JsonFileStateStore
 *  @brief One JSON document, replaced atomically (write a temp file, then rename over the old one).
 */
class JsonFileStateStore final : public StateStore {
public:
    explicit JsonFileStateStore(std::filesystem::path path);

    Result<std::optional<PersistedState>> load() override;
    Result<void> save(const PersistedState& state) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mu_;
};

/** @class InMemoryStateStore
 *  @brief Process-local store; survives engine re-construction within one test.
 */
class InMemoryStateStore final : public StateStore {
public:
    Result<std::optional<PersistedState>> load() override;
    Result<void> save(const PersistedState& state) override;

    /// Make subsequent saves fail with ErrorCode::Io.
    void fail_saves(bool fail);
    [[nodiscard]] std::uint64_t saves() const;

private:
    mutable std::mutex mu_;
    std::optional<PersistedState> state_;
    bool fail_{false};
    std::uint64_t saves_{0};
};

} // namespace drguard::persist
