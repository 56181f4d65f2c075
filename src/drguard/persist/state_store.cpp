/**
 * @file state_store.cpp
 */
#include "drguard/persist/state_store.hpp"
#include "drguard/persist/json_codec.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace drguard::persist {

JsonFileStateStore::JsonFileStateStore(std::filesystem::path path) : path_(std::move(path)) {}

Result<std::optional<PersistedState>> JsonFileStateStore::load() {
    std::lock_guard lk(mu_);
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) return make_error(ErrorCode::Io, "stat " + path_.string() + ": " + ec.message());
        return std::optional<PersistedState>{};
    }
    std::ifstream in(path_);
    if (!in) return make_error(ErrorCode::Io, "cannot open " + path_.string());

    try {
        const auto j = nlohmann::json::parse(in);
        return std::optional<PersistedState>{j.get<PersistedState>()};
    } catch (const std::exception& e) {
        return make_error(ErrorCode::Parse, path_.string() + ": " + e.what());
    }
}

Result<void> JsonFileStateStore::save(const PersistedState& state) {
    std::lock_guard lk(mu_);
    std::string body;
    try {
        body = nlohmann::json(state).dump(2);
    } catch (const std::exception& e) {
        return make_error(ErrorCode::Parse, std::string("encode state: ") + e.what());
    }

    std::error_code ec;
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return make_error(ErrorCode::Io, "cannot open " + tmp.string());
        out << body << '\n';
        out.flush();
        if (!out) return make_error(ErrorCode::Io, "write " + tmp.string() + " failed");
    }
    std::filesystem::rename(tmp, path_, ec);
    if (ec) return make_error(ErrorCode::Io, "rename " + tmp.string() + ": " + ec.message());
    spdlog::trace("state: saved mode={} to {}", to_string(state.mode), path_.string());
    return {};
}

Result<std::optional<PersistedState>> InMemoryStateStore::load() {
    std::lock_guard lk(mu_);
    return state_;
}

Result<void> InMemoryStateStore::save(const PersistedState& state) {
    std::lock_guard lk(mu_);
    if (fail_) return make_error(ErrorCode::Io, "state store unavailable");
    state_ = state;
    ++saves_;
    return {};
}

void InMemoryStateStore::fail_saves(bool fail) {
    std::lock_guard lk(mu_);
    fail_ = fail;
}

std::uint64_t InMemoryStateStore::saves() const {
    std::lock_guard lk(mu_);
    return saves_;
}

} // namespace drguard::persist
