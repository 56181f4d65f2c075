/**
 * @file logging.cpp
 * @brief spdlog sink wiring for the daemon and tools.
 */
#include "drguard/obs/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace drguard::obs {

namespace {

constexpr const char* kTextPattern = "%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ [%n] %v";
constexpr const char* kJsonPattern =
    R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","logger":"%n","msg":"%v"})";

std::mutex& registry_mutex() {
    static std::mutex mu;
    return mu;
}

} // namespace

void configure_logging(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lk(registry_mutex());

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (cfg.file && !cfg.file->empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *cfg.file, cfg.max_bytes, cfg.max_files));
    }

    auto root = std::make_shared<spdlog::logger>("drguard", sinks.begin(), sinks.end());
    root->set_level(spdlog::level::from_str(cfg.level));
    root->set_pattern(cfg.json ? kJsonPattern : kTextPattern);
    root->flush_on(spdlog::level::warn);

    // Named loggers created earlier keep pointing at the old sinks; drop them.
    spdlog::drop_all();
    spdlog::set_default_logger(root);
}

std::shared_ptr<spdlog::logger> logger(std::string_view name) {
    std::lock_guard<std::mutex> lk(registry_mutex());
    const std::string key(name);
    if (auto existing = spdlog::get(key)) return existing;

    auto root = spdlog::default_logger();
    auto lg = std::make_shared<spdlog::logger>(key, root->sinks().begin(), root->sinks().end());
    lg->set_level(root->level());
    lg->flush_on(spdlog::level::warn);
    spdlog::register_logger(lg);
    return lg;
}

} // namespace drguard::obs
