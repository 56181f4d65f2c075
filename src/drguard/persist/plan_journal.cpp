/**
 * @file plan_journal.cpp
 */
#include "drguard/persist/plan_journal.hpp"
#include "drguard/persist/json_codec.hpp"

#include <exception>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace drguard::persist {

namespace {

Result<std::vector<JournalEntry>> read_entries(const std::filesystem::path& path) {
    std::vector<JournalEntry> out;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return out;

    std::ifstream in(path);
    if (!in) return make_error(ErrorCode::Io, "cannot open " + path.string());

    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        try {
            const auto j = nlohmann::json::parse(line);
            out.push_back(JournalEntry{j.at("recorded_ms").get<TimestampMs>(),
                                       j.at("plan").get<cutover::CutoverPlan>(),
                                       j.at("progress").get<cutover::PlanProgress>()});
        } catch (const std::exception& e) {
            spdlog::warn("journal: {}:{} skipped: {}", path.string(), lineno, e.what());
        }
    }
    return out;
}

} // namespace

PlanJournal::PlanJournal(std::filesystem::path path, std::uint64_t retention_ms)
    : path_(std::move(path)), retention_ms_(retention_ms) {}

Result<void> PlanJournal::append(const cutover::CutoverPlan& plan, const cutover::PlanProgress& progress,
                                 TimestampMs now) {
    std::string line;
    try {
        line = nlohmann::json{{"recorded_ms", now}, {"plan", plan}, {"progress", progress}}.dump();
    } catch (const std::exception& e) {
        return make_error(ErrorCode::Parse, std::string("encode journal entry: ") + e.what());
    }

    std::lock_guard lk(mu_);
    std::error_code ec;
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
    std::ofstream out(path_, std::ios::app);
    if (!out) return make_error(ErrorCode::Io, "cannot open " + path_.string());
    out << line << '\n';
    out.flush();
    if (!out) return make_error(ErrorCode::Io, "append to " + path_.string() + " failed");
    return {};
}

Result<std::vector<JournalEntry>> PlanJournal::entries() const {
    std::lock_guard lk(mu_);
    return read_entries(path_);
}

Result<std::size_t> PlanJournal::prune(TimestampMs now) {
    std::lock_guard lk(mu_);
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return std::size_t{0};

    std::ifstream in(path_);
    if (!in) return make_error(ErrorCode::Io, "cannot open " + path_.string());

    const TimestampMs cutoff = now > retention_ms_ ? now - retention_ms_ : 0;
    std::size_t removed = 0;
    std::size_t kept_unreadable = 0;
    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return make_error(ErrorCode::Io, "cannot open " + tmp.string());
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            // Lines are copied verbatim; only a readable, expired timestamp drops one.
            std::optional<TimestampMs> recorded;
            try {
                recorded = nlohmann::json::parse(line).at("recorded_ms").get<TimestampMs>();
            } catch (const std::exception&) {
                ++kept_unreadable;
            }
            if (recorded && *recorded < cutoff) {
                ++removed;
                continue;
            }
            out << line << '\n';
        }
        out.flush();
        if (!out) return make_error(ErrorCode::Io, "write " + tmp.string() + " failed");
    }
    in.close();
    std::filesystem::rename(tmp, path_, ec);
    if (ec) return make_error(ErrorCode::Io, "rename " + tmp.string() + ": " + ec.message());
    if (removed > 0) spdlog::info("journal: pruned {} plan(s) older than retention", removed);
    if (kept_unreadable > 0) {
        spdlog::warn("journal: {} unreadable line(s) in {} kept unchanged", kept_unreadable, path_.string());
    }
    return removed;
}

} // namespace drguard::persist
