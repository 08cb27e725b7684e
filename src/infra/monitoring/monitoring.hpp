#pragma once

#include <chrono>
#include <cstdint>

namespace rescuecp::infra {

/// Single-line progress display for one copy. Rendering happens on the
/// caller's thread and is throttled, so `update` is cheap to call per block.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::uint64_t bad_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::uint64_t bytes);
    void update(std::uint64_t bytes = 0, std::uint64_t bad_bytes = 0);
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;

    std::uint64_t total_bytes_ = 0;
    std::uint64_t processed_bytes_ = 0;
    std::uint64_t bad_bytes_ = 0;

    const bool enabled_;
    bool finished_ = false;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_render_{};
};

} // namespace rescuecp::infra
