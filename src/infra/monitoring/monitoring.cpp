#include "monitoring.hpp"
#include <fmt/core.h>
#include <iostream>
#include <algorithm>
#include <cmath>
#include <string>

namespace rescuecp::infra {

namespace {
constexpr auto kRenderInterval = std::chrono::milliseconds(100);
}

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::set_total(std::uint64_t bytes) {
    total_bytes_ = bytes;
}

void ProgressMonitor::update(std::uint64_t bytes, std::uint64_t bad_bytes) {
    processed_bytes_ += bytes;
    bad_bytes_ += bad_bytes;

    if (!enabled_) return;
    const auto now = std::chrono::steady_clock::now();
    if (now - last_render_ >= kRenderInterval) {
        last_render_ = now;
        render_();
    }
}

void ProgressMonitor::finish() {
    if (!enabled_ || finished_) return;
    finished_ = true;
    render_();
    std::cout << "\n"; // финальный перенос
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_bytes = total_bytes_,
        .processed_bytes = processed_bytes_,
        .bad_bytes = bad_bytes_,
        .start_time = start_time_
    };
}

void ProgressMonitor::render_() const {
    auto stats = get_stats();
    if (stats.total_bytes == 0) return;

    // Вычисляем проценты
    const double progress = static_cast<double>(stats.processed_bytes) / stats.total_bytes;
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(progress * bar_width));

    // Скорость (байт/сек)
    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double bytes_per_sec = elapsed_sec > 0 ? stats.processed_bytes / elapsed_sec : 0.0;

    // ETA
    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && stats.processed_bytes > 0 && stats.total_bytes > stats.processed_bytes) {
        double remaining_bytes = static_cast<double>(stats.total_bytes - stats.processed_bytes);
        eta_sec = remaining_bytes / bytes_per_sec;
    }

    // Форматирование скорости
    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024*1024*1024) { speed /= 1024*1024*1024; unit = "GB/s"; }
    else if (speed > 1024*1024) { speed /= 1024*1024; unit = "MB/s"; }
    else if (speed > 1024) { speed /= 1024; unit = "KB/s"; }

    // Форматирование ETA
    std::string eta_str = "--:--";
    if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    // Очистка строки и вывод
    std::cout << "\r\033[K"; // ANSI: очистить строку

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    std::cout << fmt::format(
        "[{}] {:5.1f}% {:.1f} {} | ETA: {} | bad: {} bytes",
        bar,
        progress * 100.0,
        speed, unit,
        eta_str,
        stats.bad_bytes
    );
    std::cout << std::flush;
}

} // namespace rescuecp::infra
