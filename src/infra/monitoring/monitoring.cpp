#include "monitoring.hpp"
#include <fmt/core.h>
#include <iostream>
#include <algorithm>
#include <cmath>
#include <thread>

namespace treecp::infra {

ConsoleProgress::ConsoleProgress(std::string description, int bar_width)
    : description_(std::move(description))
    , bar_width_(bar_width > 0 ? bar_width : 50)
    , start_time_(std::chrono::steady_clock::now())
{
}

ConsoleProgress::~ConsoleProgress() {
    if (render_thread_) {
        stop_rendering_thread_();
        std::cout << "\n"; // незавершённая полоса остаётся на экране
    }
}

void ConsoleProgress::set_total(std::uint64_t files) {
    total_files_.store(files);
    start_time_.store(std::chrono::steady_clock::now());
    if (!render_thread_) {
        start_rendering_thread_();
    }
}

void ConsoleProgress::advance(std::uint64_t files) {
    processed_files_.fetch_add(files, std::memory_order_relaxed);
}

void ConsoleProgress::finish() {
    if (finished_.exchange(true)) return;
    stop_rendering_thread_();
    render_();
    std::cout << "\n" << std::flush;
}

auto ConsoleProgress::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_.load(),
        .processed_files = processed_files_.load(),
        .start_time = start_time_.load()
    };
}

void ConsoleProgress::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        render_();
    });
}

void ConsoleProgress::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_->join();
        render_thread_.reset();
    }
}

void ConsoleProgress::render_() const {
    auto stats = get_stats();

    const double ratio = stats.total_files == 0
        ? 1.0
        : std::min(1.0, static_cast<double>(stats.processed_files) / stats.total_files);
    const int filled = static_cast<int>(ratio * bar_width_);

    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double files_per_sec = elapsed_sec > 0 ? stats.processed_files / elapsed_sec : 0.0;

    // ETA
    std::string eta_str = "--:--";
    if (files_per_sec > 0 && stats.processed_files < stats.total_files) {
        const double eta_sec = (stats.total_files - stats.processed_files) / files_per_sec;
        if (std::isfinite(eta_sec)) {
            int seconds = static_cast<int>(eta_sec);
            int hours = seconds / 3600;
            int minutes = (seconds % 3600) / 60;
            seconds = seconds % 60;
            eta_str = hours > 0
                ? fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds)
                : fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::cout << "\r\033[K"; // ANSI: очистить строку

    std::string bar;
    for (int i = 0; i < bar_width_; ++i) {
        bar += i < filled ? "█" : " ";
    }
    fmt::print(
        "{} {:3.0f}% |{}| ({}/{}, {:.0f} files/s) [{}]",
        description_,
        ratio * 100.0,
        bar,
        stats.processed_files,
        stats.total_files,
        files_per_sec,
        eta_str
    );
    std::cout << std::flush;
}

} // namespace treecp::infra
