#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <memory>
#include <thread>

namespace treecp::infra {

// Приёмник прогресса. Ядро копирования о нём не знает: тиками управляет
// Orchestrator через ProgressChannel.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void set_total(std::uint64_t files) = 0;
    virtual void advance(std::uint64_t files = 1) = 0;
    virtual void finish() = 0;
};

class NullProgress final : public ProgressSink {
public:
    void set_total(std::uint64_t) override {}
    void advance(std::uint64_t) override {}
    void finish() override {}
};

// Полоса прогресса в терминале, перерисовывается отдельным потоком.
class ConsoleProgress final : public ProgressSink {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ConsoleProgress(std::string description = "Copying files:", int bar_width = 50);
    ~ConsoleProgress() override;

    ConsoleProgress(const ConsoleProgress&) = delete;
    ConsoleProgress& operator=(const ConsoleProgress&) = delete;

    void set_total(std::uint64_t files) override;
    void advance(std::uint64_t files = 1) override;
    void finish() override;

    [[nodiscard]] auto get_stats() const -> Stats;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> total_files_{0};

    const std::string description_;
    const int bar_width_;
    // set_total перезапускает отсчёт, пока поток отрисовки его читает
    std::atomic<std::chrono::steady_clock::time_point> start_time_;
    std::atomic<bool> finished_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace treecp::infra
