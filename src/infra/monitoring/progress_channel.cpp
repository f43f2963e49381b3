#include "progress_channel.hpp"

#include <algorithm>

namespace treecp::infra {

ProgressChannel::ProgressChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1))
{
}

void ProgressChannel::send_() {
    {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return pending_ < capacity_; });
        ++pending_;
    }
    not_empty_.notify_one();
}

auto ProgressChannel::receive() -> std::uint64_t {
    std::uint64_t ticks = 0;
    {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return pending_ > 0 || closed_; });
        ticks = pending_;
        pending_ = 0;
    }
    // Забрали всё разом, будим всех ждущих отправителей
    not_full_.notify_all();
    return ticks;
}

void ProgressChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

ProgressPump::ProgressPump(ProgressSink& sink, std::size_t capacity)
    : channel_(capacity)
    , sink_(sink)
    , consumer_([this] {
        while (const auto ticks = channel_.receive()) {
            sink_.advance(ticks);
        }
    })
{
}

ProgressPump::~ProgressPump() {
    drain_and_stop();
}

void ProgressPump::drain_and_stop() {
    if (!consumer_.joinable()) return;
    channel_.close();
    consumer_.join();
}

} // namespace treecp::infra
