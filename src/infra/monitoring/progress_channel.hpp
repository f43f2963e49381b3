#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

#include "monitoring.hpp"

namespace treecp::infra {

// Ограниченная очередь тиков "один файл скопирован".
// Писателей много (копирующие задачи), читатель один (ProgressPump).
// Отправка блокируется, пока очередь заполнена.
class ProgressChannel {
public:
    // Сторона отправителя: закрыть канал через неё нельзя.
    class Sender {
    public:
        explicit Sender(ProgressChannel& channel) noexcept : channel_(&channel) {}
        void send() const { channel_->send_(); }

    private:
        ProgressChannel* channel_;
    };

    explicit ProgressChannel(std::size_t capacity = 256);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    [[nodiscard]] auto sender() noexcept -> Sender { return Sender{*this}; }

    /// Ждёт тики. Возвращает число полученных (> 0) или 0, если канал закрыт и пуст.
    [[nodiscard]] auto receive() -> std::uint64_t;

    void close();

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    void send_();

    const std::size_t capacity_;
    std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::uint64_t pending_ = 0;
    bool closed_ = false;
};

// Владелец жизненного цикла канала: создаёт канал, запускает поток,
// переводящий тики в ProgressSink::advance(), и закрывает канал ровно один раз.
class ProgressPump {
public:
    ProgressPump(ProgressSink& sink, std::size_t capacity);
    ~ProgressPump();

    ProgressPump(const ProgressPump&) = delete;
    ProgressPump& operator=(const ProgressPump&) = delete;

    [[nodiscard]] auto sender() noexcept -> ProgressChannel::Sender { return channel_.sender(); }

    // Закрывает канал и дожидается, пока поток-потребитель всё вычитает.
    // Вызывать только после того, как все отправители завершились.
    void drain_and_stop();

private:
    ProgressChannel channel_;
    ProgressSink& sink_;
    std::jthread consumer_;
};

} // namespace treecp::infra
