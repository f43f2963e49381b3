#pragma once

#include <filesystem>
#include <vector>
#include "../copy_engine/copy_engine.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace treecp::core {

// Подсчёт -> канал прогресса -> копирование -> закрытие канала -> finish().
class Orchestrator {
public:
    Orchestrator(const infra::Config& config, infra::ProgressSink& sink);

    // Один источник. Ошибка подсчёта прерывает всё до начала копирования.
    // finish() у приёмника вызывается только при успехе.
    [[nodiscard]] auto copy(const std::filesystem::path& source,
                            const std::filesystem::path& destination)
        -> TransferResult;

    // Несколько источников сливаются в один destination, по задаче на источник,
    // один общий прогресс. Если упало несколько источников, возвращается ошибка
    // источника с лексикографически наименьшим путём.
    [[nodiscard]] auto copy_multiple(const std::vector<std::filesystem::path>& sources,
                                     const std::filesystem::path& destination)
        -> TransferResult;

private:
    const infra::Config& config_;
    infra::ProgressSink& sink_;
    CopyEngine engine_;
};

} // namespace treecp::core
