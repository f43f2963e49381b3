#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "infra/monitoring/monitoring.hpp"

namespace treecp::test {

// Уникальный временный каталог, удаляется в деструкторе
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("treecp_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Относительные пути всех записей дерева, отсортированные
inline auto list_tree(const std::filesystem::path& root) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        out.push_back(std::filesystem::relative(entry.path(), root).generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// Запоминает вызовы, чтобы тесты могли проверить протокол приёмника
class RecordingSink final : public infra::ProgressSink {
public:
    void set_total(std::uint64_t files) override {
        std::lock_guard lock(mutex_);
        total_ = files;
        ++set_total_calls_;
    }
    void advance(std::uint64_t files) override {
        std::lock_guard lock(mutex_);
        advanced_ += files;
    }
    void finish() override {
        std::lock_guard lock(mutex_);
        ++finish_calls_;
    }

    [[nodiscard]] auto total() const -> std::uint64_t { std::lock_guard l(mutex_); return total_; }
    [[nodiscard]] auto advanced() const -> std::uint64_t { std::lock_guard l(mutex_); return advanced_; }
    [[nodiscard]] auto set_total_calls() const -> int { std::lock_guard l(mutex_); return set_total_calls_; }
    [[nodiscard]] auto finish_calls() const -> int { std::lock_guard l(mutex_); return finish_calls_; }

private:
    mutable std::mutex mutex_;
    std::uint64_t total_ = 0;
    std::uint64_t advanced_ = 0;
    int set_total_calls_ = 0;
    int finish_calls_ = 0;
};

} // namespace treecp::test
