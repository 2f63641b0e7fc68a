#pragma once

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace dircopy::test {

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Относительный путь обычного файла -> содержимое
inline auto file_contents(const std::filesystem::path& root) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files[std::filesystem::relative(entry.path(), root).generic_string()] = read_file(entry.path());
        }
    }
    return files;
}

inline auto directory_names(const std::filesystem::path& root) -> std::set<std::string> {
    std::set<std::string> dirs;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_directory()) {
            dirs.insert(std::filesystem::relative(entry.path(), root).generic_string());
        }
    }
    return dirs;
}

// Временный каталог на тест, удаляется в TearDown
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path() /
                ("dircopy_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

// Перехватывает вывод логгера по умолчанию на время жизни объекта
class LogCapture {
public:
    LogCapture()
        : previous_(spdlog::default_logger())
    {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_pattern("[%l] %v");
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);
    }

    ~LogCapture() {
        spdlog::set_default_logger(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] auto text() const -> std::string { return stream_.str(); }
    [[nodiscard]] auto contains(const std::string& needle) const -> bool {
        return text().find(needle) != std::string::npos;
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
};

} // namespace dircopy::test
