#pragma once

#include <gtest/gtest.h>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Routes log lines into memory for the lifetime of the object.
class LogCapture {
public:
    explicit LogCapture(LogLevel level = LogLevel::Debug) : previous_(log_level()) {
        set_log_level(level);
        set_log_sink([this](LogLevel l, const std::string& msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back({l, msg});
        });
    }

    ~LogCapture() {
        set_log_sink(nullptr);
        set_log_level(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(const std::string& needle) const {
        return count(needle) > 0;
    }

    int count(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(lines_.begin(), lines_.end(),
            [&](const Line& l) { return l.msg.find(needle) != std::string::npos; }));
    }

    int count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(lines_.begin(), lines_.end(),
            [&](const Line& l) { return l.level == level; }));
    }

    std::vector<std::string> at_level(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& l : lines_) {
            if (l.level == level) out.push_back(l.msg);
        }
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

private:
    struct Line {
        LogLevel level;
        std::string msg;
    };

    LogLevel previous_;
    mutable std::mutex mutex_;
    std::vector<Line> lines_;
};

// Per-test scratch directory, unique across parallel test processes.
class TempDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = platform::temp_dir() /
            ("wosh_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
             std::to_string(platform::current_pid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    std::vector<fs::path> command_files(const fs::path& dir) const {
        std::vector<fs::path> out;
        if (!fs::exists(dir)) return out;
        for (const auto& e : fs::directory_iterator(dir)) {
            if (e.path().extension() == ".command") out.push_back(e.path());
        }
        return out;
    }
};
