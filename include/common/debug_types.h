#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <unordered_set>
#include <unordered_map>
#include <vector>
#include <iostream>
#include <fstream>
#include <mutex>
#include <fmt/format.h>
#include <fmt/printf.h>
#include <utility>
#include <cctype>

namespace rvnum {

/**
 * 调试信息结构体
 */
struct DebugInfo {
    std::string stage;
    std::string message;

    DebugInfo() = default;

    DebugInfo(std::string stageValue, std::string messageValue)
        : stage(std::move(stageValue)),
          message(std::move(messageValue)) {}
};

/**
 * 调试回调函数类型
 */
using DebugCallback = std::function<void(const DebugInfo&)>;

/**
 * 调试输出格式化器
 */
class DebugFormatter {
public:
    // 输出格式: [STAGE] message
    static std::string format(const DebugInfo& info) {
        return fmt::format("[{}] {}", info.stage, info.message);
    }
};

/**
 * 调试预设配置类
 * 提供常用的调试分类组合
 */
class LogPresets {
public:
    static const std::unordered_map<std::string, std::vector<std::string>> presets;

    static std::vector<std::string> getCategories(const std::string& preset) {
        auto it = presets.find(preset);
        if (it != presets.end()) {
            return it->second;
        }
        return {};
    }

    static std::vector<std::string> getAvailablePresets() {
        std::vector<std::string> result;
        for (const auto& pair : presets) {
            result.push_back(pair.first);
        }
        return result;
    }
};

/**
 * 调试管理器
 * 按分类过滤日志，输出到控制台、文件或回调。
 * 默认不输出任何内容，运算单元保持静默，直到调用方显式开启。
 */
class DebugManager {
public:
    static DebugManager& getInstance() {
        static DebugManager instance;
        return instance;
    }

    void setCallback(DebugCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        debug_callback_ = std::move(callback);
    }

    void clearCallback() {
        std::lock_guard<std::mutex> lock(mutex_);
        debug_callback_ = nullptr;
    }

    // 文件输出功能
    void setLogFile(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(filename, std::ios::out | std::ios::trunc);
        if (!log_file_.is_open()) {
            std::cerr << "Warning: Cannot open log file: " << filename << std::endl;
        }
    }

    void setOutputToFile(bool enable) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_to_file_ = enable;
    }

    void setOutputToConsole(bool enable) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_to_console_ = enable;
    }

    void closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    // 启用/禁用调试分类
    void enableCategory(const std::string& category) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_categories_.insert(toUpper(category));
    }

    void disableCategory(const std::string& category) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_categories_.erase(toUpper(category));
    }

    void clearCategories() {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_categories_.clear();
    }

    void setCategories(const std::vector<std::string>& categories) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_categories_.clear();
        for (const auto& category : categories) {
            enabled_categories_.insert(toUpper(category));
        }
    }

    // 设置调试分类（字符串格式，用逗号分隔）
    void setCategories(const std::string& categories) {
        std::vector<std::string> parsed;
        std::string current = categories;
        size_t pos = 0;
        while ((pos = current.find(',')) != std::string::npos) {
            std::string category = trim(current.substr(0, pos));
            if (!category.empty()) {
                parsed.push_back(category);
            }
            current = current.substr(pos + 1);
        }
        current = trim(current);
        if (!current.empty()) {
            parsed.push_back(current);
        }
        setCategories(parsed);
    }

    void setPreset(const std::string& preset) {
        setCategories(LogPresets::getCategories(preset));
    }

    // 快速判断：该分类的日志是否会被输出
    bool isEnabled(const std::string& stage) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shouldOutput(stage);
    }

    // 回调与控制台输出在锁外进行，回调内部可以再次调用会记录日志的函数
    void log(const std::string& stage, const std::string& message) {
        DebugInfo info(stage, message);
        const std::string line = DebugFormatter::format(info);
        DebugCallback callback;
        bool to_console = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!shouldOutput(stage)) {
                return;
            }
            callback = debug_callback_;
            to_console = output_to_console_;
            if (output_to_file_ && log_file_.is_open()) {
                log_file_ << line << std::endl;
                log_file_.flush();
            }
        }

        if (to_console) {
            std::cout << line << std::endl;
        }
        if (callback) {
            callback(info);
        }
    }

    std::string getConfigInfo() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string info = "Debug Configuration:\n";
        info += "  Categories: ";
        if (enabled_categories_.empty()) {
            info += "ALL";
        } else {
            bool first = true;
            for (const auto& category : enabled_categories_) {
                if (!first) info += ", ";
                info += category;
                first = false;
            }
        }
        info += fmt::format("\n  Console: {}  File: {}",
                            output_to_console_ ? "on" : "off",
                            output_to_file_ ? "on" : "off");
        return info;
    }

    // 恢复默认配置（全部静默）
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        debug_callback_ = nullptr;
        enabled_categories_.clear();
        if (log_file_.is_open()) {
            log_file_.close();
        }
        output_to_file_ = false;
        output_to_console_ = false;
    }

private:
    DebugManager() = default;
    ~DebugManager() = default;
    DebugManager(const DebugManager&) = delete;
    DebugManager& operator=(const DebugManager&) = delete;

    static std::string toUpper(const std::string& input) {
        std::string result;
        result.reserve(input.size());
        for (unsigned char ch : input) {
            result.push_back(static_cast<char>(std::toupper(ch)));
        }
        return result;
    }

    static std::string trim(const std::string& input) {
        const auto first = input.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = input.find_last_not_of(" \t");
        return input.substr(first, last - first + 1);
    }

    bool shouldOutput(const std::string& stage) const {
        if (stage != "SYSTEM" &&
            !enabled_categories_.empty() &&
            enabled_categories_.find(stage) == enabled_categories_.end()) {
            return false;
        }

        if (!output_to_console_ && !output_to_file_ && !debug_callback_) {
            return false;
        }

        return true;
    }

    mutable std::mutex mutex_;
    DebugCallback debug_callback_;
    std::unordered_set<std::string> enabled_categories_;
    std::ofstream log_file_;
    bool output_to_file_ = false;
    bool output_to_console_ = false;
};

} // namespace rvnum

// 未启用的分类不做格式化
#define LOG_DEBUG(stage, ...) do { \
    auto& debug_manager_ = ::rvnum::DebugManager::getInstance(); \
    if (debug_manager_.isEnabled(#stage)) { \
        const auto message = fmt::sprintf(__VA_ARGS__); \
        debug_manager_.log(#stage, message); \
    } \
} while (0)
