/**
 * @file logger.hpp
 * @brief 日志宏定义
 *
 * 提供带时间戳和级别过滤的日志输出，服务端与客户端共用
 */

#pragma once

#include <atomic>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <string>
#include <algorithm>
#include <cctype>

namespace huddle::common {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief 全局最低日志级别
 */
inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::INFO)};
    return threshold;
}

inline void set_log_level(LogLevel level) {
    log_threshold().store(static_cast<int>(level));
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= log_threshold().load();
}

/**
 * @brief 解析配置中的日志级别字符串
 * @param name "DEBUG" / "INFO" / "WARN" / "ERROR"（大小写不敏感）
 * @return 未识别时返回 INFO
 */
inline LogLevel parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief 获取当前时间戳字符串
 * @return 格式: YYYY-MM-DD HH:MM:SS.mmm
 */
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&now_c), "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace huddle::common

// 日志宏定义（自动刷新缓冲区，避免 systemd 日志丢失）
#define LOG_INFO(msg) \
    do { \
        if (huddle::common::log_enabled(huddle::common::LogLevel::INFO)) { \
            std::cout << "[" << huddle::common::get_timestamp() << "] [INFO] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_WARN(msg) \
    do { \
        if (huddle::common::log_enabled(huddle::common::LogLevel::WARN)) { \
            std::cout << "[" << huddle::common::get_timestamp() << "] [WARN] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        if (huddle::common::log_enabled(huddle::common::LogLevel::ERROR)) { \
            std::cerr << "[" << huddle::common::get_timestamp() << "] [ERROR] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_DEBUG(msg) \
    do { \
        if (huddle::common::log_enabled(huddle::common::LogLevel::DEBUG)) { \
            std::cout << "[" << huddle::common::get_timestamp() << "] [DEBUG] " \
                      << msg << std::endl; \
        } \
    } while(0)
