#pragma once

#include <string>

namespace edgebridge {

// 日志级别（0=ERROR, 1=INFO, 2=DEBUG），与配置文件 log_level 一致
enum LogLevel {
	LOG_ERROR = 0,
	LOG_INFO = 1,
	LOG_DEBUG = 2
};

/**
 * @brief 设置全局日志级别，高于该级别的日志被丢弃
 */
void set_log_level(int level);

int get_log_level();

/**
 * @brief 日志输出
 * @param level 日志级别
 * @param message 日志消息
 */
void log(int level, const std::string &message);

} // namespace edgebridge
