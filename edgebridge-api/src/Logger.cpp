#include <edgebridge/Logger.hpp>
#include <atomic>
#include <iostream>
#include <mutex>

namespace edgebridge {

namespace {
std::atomic<int> g_log_level { LOG_INFO };
std::mutex g_log_mutex;
}

void set_log_level(int level) {
	g_log_level = level;
}

int get_log_level() {
	return g_log_level;
}

/**
 * @brief 输出日志信息
 * @details 多个采集线程并发写日志，需加锁避免行交错
 */
void log(int level, const std::string &message) {
	if (level > g_log_level) {
		return;
	}
	const char *level_str = (level == LOG_ERROR) ? "ERROR" : (level == LOG_INFO) ? "INFO" : "DEBUG";
	std::lock_guard<std::mutex> lock(g_log_mutex);
	std::cout << "[" << level_str << "] " << message << std::endl;
}

} // namespace edgebridge
