#pragma once

#include <edgebridge/Context.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace edgebridge {

/**
 * @brief 计数信号量，限制并发采集数量
 */
class Semaphore {
public:
    explicit Semaphore(size_t permits) : m_permits(permits) {}

    /**
     * @brief 获取一个许可，任一上下文取消即放弃
     * @return 是否获得许可
     */
    bool acquire(const Context& ctx, const Context& shutdown) {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_permits == 0) {
            if (ctx.is_cancelled() || shutdown.is_cancelled()) {
                return false;
            }
            m_cv.wait_for(lock, POLL_INTERVAL);
        }
        --m_permits;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_permits;
        }
        m_cv.notify_one();
    }

private:
    static constexpr std::chrono::milliseconds POLL_INTERVAL { 20 };

    std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_permits;
};

/**
 * @brief 等待一组工作线程结束
 */
class WaitGroup {
public:
    void add(size_t count = 1) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_count += count;
    }

    void done() {
        bool finished = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_count > 0) {
                --m_count;
            }
            finished = m_count == 0;
        }
        if (finished) {
            m_cv.notify_all();
        }
    }

    /**
     * @brief 等待计数归零
     * @return true 全部完成；false 上下文先取消，此时工作线程可能仍在运行
     */
    bool wait(const Context& ctx, const Context& shutdown) {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_count > 0) {
            if (ctx.is_cancelled() || shutdown.is_cancelled()) {
                return false;
            }
            m_cv.wait_for(lock, std::chrono::milliseconds(20));
        }
        return true;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_count { 0 };
};

} // namespace edgebridge
