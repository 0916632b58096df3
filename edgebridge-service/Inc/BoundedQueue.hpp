#pragma once

#include <edgebridge/Context.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace edgebridge {

/**
 * @brief 定长线程安全队列
 *
 * 满时 try_push 立即失败，push 阻塞直到有空位或上下文取消。
 * 容量为 0 时按 1 处理。
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : m_capacity(capacity > 0 ? capacity : 1) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool try_push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_items.size() >= m_capacity) {
                return false;
            }
            m_items.push_back(std::move(item));
        }
        m_not_empty.notify_one();
        return true;
    }

    /**
     * @brief 阻塞写入，ctx 或 shutdown 取消时放弃
     */
    bool push(T item, const Context& ctx, const Context& shutdown) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            while (m_items.size() >= m_capacity) {
                if (ctx.is_cancelled() || shutdown.is_cancelled()) {
                    return false;
                }
                m_not_full.wait_for(lock, WAIT_SLICE);
            }
            m_items.push_back(std::move(item));
        }
        m_not_empty.notify_one();
        return true;
    }

    bool try_pop(T& item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_items.empty()) {
                return false;
            }
            item = std::move(m_items.front());
            m_items.pop_front();
        }
        m_not_full.notify_one();
        return true;
    }

    /**
     * @brief 阻塞读取，ctx 取消时返回 false
     */
    bool pop(T& item, const Context& ctx) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            while (m_items.empty()) {
                if (ctx.is_cancelled()) {
                    return false;
                }
                m_not_empty.wait_for(lock, WAIT_SLICE);
            }
            item = std::move(m_items.front());
            m_items.pop_front();
        }
        m_not_full.notify_one();
        return true;
    }

    /**
     * @brief 至多等待 timeout
     */
    bool pop_for(T& item, std::chrono::milliseconds timeout) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_not_empty.wait_for(lock, timeout, [this] { return !m_items.empty(); })) {
                return false;
            }
            item = std::move(m_items.front());
            m_items.pop_front();
        }
        m_not_full.notify_one();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

private:
    static constexpr std::chrono::milliseconds WAIT_SLICE { 20 };

    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
    std::deque<T> m_items;
};

} // namespace edgebridge
