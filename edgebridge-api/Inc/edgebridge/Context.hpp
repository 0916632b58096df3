#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace edgebridge {

/**
 * @brief 可取消的调用上下文，可带截止时间
 *
 * 拷贝共享同一状态。取消会向下传递给派生出的子上下文，
 * 子上下文的取消不影响父上下文。
 */
class Context {
public:
	using Clock = std::chrono::steady_clock;

	/**
	 * @brief 永不取消、无截止时间的根上下文
	 */
	static Context background();

	/**
	 * @brief 派生可手动取消的子上下文
	 */
	static Context with_cancel(const Context &parent);

	/**
	 * @brief 派生带超时的子上下文，截止时间不晚于父上下文
	 */
	static Context with_timeout(const Context &parent, std::chrono::milliseconds timeout);

	/**
	 * @brief 派生子上下文，任一父上下文取消即取消
	 */
	static Context any_of(const Context &first, const Context &second);

	/**
	 * @brief 取消本上下文及其所有子上下文，可重复调用
	 */
	void cancel() const;

	/**
	 * @brief 是否已取消或已超过截止时间
	 */
	bool is_cancelled() const;

	/**
	 * @brief 等待至多 timeout
	 * @return true 表示等待期间上下文被取消（或到达截止时间）
	 */
	bool wait_for(std::chrono::milliseconds timeout) const;

	/**
	 * @brief 距截止时间的剩余时间；无截止时间时返回 fallback
	 */
	std::chrono::milliseconds remaining(std::chrono::milliseconds fallback) const;

	bool has_deadline() const;

private:
	struct State {
		std::mutex mutex;
		std::condition_variable cv;
		bool cancelled { false };
		bool has_deadline { false };
		Clock::time_point deadline;
		std::vector<std::weak_ptr<State>> children;
	};

	Context();
	explicit Context(std::shared_ptr<State> state);

	static void attach(const std::shared_ptr<State> &parent, const std::shared_ptr<State> &child);
	static void cancel_state(const std::shared_ptr<State> &state);

	std::shared_ptr<State> m_state;
};

} // namespace edgebridge
