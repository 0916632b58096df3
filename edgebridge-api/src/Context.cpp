#include <edgebridge/Context.hpp>
#include <algorithm>

namespace edgebridge {

Context::Context() : m_state(std::make_shared<State>()) {
}

Context::Context(std::shared_ptr<State> state) : m_state(std::move(state)) {
}

Context Context::background() {
	return Context();
}

Context Context::with_cancel(const Context &parent) {
	auto state = std::make_shared<State>();
	{
		std::lock_guard<std::mutex> lock(parent.m_state->mutex);
		state->has_deadline = parent.m_state->has_deadline;
		state->deadline = parent.m_state->deadline;
	}
	attach(parent.m_state, state);
	return Context(state);
}

Context Context::with_timeout(const Context &parent, std::chrono::milliseconds timeout) {
	Context child = with_cancel(parent);
	const Clock::time_point deadline = Clock::now() + timeout;
	std::lock_guard<std::mutex> lock(child.m_state->mutex);
	if (!child.m_state->has_deadline || deadline < child.m_state->deadline) {
		child.m_state->deadline = deadline;
		child.m_state->has_deadline = true;
	}
	return child;
}

Context Context::any_of(const Context &first, const Context &second) {
	Context child = with_cancel(first);
	{
		std::lock_guard<std::mutex> lock(second.m_state->mutex);
		if (second.m_state->has_deadline) {
			std::lock_guard<std::mutex> child_lock(child.m_state->mutex);
			if (!child.m_state->has_deadline || second.m_state->deadline < child.m_state->deadline) {
				child.m_state->deadline = second.m_state->deadline;
				child.m_state->has_deadline = true;
			}
		}
	}
	attach(second.m_state, child.m_state);
	return child;
}

void Context::cancel() const {
	cancel_state(m_state);
}

bool Context::is_cancelled() const {
	std::lock_guard<std::mutex> lock(m_state->mutex);
	if (m_state->cancelled) {
		return true;
	}
	return m_state->has_deadline && Clock::now() >= m_state->deadline;
}

bool Context::wait_for(std::chrono::milliseconds timeout) const {
	std::unique_lock<std::mutex> lock(m_state->mutex);
	Clock::time_point until = Clock::now() + timeout;
	if (m_state->has_deadline && m_state->deadline < until) {
		until = m_state->deadline;
	}
	m_state->cv.wait_until(lock, until, [this] { return m_state->cancelled; });
	if (m_state->cancelled) {
		return true;
	}
	return m_state->has_deadline && Clock::now() >= m_state->deadline;
}

std::chrono::milliseconds Context::remaining(std::chrono::milliseconds fallback) const {
	std::lock_guard<std::mutex> lock(m_state->mutex);
	if (!m_state->has_deadline) {
		return fallback;
	}
	auto left = std::chrono::duration_cast<std::chrono::milliseconds>(m_state->deadline - Clock::now());
	return std::max(left, std::chrono::milliseconds(0));
}

bool Context::has_deadline() const {
	std::lock_guard<std::mutex> lock(m_state->mutex);
	return m_state->has_deadline;
}

void Context::attach(const std::shared_ptr<State> &parent, const std::shared_ptr<State> &child) {
	bool parent_cancelled = false;
	{
		std::lock_guard<std::mutex> lock(parent->mutex);
		if (parent->cancelled) {
			parent_cancelled = true;
		} else {
			// 顺带清理已释放的子上下文
			auto &children = parent->children;
			children.erase(std::remove_if(children.begin(), children.end(),
			                              [](const std::weak_ptr<State> &w) { return w.expired(); }),
			               children.end());
			children.push_back(child);
		}
	}
	if (parent_cancelled) {
		cancel_state(child);
	}
}

void Context::cancel_state(const std::shared_ptr<State> &state) {
	std::vector<std::weak_ptr<State>> children;
	{
		std::lock_guard<std::mutex> lock(state->mutex);
		if (state->cancelled) {
			return;
		}
		state->cancelled = true;
		children.swap(state->children);
	}
	state->cv.notify_all();

	for (const auto &weak : children) {
		if (auto child = weak.lock()) {
			cancel_state(child);
		}
	}
}

} // namespace edgebridge
