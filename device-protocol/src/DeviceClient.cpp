#include <edgebridge/protocol/DeviceClient.hpp>
#include <edgebridge/Logger.hpp>
#include <algorithm>
#include <array>

namespace edgebridge {
namespace protocol {

namespace {
// 单次 receive 的最长等待，保证能及时响应取消
constexpr std::chrono::milliseconds RECEIVE_SLICE(100);
} // namespace

DeviceClient::DeviceClient(std::unique_ptr<ITransport> transport, std::chrono::milliseconds response_timeout)
    : m_transport(std::move(transport))
    , m_response_timeout(response_timeout)
    , m_sequence(0)
    , m_connected(false) {
}

DeviceClient::~DeviceClient() {
	close();
}

StatusCode DeviceClient::connect(const Context &ctx) {
	if (!m_transport) {
		return StatusCode::NotInitialized;
	}
	if (ctx.is_cancelled()) {
		return StatusCode::Cancelled;
	}

	std::lock_guard<std::mutex> lock(m_io_mutex);
	if (m_connected.load()) {
		return StatusCode::OK;
	}

	StatusCode status = m_transport->open(ctx.remaining(m_response_timeout));
	if (status != StatusCode::OK) {
		return status;
	}

	m_parser.reset();
	m_connected.store(true);
	log(LOG_INFO, "[Device] Connected via " + m_transport->type());
	return StatusCode::OK;
}

StatusCode DeviceClient::close() {
	std::lock_guard<std::mutex> lock(m_io_mutex);
	m_connected.store(false);
	if (!m_transport) {
		return StatusCode::OK;
	}
	return m_transport->close();
}

bool DeviceClient::is_connected() const {
	return m_connected.load();
}

void DeviceClient::set_event_callback(EventCallback callback) {
	std::lock_guard<std::mutex> lock(m_callback_mutex);
	m_event_callback = std::move(callback);
}

uint32_t DeviceClient::crc_errors() const {
	std::lock_guard<std::mutex> lock(m_io_mutex);
	return m_parser.crc_errors();
}

std::string DeviceClient::transport_type() const {
	return m_transport ? m_transport->type() : std::string();
}

uint8_t DeviceClient::next_sequence() {
	return ++m_sequence;
}

void DeviceClient::mark_disconnected() {
	if (m_connected.exchange(false)) {
		log(LOG_ERROR, "[Device] Link lost on " + m_transport->type());
	}
	m_transport->close();
	m_parser.reset();
}

/**
 * @details 在截止时间内分片读取；同一读缓冲中解析出的事件帧在释放锁后统一回调，
 *          序列号不符的响应视为过期响应丢弃
 */
StatusCode DeviceClient::send_and_wait(const Context &ctx, const Message &request, Message &response) {
	std::vector<Message> events;
	StatusCode status = StatusCode::Timeout;

	{
		std::lock_guard<std::mutex> lock(m_io_mutex);
		if (!m_connected.load()) {
			return StatusCode::NotConnected;
		}

		Message outgoing = request;
		outgoing.sequence = next_sequence();

		std::vector<uint8_t> frame;
		status = build_frame(outgoing, frame);
		if (status != StatusCode::OK) {
			return status;
		}

		status = m_transport->send(frame);
		if (status != StatusCode::OK) {
			mark_disconnected();
			return StatusCode::NotConnected;
		}

		const auto deadline = Context::Clock::now() + std::min(m_response_timeout, ctx.remaining(m_response_timeout));
		std::array<uint8_t, 1024> buffer;
		bool matched = false;
		status = StatusCode::Timeout;

		while (!matched) {
			if (ctx.is_cancelled()) {
				status = StatusCode::Cancelled;
				break;
			}
			const auto now = Context::Clock::now();
			if (now >= deadline) {
				status = StatusCode::Timeout;
				break;
			}
			const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

			size_t received = 0;
			StatusCode rc = m_transport->receive(buffer.data(), buffer.size(), std::min(left, RECEIVE_SLICE), received);
			if (rc != StatusCode::OK) {
				mark_disconnected();
				status = StatusCode::NotConnected;
				break;
			}

			for (size_t i = 0; i < received; ++i) {
				if (!m_parser.parse_byte(buffer[i])) {
					continue;
				}
				Message msg;
				const StatusCode parsed = m_parser.get_message(msg);
				m_parser.reset();
				if (parsed != StatusCode::OK) {
					continue;
				}

				if (msg.is_event()) {
					events.push_back(std::move(msg));
				} else if (!matched && msg.is_response() && msg.sequence == outgoing.sequence) {
					response = std::move(msg);
					matched = true;
					status = StatusCode::OK;
				} else {
					log(LOG_DEBUG, "[Device] Discarding stale frame " + msg.to_string());
				}
			}
		}
	}

	if (!events.empty()) {
		std::lock_guard<std::mutex> lock(m_callback_mutex);
		if (m_event_callback) {
			for (const auto &event : events) {
				m_event_callback(event);
			}
		}
	}
	return status;
}

StatusCode DeviceClient::ping(const Context &ctx) {
	Message response;
	StatusCode status = send_and_wait(ctx, make_ping(0), response);
	if (status != StatusCode::OK) {
		return status;
	}
	return response.type == MessageType::PONG ? StatusCode::OK : StatusCode::Error;
}

StatusCode DeviceClient::request_metrics(const Context &ctx, const std::vector<MetricType> &types,
                                         std::vector<Metric> &metrics) {
	Message response;
	StatusCode status = send_and_wait(ctx, make_metrics_request(0, types), response);
	if (status != StatusCode::OK) {
		return status;
	}
	if (response.type != MessageType::METRICS_RESPONSE) {
		log(LOG_ERROR, "[Device] Unexpected response to metrics request: " + response.to_string());
		return StatusCode::Error;
	}
	return decode_metrics(response.payload, metrics);
}

StatusCode DeviceClient::request_status(const Context &ctx, StatusPayload &status_payload) {
	Message response;
	StatusCode status = send_and_wait(ctx, make_status_request(0), response);
	if (status != StatusCode::OK) {
		return status;
	}
	if (response.type != MessageType::STATUS_RESPONSE) {
		return StatusCode::Error;
	}
	return decode_status(response.payload, status_payload);
}

StatusCode DeviceClient::execute_command(const Context &ctx, CommandType type, const std::vector<uint8_t> &params,
                                         CommandResultPayload &result) {
	Message response;
	StatusCode status = send_and_wait(ctx, make_command(0, type, params), response);
	if (status != StatusCode::OK) {
		return status;
	}
	if (response.type != MessageType::COMMAND_RESULT) {
		log(LOG_ERROR, "[Device] Unexpected response to command " + std::string(to_string(type)));
		return StatusCode::Error;
	}
	return decode_command_result(response.payload, result);
}

StatusCode DeviceClient::execute_command(CommandType type, const std::vector<uint8_t> &params,
                                         CommandResultPayload &result) {
	return execute_command(Context::background(), type, params, result);
}

} // namespace protocol
} // namespace edgebridge
