#include <edgebridge/protocol/Payloads.hpp>
#include <algorithm>
#include <cstring>

namespace edgebridge {
namespace protocol {

namespace {

void put_u16(std::vector<uint8_t> &buf, uint16_t v) {
	buf.push_back(static_cast<uint8_t>(v >> 8));
	buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(std::vector<uint8_t> &buf, uint32_t v) {
	buf.push_back(static_cast<uint8_t>(v >> 24));
	buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
	buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
	buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint16_t get_u16(const uint8_t *p) {
	return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t *p) {
	return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16)
	     | (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

} // namespace

std::vector<uint8_t> encode_metrics(const std::vector<Metric> &metrics) {
	std::vector<uint8_t> buf;
	buf.reserve(metrics.size() * METRIC_ENTRY_SIZE);
	for (const auto &m : metrics) {
		uint32_t bits;
		std::memcpy(&bits, &m.value, sizeof(bits));
		buf.push_back(static_cast<uint8_t>(m.type));
		put_u32(buf, bits);
	}
	return buf;
}

StatusCode decode_metrics(const std::vector<uint8_t> &payload, std::vector<Metric> &metrics) {
	metrics.clear();
	if (payload.size() % METRIC_ENTRY_SIZE != 0) {
		return StatusCode::InvalidParam;
	}

	const size_t count = payload.size() / METRIC_ENTRY_SIZE;
	metrics.reserve(count);
	for (size_t i = 0; i < count; ++i) {
		const uint8_t *entry = payload.data() + i * METRIC_ENTRY_SIZE;
		uint32_t bits = get_u32(entry + 1);
		Metric m;
		m.type = static_cast<MetricType>(entry[0]);
		std::memcpy(&m.value, &bits, sizeof(bits));
		metrics.push_back(m);
	}
	return StatusCode::OK;
}

std::vector<uint8_t> encode_status(const StatusPayload &status) {
	std::vector<uint8_t> buf;
	buf.reserve(STATUS_PAYLOAD_SIZE);
	buf.push_back(static_cast<uint8_t>(status.status));
	put_u32(buf, status.uptime);
	put_u16(buf, status.errors);
	put_u16(buf, status.warnings);
	return buf;
}

StatusCode decode_status(const std::vector<uint8_t> &payload, StatusPayload &status) {
	if (payload.size() < STATUS_PAYLOAD_SIZE) {
		return StatusCode::InvalidParam;
	}
	status.status = static_cast<DeviceStatus>(payload[0]);
	status.uptime = get_u32(&payload[1]);
	status.errors = get_u16(&payload[5]);
	status.warnings = get_u16(&payload[7]);
	return StatusCode::OK;
}

std::vector<uint8_t> encode_command_result(const CommandResultPayload &result) {
	std::vector<uint8_t> buf;
	const size_t output_len = std::min<size_t>(result.output.size(), 0xFFFF);
	buf.reserve(4 + output_len);
	buf.push_back(result.success ? 0x00 : 0x01);
	buf.push_back(result.return_code);
	put_u16(buf, static_cast<uint16_t>(output_len));
	buf.insert(buf.end(), result.output.begin(), result.output.begin() + output_len);
	return buf;
}

/**
 * @details 只有 2 字节（无输出长度字段）的结果也视为合法，输出为空；
 *          声明的输出长度超过剩余字节时按实际剩余截断
 */
StatusCode decode_command_result(const std::vector<uint8_t> &payload, CommandResultPayload &result) {
	if (payload.size() < 2) {
		return StatusCode::InvalidParam;
	}
	result.success = payload[0] == 0x00;
	result.return_code = payload[1];
	result.output.clear();
	if (payload.size() >= 4) {
		size_t output_len = get_u16(&payload[2]);
		output_len = std::min(output_len, payload.size() - 4);
		result.output.assign(payload.begin() + 4, payload.begin() + 4 + output_len);
	}
	return StatusCode::OK;
}

} // namespace protocol
} // namespace edgebridge
