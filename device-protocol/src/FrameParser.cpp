#include <edgebridge/protocol/FrameParser.hpp>
#include <edgebridge/protocol/Crc16.hpp>

namespace edgebridge {
namespace protocol {

FrameParser::FrameParser()
    : m_state(ParserState::Idle)
    , m_buffer{}
    , m_buffer_pos(0)
    , m_payload_len(0)
    , m_complete(false)
    , m_crc_errors(0)
    , m_length_errors(0) {
}

void FrameParser::reset() {
	m_state = ParserState::Idle;
	m_buffer_pos = 0;
	m_payload_len = 0;
	m_complete = false;
}

/**
 * @brief 逐字节状态机
 * @details Idle 扫描帧头；Header1 遇到重复的 0xAA 重新同步；
 *          长度超限或 CRC 不符时静默回到 Idle 并计数，不抛出错误
 */
bool FrameParser::parse_byte(uint8_t byte) {
	// 上一帧未 reset 就继续喂数据，视为开始新帧
	if (m_complete) {
		reset();
	}

	switch (m_state) {
		case ParserState::Idle:
			if (byte == HEADER_BYTE0) {
				m_buffer[0] = byte;
				m_buffer_pos = 1;
				m_state = ParserState::Header1;
			}
			return false;

		case ParserState::Header1:
			if (byte == HEADER_BYTE1) {
				m_buffer[1] = byte;
				m_buffer_pos = 2;
				m_state = ParserState::Length;
			} else if (byte == HEADER_BYTE0) {
				m_buffer[0] = byte;
				m_buffer_pos = 1;
			} else {
				m_state = ParserState::Idle;
			}
			return false;

		case ParserState::Length:
			m_buffer[m_buffer_pos++] = byte;
			if (m_buffer_pos == 4) {
				m_payload_len = (static_cast<size_t>(m_buffer[2]) << 8) | m_buffer[3];
				if (m_payload_len > MAX_PAYLOAD_LEN) {
					++m_length_errors;
					m_state = ParserState::Idle;
					return false;
				}
				m_state = ParserState::Type;
			}
			return false;

		case ParserState::Type:
			m_buffer[m_buffer_pos++] = byte;
			m_state = ParserState::Sequence;
			return false;

		case ParserState::Sequence:
			m_buffer[m_buffer_pos++] = byte;
			m_state = m_payload_len > 0 ? ParserState::Payload : ParserState::Crc;
			return false;

		case ParserState::Payload:
			m_buffer[m_buffer_pos++] = byte;
			if (m_buffer_pos >= HEADER_SIZE + m_payload_len) {
				m_state = ParserState::Crc;
			}
			return false;

		case ParserState::Crc: {
			m_buffer[m_buffer_pos++] = byte;
			const size_t frame_len = HEADER_SIZE + m_payload_len;
			if (m_buffer_pos < frame_len + CRC_SIZE) {
				return false;
			}
			// CRC 只覆盖帧头与载荷，不含 CRC 字段本身
			const uint16_t expected = crc16(m_buffer.data(), frame_len);
			const uint16_t actual = static_cast<uint16_t>((m_buffer[frame_len] << 8) | m_buffer[frame_len + 1]);
			if (expected != actual) {
				++m_crc_errors;
				m_state = ParserState::Idle;
				m_buffer_pos = 0;
				return false;
			}
			m_complete = true;
			return true;
		}
	}
	return false;
}

StatusCode FrameParser::get_message(Message &msg) const {
	if (!m_complete) {
		return StatusCode::Incomplete;
	}

	msg.type = m_buffer[4];
	msg.sequence = m_buffer[5];
	msg.payload.assign(m_buffer.begin() + HEADER_SIZE, m_buffer.begin() + HEADER_SIZE + m_payload_len);
	return StatusCode::OK;
}

std::vector<Message> FrameParser::parse(const uint8_t *data, size_t len) {
	std::vector<Message> messages;
	for (size_t i = 0; i < len; ++i) {
		if (!parse_byte(data[i])) {
			continue;
		}
		Message msg;
		if (get_message(msg) == StatusCode::OK) {
			messages.push_back(std::move(msg));
		}
		reset();
	}
	return messages;
}

std::vector<Message> FrameParser::parse(const std::vector<uint8_t> &data) {
	return parse(data.data(), data.size());
}

StatusCode build_frame(const Message &msg, std::vector<uint8_t> &frame) {
	const size_t payload_len = msg.payload.size();
	if (payload_len > MAX_PAYLOAD_LEN) {
		return StatusCode::InvalidParam;
	}

	frame.clear();
	frame.reserve(HEADER_SIZE + payload_len + CRC_SIZE);
	frame.push_back(HEADER_BYTE0);
	frame.push_back(HEADER_BYTE1);
	frame.push_back(static_cast<uint8_t>(payload_len >> 8));
	frame.push_back(static_cast<uint8_t>(payload_len & 0xFF));
	frame.push_back(msg.type);
	frame.push_back(msg.sequence);
	frame.insert(frame.end(), msg.payload.begin(), msg.payload.end());

	const uint16_t crc = crc16(frame.data(), frame.size());
	frame.push_back(static_cast<uint8_t>(crc >> 8));
	frame.push_back(static_cast<uint8_t>(crc & 0xFF));
	return StatusCode::OK;
}

} // namespace protocol
} // namespace edgebridge
