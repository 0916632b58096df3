#pragma once

#include <edgebridge/Types.hpp>
#include "edgebridge/protocol/Message.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace edgebridge {
namespace protocol {

/**
 * @brief 解析器状态，描述当前帧的解码进度
 */
enum class ParserState {
	Idle,
	Header1,
	Length,
	Type,
	Sequence,
	Payload,
	Crc
};

/**
 * @brief 流式帧解析器
 *
 * 帧格式（大端）：[0xAA][0x55][Length:u16][Type:u8][Seq:u8][Payload][CRC16:u16]
 * 逐字节状态机，可处理串口/套接字任意切分的数据。
 * 不做内部同步，一个物理连接只能由一个读线程持有一个实例。
 */
class FrameParser {
public:
	FrameParser();

	/**
	 * @brief 处理一个字节
	 * @return 当且仅当一帧接收完整且 CRC 校验通过时返回 true
	 */
	bool parse_byte(uint8_t byte);

	/**
	 * @brief 取出已完成的消息
	 * @return StatusCode::OK；没有完整帧时返回 StatusCode::Incomplete
	 */
	StatusCode get_message(Message &msg) const;

	/**
	 * @brief 批量解析，收集所有校验通过的消息，每帧完成后自动 reset
	 */
	std::vector<Message> parse(const uint8_t *data, size_t len);
	std::vector<Message> parse(const std::vector<uint8_t> &data);

	/**
	 * @brief 复位到 Idle，开始下一帧前调用
	 */
	void reset();

	ParserState state() const { return m_state; }

	/** CRC 校验失败的帧数 */
	uint32_t crc_errors() const { return m_crc_errors; }

	/** 声明长度超过 MAX_PAYLOAD_LEN 被丢弃的帧数 */
	uint32_t length_errors() const { return m_length_errors; }

private:
	ParserState m_state;
	std::array<uint8_t, MAX_FRAME_SIZE> m_buffer;
	size_t m_buffer_pos;
	size_t m_payload_len;
	bool m_complete;
	uint32_t m_crc_errors;
	uint32_t m_length_errors;
};

/**
 * @brief 将消息序列化为待发送的帧
 * @return StatusCode::OK；载荷超过 MAX_PAYLOAD_LEN 时返回 StatusCode::InvalidParam
 */
StatusCode build_frame(const Message &msg, std::vector<uint8_t> &frame);

} // namespace protocol
} // namespace edgebridge
