#pragma once

#include <edgebridge/Types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace edgebridge {
namespace protocol {

// 帧格式常量
constexpr uint8_t HEADER_BYTE0 = 0xAA;
constexpr uint8_t HEADER_BYTE1 = 0x55;
constexpr size_t HEADER_SIZE = 6;   // Magic(2) + Length(2) + Type(1) + Seq(1)
constexpr size_t CRC_SIZE = 2;
constexpr size_t MAX_PAYLOAD_LEN = 4096;
constexpr size_t MAX_FRAME_SIZE = HEADER_SIZE + MAX_PAYLOAD_LEN + CRC_SIZE;

/**
 * @brief 消息类型：请求 0x01-0x07，响应 0x81-0x86，事件 0xA1-0xA4
 */
namespace MessageType {
	// 请求
	constexpr uint8_t PING = 0x01;
	constexpr uint8_t REQUEST_METRICS = 0x02;
	constexpr uint8_t GET_STATUS = 0x03;
	constexpr uint8_t SET_CONFIG = 0x04;
	constexpr uint8_t EXECUTE_COMMAND = 0x05;
	constexpr uint8_t START_STREAM = 0x06;
	constexpr uint8_t STOP_STREAM = 0x07;

	// 响应
	constexpr uint8_t PONG = 0x81;
	constexpr uint8_t METRICS_RESPONSE = 0x82;
	constexpr uint8_t STATUS_RESPONSE = 0x83;
	constexpr uint8_t CONFIG_ACK = 0x84;
	constexpr uint8_t COMMAND_RESULT = 0x85;
	constexpr uint8_t STREAM_ACK = 0x86;

	// 事件
	constexpr uint8_t METRICS_EVENT = 0xA1;
	constexpr uint8_t THRESHOLD_EXCEEDED = 0xA2;
	constexpr uint8_t DEVICE_STATE_CHANGE = 0xA3;
	constexpr uint8_t ERROR = 0xA4;
}

/**
 * @brief 可下发到设备的命令类型
 */
enum class CommandType : uint8_t {
	Restart = 0x01,
	Shutdown = 0x02,
	ResetConfig = 0x03,
	UpdateFirmware = 0x04,
	RunDiagnostic = 0x05,
	SetParameter = 0x06
};

const char *to_string(CommandType type);

/**
 * @brief 设备状态码
 */
enum class DeviceStatus : uint8_t {
	Ok = 0x00,
	Warning = 0x01,
	Error = 0x02,
	Critical = 0x03,
	Offline = 0x04
};

/**
 * @brief 帧协议承载的逻辑消息
 */
struct Message {
	uint8_t type { 0 };
	uint8_t sequence { 0 };
	std::vector<uint8_t> payload;

	bool is_request() const { return type >= 0x01 && type <= 0x07; }
	bool is_response() const { return type >= 0x81 && type <= 0x86; }
	bool is_event() const { return type >= 0xA1 && type <= 0xA4; }

	std::string to_string() const;

	bool operator==(const Message &other) const {
		return type == other.type && sequence == other.sequence && payload == other.payload;
	}
};

Message make_ping(uint8_t sequence);
Message make_pong(uint8_t sequence);

/**
 * @brief 指标请求；types 为空时请求全部指标（载荷为 MetricType::All）
 */
Message make_metrics_request(uint8_t sequence, const std::vector<MetricType> &types);

Message make_status_request(uint8_t sequence);

/**
 * @brief 命令消息，载荷为 [cmd][params...]
 */
Message make_command(uint8_t sequence, CommandType type, const std::vector<uint8_t> &params);

} // namespace protocol
} // namespace edgebridge
