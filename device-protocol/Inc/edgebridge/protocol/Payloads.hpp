#pragma once

#include <edgebridge/Types.hpp>
#include "edgebridge/protocol/Message.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace edgebridge {
namespace protocol {

// 单条指标编码长度：type(1) + float32 大端(4)
constexpr size_t METRIC_ENTRY_SIZE = 5;
constexpr size_t STATUS_PAYLOAD_SIZE = 9;

/**
 * @brief 设备状态响应
 */
struct StatusPayload {
	DeviceStatus status { DeviceStatus::Ok };
	uint32_t uptime { 0 };
	uint16_t errors { 0 };
	uint16_t warnings { 0 };
};

/**
 * @brief 命令执行结果
 */
struct CommandResultPayload {
	bool success { false };
	uint8_t return_code { 0 };
	std::string output;
};

/** 编码格式：[type][value f32 BE]... */
std::vector<uint8_t> encode_metrics(const std::vector<Metric> &metrics);

/**
 * @brief 解码指标载荷
 * @return 长度不是 METRIC_ENTRY_SIZE 整数倍时返回 StatusCode::InvalidParam
 */
StatusCode decode_metrics(const std::vector<uint8_t> &payload, std::vector<Metric> &metrics);

/** 编码格式：[status][uptime u32][errors u16][warnings u16] */
std::vector<uint8_t> encode_status(const StatusPayload &status);
StatusCode decode_status(const std::vector<uint8_t> &payload, StatusPayload &status);

/** 编码格式：[success(0=成功)][return_code][output_len u16][output] */
std::vector<uint8_t> encode_command_result(const CommandResultPayload &result);
StatusCode decode_command_result(const std::vector<uint8_t> &payload, CommandResultPayload &result);

} // namespace protocol
} // namespace edgebridge
