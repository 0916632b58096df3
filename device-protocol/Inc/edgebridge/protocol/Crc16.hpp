#pragma once

#include <cstddef>
#include <cstdint>

namespace edgebridge {
namespace protocol {

// CRC-16/CCITT-FALSE：多项式 0x1021，初值 0xFFFF，不反射，无结果异或
constexpr uint16_t CRC16_INITIAL = 0xFFFF;
constexpr uint16_t CRC16_POLYNOMIAL = 0x1021;

/**
 * @brief 计算数据的 CRC16
 */
uint16_t crc16(const uint8_t *data, size_t len);

/**
 * @brief 在已有 CRC 基础上继续累加数据（流式计算），首次传入 CRC16_INITIAL
 */
uint16_t crc16_update(uint16_t crc, const uint8_t *data, size_t len);

} // namespace protocol
} // namespace edgebridge
