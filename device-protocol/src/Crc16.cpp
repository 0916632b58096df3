#include <edgebridge/protocol/Crc16.hpp>
#include <array>

namespace edgebridge {
namespace protocol {

namespace {

std::array<uint16_t, 256> build_table() {
	std::array<uint16_t, 256> table {};
	for (uint16_t i = 0; i < 256; ++i) {
		uint16_t crc = static_cast<uint16_t>(i << 8);
		for (int bit = 0; bit < 8; ++bit) {
			crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ CRC16_POLYNOMIAL)
			                     : static_cast<uint16_t>(crc << 1);
		}
		table[i] = crc;
	}
	return table;
}

const std::array<uint16_t, 256> &crc_table() {
	static const std::array<uint16_t, 256> table = build_table();
	return table;
}

} // namespace

uint16_t crc16_update(uint16_t crc, const uint8_t *data, size_t len) {
	const auto &table = crc_table();
	for (size_t i = 0; i < len; ++i) {
		crc = static_cast<uint16_t>((crc << 8) ^ table[((crc >> 8) ^ data[i]) & 0xFF]);
	}
	return crc;
}

uint16_t crc16(const uint8_t *data, size_t len) {
	return crc16_update(CRC16_INITIAL, data, len);
}

} // namespace protocol
} // namespace edgebridge
