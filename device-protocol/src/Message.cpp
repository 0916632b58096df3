#include <edgebridge/protocol/Message.hpp>
#include <cstdio>

namespace edgebridge {
namespace protocol {

const char *to_string(CommandType type) {
	switch (type) {
		case CommandType::Restart: return "RESTART";
		case CommandType::Shutdown: return "SHUTDOWN";
		case CommandType::ResetConfig: return "RESET_CONFIG";
		case CommandType::UpdateFirmware: return "UPDATE_FIRMWARE";
		case CommandType::RunDiagnostic: return "RUN_DIAGNOSTIC";
		case CommandType::SetParameter: return "SET_PARAMETER";
	}
	return "UNKNOWN";
}

std::string Message::to_string() const {
	char buf[64];
	std::snprintf(buf, sizeof(buf), "Message{Type: 0x%02X, Seq: %u, PayloadLen: %zu}",
	              type, static_cast<unsigned>(sequence), payload.size());
	return buf;
}

Message make_ping(uint8_t sequence) {
	Message msg;
	msg.type = MessageType::PING;
	msg.sequence = sequence;
	return msg;
}

Message make_pong(uint8_t sequence) {
	Message msg;
	msg.type = MessageType::PONG;
	msg.sequence = sequence;
	return msg;
}

Message make_metrics_request(uint8_t sequence, const std::vector<MetricType> &types) {
	Message msg;
	msg.type = MessageType::REQUEST_METRICS;
	msg.sequence = sequence;
	if (types.empty()) {
		msg.payload.push_back(static_cast<uint8_t>(MetricType::All));
	} else {
		msg.payload.reserve(types.size());
		for (MetricType t : types) {
			msg.payload.push_back(static_cast<uint8_t>(t));
		}
	}
	return msg;
}

Message make_status_request(uint8_t sequence) {
	Message msg;
	msg.type = MessageType::GET_STATUS;
	msg.sequence = sequence;
	return msg;
}

Message make_command(uint8_t sequence, CommandType type, const std::vector<uint8_t> &params) {
	Message msg;
	msg.type = MessageType::EXECUTE_COMMAND;
	msg.sequence = sequence;
	msg.payload.reserve(1 + params.size());
	msg.payload.push_back(static_cast<uint8_t>(type));
	msg.payload.insert(msg.payload.end(), params.begin(), params.end());
	return msg;
}

} // namespace protocol
} // namespace edgebridge
