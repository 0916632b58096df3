#include "CommandExecutor.hpp"
#include <edgebridge/Logger.hpp>
#include <algorithm>
#include <cctype>

namespace edgebridge {

namespace {

struct CommandName {
    const char* name;
    protocol::CommandType type;
};

const CommandName COMMAND_NAMES[] = {
    { "RESTART", protocol::CommandType::Restart },
    { "SHUTDOWN", protocol::CommandType::Shutdown },
    { "RESET_CONFIG", protocol::CommandType::ResetConfig },
    { "UPDATE_FIRMWARE", protocol::CommandType::UpdateFirmware },
    { "RUN_DIAGNOSTIC", protocol::CommandType::RunDiagnostic },
    { "SET_PARAMETER", protocol::CommandType::SetParameter },
};

} // namespace

CommandExecutor::CommandExecutor(protocol::IDeviceDispatcher* dispatcher, ICloudClient* cloud,
                                 const std::string& station_id)
    : m_dispatcher(dispatcher), m_cloud(cloud), m_station_id(station_id) {
}

/**
 * @brief 处理云端待执行命令
 * @return 操作状态码
 * @details 每条命令执行后立即上报结果，上报失败不影响后续命令
 */
StatusCode CommandExecutor::process_pending_commands() {
    if (!m_cloud) {
        return StatusCode::NotInitialized;
    }

    std::vector<PendingCommand> commands;
    StatusCode status = m_cloud->get_pending_commands(m_station_id, commands);
    if (status != StatusCode::OK) {
        log(LOG_ERROR, "[Command] Failed to get pending commands: " + std::string(to_string(status)));
        return status;
    }

    for (const auto& command : commands) {
        log(LOG_INFO, "[Command] Processing command: " + command.id + " (type: " + command.type + ")");
        CommandResult result = execute_command(command);

        StatusCode report_status = m_cloud->report_command_result(m_station_id, command.id, result);
        if (report_status != StatusCode::OK) {
            log(LOG_ERROR, "[Command] Failed to report result of " + command.id + ": " + to_string(report_status));
        }
    }
    return StatusCode::OK;
}

CommandResult CommandExecutor::execute_command(const PendingCommand& command) {
    CommandResult result;

    protocol::CommandType type;
    if (!map_command_type(command.type, type)) {
        result.error = "unknown command type: " + command.type;
        return result;
    }

    protocol::CommandResultPayload payload;
    StatusCode status = execute_local_command(type, build_command_params(command.params), payload);
    if (status != StatusCode::OK) {
        result.error = "device command failed: " + std::string(to_string(status));
        return result;
    }

    result.success = payload.success;
    result.output = payload.output;
    result.return_code = payload.return_code;
    return result;
}

StatusCode CommandExecutor::execute_local_command(protocol::CommandType type, const std::vector<uint8_t>& params,
                                                  protocol::CommandResultPayload& result) {
    if (!m_dispatcher) {
        return StatusCode::NotInitialized;
    }
    return m_dispatcher->execute_command(type, params, result);
}

bool CommandExecutor::map_command_type(const std::string& name, protocol::CommandType& type) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto& entry : COMMAND_NAMES) {
        if (upper == entry.name) {
            type = entry.type;
            return true;
        }
    }
    return false;
}

std::vector<uint8_t> CommandExecutor::build_command_params(const std::map<std::string, std::string>& params) {
    std::string joined;
    for (const auto& pair : params) {
        if (!joined.empty()) {
            joined += ';';
        }
        joined += pair.first + "=" + pair.second;
    }
    return std::vector<uint8_t>(joined.begin(), joined.end());
}

} // namespace edgebridge
