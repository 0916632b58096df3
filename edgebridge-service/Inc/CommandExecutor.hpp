#pragma once

#include <edgebridge/Types.hpp>
#include <edgebridge/protocol/DeviceClient.hpp>
#include <map>
#include <string>
#include <vector>

namespace edgebridge {

/**
 * @brief 云端下发的待执行命令
 */
struct PendingCommand {
    std::string id;
    std::string type;                              // 如 "RESTART"，不区分大小写
    std::map<std::string, std::string> params;
};

/**
 * @brief 上报给云端的命令执行结果
 */
struct CommandResult {
    bool success = false;
    std::string output;
    int return_code = 0;
    std::string error;
};

/**
 * @brief 云端命令接口
 */
class ICloudClient {
public:
    virtual ~ICloudClient() = default;

    virtual StatusCode get_pending_commands(const std::string& station_id,
                                            std::vector<PendingCommand>& commands) = 0;

    virtual StatusCode report_command_result(const std::string& station_id,
                                             const std::string& command_id,
                                             const CommandResult& result) = 0;
};

/**
 * @brief 命令执行器：拉取云端命令，翻译成设备协议命令并上报结果
 */
class CommandExecutor {
public:
    /**
     * @param dispatcher 设备命令通道，不可为空
     * @param cloud 云端接口，仅执行本地命令时可为空
     */
    CommandExecutor(protocol::IDeviceDispatcher* dispatcher, ICloudClient* cloud, const std::string& station_id);

    /**
     * @brief 拉取并逐条执行待处理命令
     * @return 拉取失败时返回对应状态码；单条命令的执行或上报失败只记录日志
     */
    StatusCode process_pending_commands();

    /**
     * @brief 不经过云端直接下发命令
     */
    StatusCode execute_local_command(protocol::CommandType type, const std::vector<uint8_t>& params,
                                     protocol::CommandResultPayload& result);

    CommandResult execute_command(const PendingCommand& command);

    /**
     * @brief 云端命令名称映射为协议命令类型（不区分大小写）
     */
    static bool map_command_type(const std::string& name, protocol::CommandType& type);

    /**
     * @brief 参数序列化为 "k1=v1;k2=v2"，按键名排序
     */
    static std::vector<uint8_t> build_command_params(const std::map<std::string, std::string>& params);

    const std::string& station_id() const { return m_station_id; }

    /** 在开始拉取命令之前设置 */
    void set_cloud_client(ICloudClient* cloud) { m_cloud = cloud; }
    bool has_cloud_client() const { return m_cloud != nullptr; }

private:
    protocol::IDeviceDispatcher* m_dispatcher;
    ICloudClient* m_cloud;
    std::string m_station_id;
};

} // namespace edgebridge
