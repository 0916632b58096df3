#pragma once

#include <edgebridge/Context.hpp>
#include <edgebridge/Types.hpp>
#include <edgebridge/protocol/DeviceClient.hpp>
#include "AdapterManager.hpp"
#include "CommandExecutor.hpp"
#include "ConfigManager.hpp"
#include "PluginManager.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace edgebridge {

/**
 * @brief 边缘桥接服务主类
 *
 * 根据配置加载插件、创建并注册适配器，启动 AdapterManager，
 * 并消费其输出队列。停止后不可再次启动，重新加载配置需新建实例。
 */
class BridgeService {
public:
    BridgeService();
    ~BridgeService();

    /**
     * @brief 初始化服务
     * @param config_file 配置文件路径
     * @return 是否初始化成功
     */
    bool initialize(const std::string& config_file);

    /**
     * @brief 启动采集
     * @return 是否启动成功
     */
    bool start();

    void stop();

    bool is_running() const;

    /**
     * @brief 获取服务状态
     * @return 多行文本：运行状态、插件、适配器连接情况和采集统计
     */
    std::string get_service_status() const;

    /**
     * @brief 通过 command_device 链路直接下发命令
     * @return 未配置 command_device 时返回 NotInitialized
     */
    StatusCode execute_local_command(protocol::CommandType type, const std::vector<uint8_t>& params,
                                     protocol::CommandResultPayload& result);

    /**
     * @brief 重新读取配置文件并校验，不影响正在运行的实例
     * @return 新配置可用时返回 true；SIGHUP 据此决定是否重建服务
     */
    bool verify_config_reload() const;

    /**
     * @brief 设置云端命令接口，需在 start() 之前调用
     * @details 同时配置了 command_device 时，start() 启动命令拉取线程，
     *          每隔 command_poll_interval 处理一次待执行命令
     */
    void set_cloud_client(std::shared_ptr<ICloudClient> cloud);

    /** 已从输出队列消费的指标数 */
    uint64_t consumed_metrics() const { return m_consumed; }

private:
    bool initialize_adapters();
    bool initialize_command_device();
    void consume_metrics();
    void command_loop();
    StatusCode ensure_command_device(const Context& ctx);

    std::unique_ptr<PluginManager> m_plugin_manager;
    std::unique_ptr<ConfigManager> m_config_manager;
    std::unique_ptr<AdapterManager> m_adapter_manager;
    std::unique_ptr<protocol::DeviceClient> m_device_client;
    std::unique_ptr<CommandExecutor> m_command_executor;
    std::shared_ptr<ICloudClient> m_cloud_client;

    std::atomic<bool> m_running;
    std::atomic<bool> m_initialized;
    std::atomic<uint64_t> m_consumed;

    mutable std::mutex m_mutex;
    Context m_run_ctx;
    std::thread m_consumer_thread;
    std::thread m_command_thread;
};

} // namespace edgebridge
