#include "BridgeService.hpp"
#include <edgebridge/Logger.hpp>
#include <edgebridge/protocol/Transport.hpp>
#include <chrono>

namespace edgebridge {

namespace {
constexpr std::chrono::milliseconds DEFAULT_RESPONSE_TIMEOUT(5000);
} // namespace

BridgeService::BridgeService()
    : m_running(false)
    , m_initialized(false)
    , m_consumed(0)
    , m_run_ctx(Context::with_cancel(Context::background())) {
    m_plugin_manager = std::make_unique<PluginManager>();
    m_config_manager = std::make_unique<ConfigManager>();
}

/**
 * @brief 析构函数
 * @details 先停止管理器并释放适配器，再卸载插件
 */
BridgeService::~BridgeService() {
    stop();
    m_adapter_manager.reset();
    m_command_executor.reset();
    m_device_client.reset();
}

/**
 * @brief 初始化服务
 * @param config_file 配置文件路径
 * @return true 初始化成功，false 初始化失败
 * @details 加载并验证配置、设置日志级别、加载插件、创建适配器和命令通道
 */
bool BridgeService::initialize(const std::string& config_file) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_initialized) {
        log(LOG_INFO, "Service already initialized");
        return true;
    }

    if (!m_config_manager->load_config(config_file)) {
        log(LOG_ERROR, "Failed to load config file: " + config_file);
        return false;
    }
    if (!m_config_manager->validate_config()) {
        log(LOG_ERROR, "Invalid configuration");
        return false;
    }

    const ServiceConfig& config = m_config_manager->get_service_config();
    set_log_level(config.log_level);

    int loaded_count = m_plugin_manager->load_plugins(config.plugin_dir);
    log(LOG_INFO, "Loaded " + std::to_string(loaded_count) + " plugins");

    m_adapter_manager = std::make_unique<AdapterManager>(config.manager);
    if (!initialize_adapters()) {
        log(LOG_ERROR, "Failed to initialize adapters");
        return false;
    }
    if (!initialize_command_device()) {
        log(LOG_ERROR, "Failed to initialize command device");
        return false;
    }

    m_initialized = true;
    log(LOG_INFO, "Service initialized successfully");
    return true;
}

/**
 * @brief 为每个启用的配置段创建独立的适配器实例
 */
bool BridgeService::initialize_adapters() {
    for (const auto& device : m_config_manager->get_all_devices()) {
        if (!device.enabled) {
            log(LOG_INFO, "Skipping disabled adapter: " + device.name);
            continue;
        }

        std::shared_ptr<IAdapter> adapter = m_plugin_manager->create_adapter_instance(device.adapter_type);
        if (!adapter) {
            log(LOG_ERROR, "Plugin not found for " + device.name + ": " + device.adapter_type);
            return false;
        }

        StatusCode status = adapter->init(device.adapter_config);
        if (status != StatusCode::OK) {
            log(LOG_ERROR, "Failed to initialize adapter " + device.name + ": " + to_string(status));
            return false;
        }

        status = m_adapter_manager->register_adapter(adapter);
        if (status != StatusCode::OK) {
            log(LOG_ERROR, "Failed to register adapter " + device.name + ": " + to_string(status));
            return false;
        }
    }
    return true;
}

bool BridgeService::initialize_command_device() {
    const ServiceConfig& config = m_config_manager->get_service_config();
    if (config.command_device.empty()) {
        return true;
    }

    const DeviceConfig* device = m_config_manager->get_device_config(config.command_device);
    if (!device) {
        return false;
    }

    std::unique_ptr<protocol::ITransport> transport = protocol::create_transport(device->adapter_config);
    if (!transport) {
        log(LOG_ERROR, "Incomplete transport options in section " + device->name);
        return false;
    }

    std::chrono::milliseconds timeout = DEFAULT_RESPONSE_TIMEOUT;
    auto it = device->adapter_config.options.find("response_timeout_ms");
    if (it != device->adapter_config.options.end()) {
        try {
            timeout = std::chrono::milliseconds(std::stoi(it->second));
        } catch (const std::exception&) {
            log(LOG_ERROR, "Invalid response_timeout_ms in section " + device->name);
            return false;
        }
    }

    m_device_client = std::make_unique<protocol::DeviceClient>(std::move(transport), timeout);
    m_command_executor = std::make_unique<CommandExecutor>(m_device_client.get(), m_cloud_client.get(),
                                                           config.station_id);
    log(LOG_INFO, "Command device: " + device->name + " (" + m_device_client->transport_type() + ")");
    return true;
}

/**
 * @brief 启动服务
 * @return true 启动成功，false 启动失败
 * @details 启动 AdapterManager 与输出队列消费线程
 */
bool BridgeService::start() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_initialized) {
        log(LOG_ERROR, "Service not initialized");
        return false;
    }
    if (m_running) {
        log(LOG_INFO, "Service already running");
        return true;
    }

    StatusCode status = m_adapter_manager->start(m_run_ctx);
    if (status != StatusCode::OK) {
        log(LOG_ERROR, "Failed to start adapter manager: " + std::string(to_string(status)));
        return false;
    }

    m_running = true;
    m_consumer_thread = std::thread(&BridgeService::consume_metrics, this);
    if (m_command_executor && m_command_executor->has_cloud_client()) {
        m_command_thread = std::thread(&BridgeService::command_loop, this);
    }

    log(LOG_INFO, "Service started successfully");
    return true;
}

void BridgeService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
    }

    m_run_ctx.cancel();
    if (m_consumer_thread.joinable()) {
        m_consumer_thread.join();
    }
    if (m_command_thread.joinable()) {
        m_command_thread.join();
    }

    m_adapter_manager->stop();
    if (m_device_client) {
        m_device_client->close();
    }
    log(LOG_INFO, "Service stopped");
}

bool BridgeService::is_running() const {
    return m_running;
}

/**
 * @brief 获取服务状态
 * @return 服务状态字符串
 */
std::string BridgeService::get_service_status() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string status = "Service Status:\n";
    status += "  Running: " + std::string(m_running ? "Yes" : "No") + "\n";
    status += "  Initialized: " + std::string(m_initialized ? "Yes" : "No") + "\n";
    status += "  Loaded Plugins: " + std::to_string(m_plugin_manager->get_loaded_plugins().size()) + "\n";

    if (m_adapter_manager) {
        const auto reports = m_adapter_manager->collect_report();
        for (const auto& pair : m_adapter_manager->status()) {
            status += "  Adapter " + pair.first + ": " + (pair.second ? "connected" : "disconnected");
            auto it = reports.find(pair.first);
            if (it != reports.end()) {
                status += ", last " + std::string(to_string(it->second.last_status)) + ", " +
                          std::to_string(it->second.metric_count) + " metrics, " +
                          std::to_string(it->second.consecutive_failures) + " consecutive failures";
            }
            status += "\n";
        }
        status += "  Dropped Metrics: " + std::to_string(m_adapter_manager->dropped_metrics()) + "\n";
    }
    status += "  Consumed Metrics: " + std::to_string(m_consumed.load()) + "\n";
    return status;
}

bool BridgeService::verify_config_reload() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigManager candidate = *m_config_manager;
    return candidate.reload_config() && candidate.validate_config();
}

void BridgeService::set_cloud_client(std::shared_ptr<ICloudClient> cloud) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cloud_client = std::move(cloud);
    if (m_command_executor) {
        m_command_executor->set_cloud_client(m_cloud_client.get());
    }
}

/**
 * @brief 命令链路按需连接
 */
StatusCode BridgeService::ensure_command_device(const Context& ctx) {
    if (m_device_client->is_connected()) {
        return StatusCode::OK;
    }
    StatusCode status = m_device_client->connect(ctx);
    if (status != StatusCode::OK) {
        log(LOG_ERROR, "Cannot connect command device: " + std::string(to_string(status)));
    }
    return status;
}

/**
 * @brief 命令拉取线程
 * @details 设备链路不可用时仍然处理命令，失败结果照常上报
 */
void BridgeService::command_loop() {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_config_manager->get_service_config().command_poll_interval);
    while (!m_run_ctx.wait_for(interval)) {
        if (ensure_command_device(m_run_ctx) != StatusCode::OK) {
            log(LOG_DEBUG, "Command device unavailable, pending commands will fail");
        }
        StatusCode status = m_command_executor->process_pending_commands();
        if (status != StatusCode::OK) {
            log(LOG_ERROR, "Error processing commands: " + std::string(to_string(status)));
        }
    }
}

StatusCode BridgeService::execute_local_command(protocol::CommandType type, const std::vector<uint8_t>& params,
                                                protocol::CommandResultPayload& result) {
    if (!m_command_executor || !m_device_client) {
        return StatusCode::NotInitialized;
    }
    StatusCode status = ensure_command_device(Context::background());
    if (status != StatusCode::OK) {
        return status;
    }
    return m_command_executor->execute_local_command(type, params, result);
}

void BridgeService::consume_metrics() {
    Metric metric;
    while (m_adapter_manager->metrics().pop(metric, m_run_ctx)) {
        ++m_consumed;
        log(LOG_DEBUG, "Metric " + metric_type_name(metric.type) + " = " + std::to_string(metric.value));
    }
}

} // namespace edgebridge
