#pragma once

#include <edgebridge/Types.hpp>
#include "AdapterManager.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace edgebridge {

/**
 * @brief 单个适配器实例的配置段
 */
struct DeviceConfig {
    std::string name;                    // 段名，即适配器实例名
    std::string adapter_type;            // 插件名（如 frame-adapter）
    bool enabled = true;
    AdapterConfig adapter_config;        // 选项与指标映射
    std::vector<std::string> invalid_mappings;   // 无法解析的 mapping 行，由 validate_config 报告
};

/**
 * @brief 服务配置信息
 */
struct ServiceConfig {
    std::string plugin_dir;              // 插件目录
    int log_level = 1;                   // 0=ERROR, 1=INFO, 2=DEBUG
    bool daemon_mode = false;
    std::string station_id;
    std::string command_device;          // 本地命令使用哪个配置段的链路
    std::chrono::seconds command_poll_interval { 10 };   // 拉取云端命令的周期
    ManagerConfig manager;
    std::vector<DeviceConfig> devices;
};

/**
 * @brief 配置管理器，负责解析 INI 风格的配置文件
 *
 * 全局 key=value 在前，每个 [section] 描述一个适配器实例，# 开头为注释。
 */
class ConfigManager {
public:
    ConfigManager();

    /**
     * @brief 从文件加载配置
     * @param config_file 配置文件路径
     * @return 是否加载成功
     */
    bool load_config(const std::string& config_file);

    /**
     * @brief 从字符串加载配置
     */
    bool load_from_string(const std::string& content);

    const ServiceConfig& get_service_config() const;

    /**
     * @brief 获取指定适配器段的配置
     * @return 不存在返回 nullptr
     */
    const DeviceConfig* get_device_config(const std::string& name) const;

    const std::vector<DeviceConfig>& get_all_devices() const;

    /**
     * @brief 验证配置是否有效
     * @param error 第一个错误的描述
     */
    bool validate_config(std::string& error) const;
    bool validate_config() const;

    /**
     * @brief 重新加载上次的配置文件
     */
    bool reload_config();

private:
    ServiceConfig m_config;
    std::string m_config_file;

    bool parse_config_content(const std::string& content, ServiceConfig& config);
    bool parse_global(const std::string& key, const std::string& value, ServiceConfig& config);
    void parse_device_entry(const std::string& key, const std::string& value, DeviceConfig& device);

    /**
     * @brief 解析映射，格式: id:<外部标识>,metric:<指标名>,scale:<f>,offset:<f>,desc:<描述>
     */
    bool parse_mapping(const std::string& value, MetricMapping& mapping);

    bool parse_key_value(const std::string& line, std::string& key, std::string& value) const;
    std::string trim(const std::string& str) const;
    void set_default_config(ServiceConfig& config) const;
};

} // namespace edgebridge
