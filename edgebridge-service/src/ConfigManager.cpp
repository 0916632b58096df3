#include "ConfigManager.hpp"
#include <edgebridge/Logger.hpp>
#include <fstream>
#include <set>
#include <sstream>

namespace edgebridge {

namespace {

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

bool parse_int(const std::string& value, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(value, &pos);
        return pos == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_float(const std::string& value, float& out) {
    try {
        size_t pos = 0;
        out = std::stof(value, &pos);
        return pos == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

ConfigManager::ConfigManager() {
    set_default_config(m_config);
}

/**
 * @brief 从指定文件加载配置
 * @param config_file 配置文件路径
 * @return true 加载成功，false 加载失败
 * @details 解析失败时保留原有配置
 */
bool ConfigManager::load_config(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        log(LOG_ERROR, "Failed to open config file: " + config_file);
        return false;
    }
    m_config_file = config_file;

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool ConfigManager::load_from_string(const std::string& content) {
    ServiceConfig config;
    set_default_config(config);
    if (!parse_config_content(content, config)) {
        return false;
    }
    m_config = std::move(config);
    return true;
}

const ServiceConfig& ConfigManager::get_service_config() const {
    return m_config;
}

const DeviceConfig* ConfigManager::get_device_config(const std::string& name) const {
    for (const auto& device : m_config.devices) {
        if (device.name == name) {
            return &device;
        }
    }
    return nullptr;
}

const std::vector<DeviceConfig>& ConfigManager::get_all_devices() const {
    return m_config.devices;
}

/**
 * @brief 验证配置的有效性
 * @param error 输出第一个错误
 * @return true 配置有效，false 配置无效
 * @details 检查插件目录、采集与重连间隔、段名唯一性、适配器类型和指标映射
 */
bool ConfigManager::validate_config(std::string& error) const {
    if (m_config.plugin_dir.empty()) {
        error = "Plugin directory not specified";
        return false;
    }

    if (m_config.manager.collect_interval.count() <= 0) {
        error = "collect_interval must be positive";
        return false;
    }
    if (m_config.manager.retry_on_failure && m_config.manager.retry_interval.count() <= 0) {
        error = "retry_interval must be positive";
        return false;
    }

    if (m_config.command_poll_interval.count() <= 0) {
        error = "command_poll_interval must be positive";
        return false;
    }

    std::set<std::string> names;
    for (const auto& device : m_config.devices) {
        if (device.name.empty()) {
            error = "Section name cannot be empty";
            return false;
        }
        if (!names.insert(device.name).second) {
            error = "Duplicate section: " + device.name;
            return false;
        }
        if (device.adapter_type.empty()) {
            error = "Adapter type not specified for section: " + device.name;
            return false;
        }
        if (!device.invalid_mappings.empty()) {
            error = "Invalid mapping in section " + device.name + ": " + device.invalid_mappings.front();
            return false;
        }
    }

    if (!m_config.command_device.empty() && names.count(m_config.command_device) == 0) {
        error = "command_device refers to unknown section: " + m_config.command_device;
        return false;
    }
    return true;
}

bool ConfigManager::validate_config() const {
    std::string error;
    if (!validate_config(error)) {
        log(LOG_ERROR, error);
        return false;
    }
    return true;
}

bool ConfigManager::reload_config() {
    if (m_config_file.empty()) {
        log(LOG_ERROR, "No config file specified for reload");
        return false;
    }
    return load_config(m_config_file);
}

/**
 * @brief 解析配置文件内容
 * @param content 配置文件内容字符串
 * @param config 输出配置
 * @return true 解析成功，false 解析失败
 * @details 段之前的 key=value 为全局配置，之后的行归属当前段
 */
bool ConfigManager::parse_config_content(const std::string& content, ServiceConfig& config) {
    std::istringstream stream(content);
    std::string line;
    DeviceConfig* current = nullptr;
    size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        std::string trimmed_line = trim(line);

        // 跳过空行和注释
        if (trimmed_line.empty() || trimmed_line[0] == '#') {
            continue;
        }

        if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
            config.devices.emplace_back();
            current = &config.devices.back();
            current->name = trim(trimmed_line.substr(1, trimmed_line.length() - 2));
            current->adapter_config.name = current->name;
            continue;
        }

        std::string key, value;
        if (!parse_key_value(trimmed_line, key, value)) {
            log(LOG_ERROR, "Malformed config line " + std::to_string(line_no) + ": " + trimmed_line);
            return false;
        }

        if (current) {
            parse_device_entry(key, value, *current);
        } else if (!parse_global(key, value, config)) {
            log(LOG_ERROR, "Invalid value for " + key + " at line " + std::to_string(line_no));
            return false;
        }
    }
    return true;
}

bool ConfigManager::parse_global(const std::string& key, const std::string& value, ServiceConfig& config) {
    int number = 0;
    if (key == "plugin_dir") {
        config.plugin_dir = value;
    } else if (key == "log_level") {
        if (!parse_int(value, number)) {
            return false;
        }
        config.log_level = number;
    } else if (key == "daemon_mode") {
        config.daemon_mode = parse_bool(value);
    } else if (key == "station_id") {
        config.station_id = value;
    } else if (key == "command_device") {
        config.command_device = value;
    } else if (key == "command_poll_interval") {
        if (!parse_int(value, number)) {
            return false;
        }
        config.command_poll_interval = std::chrono::seconds(number);
    } else if (key == "collect_interval") {
        if (!parse_int(value, number)) {
            return false;
        }
        config.manager.collect_interval = std::chrono::seconds(number);
    } else if (key == "retry_interval") {
        if (!parse_int(value, number)) {
            return false;
        }
        config.manager.retry_interval = std::chrono::seconds(number);
    } else if (key == "metrics_buffer_size") {
        if (!parse_int(value, number)) {
            return false;
        }
        config.manager.metrics_buffer_size = number;
    } else if (key == "max_concurrent_collections") {
        if (!parse_int(value, number)) {
            return false;
        }
        config.manager.max_concurrent_collections = number;
    } else if (key == "retry_on_failure") {
        config.manager.retry_on_failure = parse_bool(value);
    } else {
        log(LOG_DEBUG, "Ignoring unknown global key: " + key);
    }
    return true;
}

void ConfigManager::parse_device_entry(const std::string& key, const std::string& value, DeviceConfig& device) {
    if (key == "adapter_type") {
        device.adapter_type = value;
    } else if (key == "enabled") {
        device.enabled = parse_bool(value);
    } else if (key == "mapping") {
        MetricMapping mapping;
        if (parse_mapping(value, mapping)) {
            device.adapter_config.mappings.push_back(mapping);
        } else {
            device.invalid_mappings.push_back(value);
        }
    } else {
        // 其他配置项作为适配器选项
        device.adapter_config.options[key] = value;
    }
}

bool ConfigManager::parse_mapping(const std::string& value, MetricMapping& mapping) {
    std::istringstream pairs(value);
    std::string pair;
    bool has_metric = false;

    while (std::getline(pairs, pair, ',')) {
        size_t colon_pos = pair.find(':');
        if (colon_pos == std::string::npos) {
            return false;
        }
        const std::string field = trim(pair.substr(0, colon_pos));
        const std::string field_value = trim(pair.substr(colon_pos + 1));

        if (field == "id") {
            mapping.external_id = field_value;
        } else if (field == "metric") {
            if (!parse_metric_type(field_value, mapping.metric_type) || mapping.metric_type == MetricType::All) {
                return false;
            }
            has_metric = true;
        } else if (field == "scale") {
            if (!parse_float(field_value, mapping.scale)) {
                return false;
            }
        } else if (field == "offset") {
            if (!parse_float(field_value, mapping.offset)) {
                return false;
            }
        } else if (field == "desc") {
            mapping.description = field_value;
        } else {
            return false;
        }
    }
    return has_metric && !mapping.external_id.empty();
}

bool ConfigManager::parse_key_value(const std::string& line, std::string& key, std::string& value) const {
    size_t equal_pos = line.find('=');
    if (equal_pos == std::string::npos) {
        return false;
    }

    key = trim(line.substr(0, equal_pos));
    value = trim(line.substr(equal_pos + 1));
    return !key.empty();
}

std::string ConfigManager::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }

    size_t last = str.find_last_not_of(" \t\r");
    return str.substr(first, (last - first + 1));
}

void ConfigManager::set_default_config(ServiceConfig& config) const {
    config.plugin_dir = "/usr/lib/edgebridge/plugins";
    config.log_level = LOG_INFO;
    config.daemon_mode = false;
    config.manager = ManagerConfig();
}

} // namespace edgebridge
