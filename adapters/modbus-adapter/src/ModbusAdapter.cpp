#include "ModbusAdapter.hpp"
#include <edgebridge/Logger.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace edgebridge {

namespace {

bool parse_kind(const std::string& text, RegisterKind& kind) {
    if (text == "holding") kind = RegisterKind::Holding;
    else if (text == "input") kind = RegisterKind::Input;
    else if (text == "coil") kind = RegisterKind::Coil;
    else if (text == "discrete") kind = RegisterKind::Discrete;
    else return false;
    return true;
}

bool parse_type(const std::string& text, RegisterType& type) {
    if (text == "int16") type = RegisterType::Int16;
    else if (text == "uint16") type = RegisterType::UInt16;
    else if (text == "int32") type = RegisterType::Int32;
    else if (text == "uint32") type = RegisterType::UInt32;
    else if (text == "float32") type = RegisterType::Float32;
    else return false;
    return true;
}

} // namespace

/**
 * 构造函数
 * 初始化默认通信参数与资源句柄。
 */
ModbusAdapter::ModbusAdapter()
    : m_modbus_ctx(nullptr, modbus_free)
    , m_port(502)
    , m_slave_id(1)
    , m_baudrate(9600)
    , m_parity('N')
    , m_data_bits(8)
    , m_stop_bits(1)
    , m_response_timeout_ms(1000) {
}

ModbusAdapter::~ModbusAdapter() {
    close();
}

/**
 * 初始化适配器
 * @param config 适配器配置（连接类型、地址/串口、从站ID、寄存器映射等）
 * @return StatusCode::OK 初始化成功；其他为错误码
 */
StatusCode ModbusAdapter::init(const AdapterConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_initialized) {
        return StatusCode::AlreadyConnected;
    }

    StatusCode result = parse_config(config);
    if (result != StatusCode::OK) {
        return result;
    }

    result = create_modbus_context();
    if (result != StatusCode::OK) {
        return result;
    }

    m_initialized = true;
    return StatusCode::OK;
}

std::string ModbusAdapter::name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_name;
}

/**
 * 建立与设备的连接
 * 连接超时取 ctx 剩余时间与 response_timeout_ms 中较小者。
 */
StatusCode ModbusAdapter::connect(const Context& ctx) {
    if (ctx.is_cancelled()) {
        return StatusCode::Cancelled;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_initialized) {
        return StatusCode::NotInitialized;
    }
    if (m_connected) {
        return StatusCode::OK;
    }
    if (!m_modbus_ctx) {
        return StatusCode::Error;
    }

    const auto timeout = std::min(ctx.remaining(std::chrono::milliseconds(m_response_timeout_ms)),
                                  std::chrono::milliseconds(m_response_timeout_ms));
    const auto ms = std::max<uint32_t>(static_cast<uint32_t>(timeout.count()), 1);
    modbus_set_response_timeout(m_modbus_ctx.get(), ms / 1000, (ms % 1000) * 1000);

    if (modbus_connect(m_modbus_ctx.get()) == -1) {
        log(LOG_DEBUG, "[Modbus] " + m_name + " connect failed: " + modbus_strerror(errno));
        return StatusCode::Error;
    }

    m_connected = true;
    return StatusCode::OK;
}

/**
 * 断开连接，保留上下文以便重连
 */
StatusCode ModbusAdapter::close() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_modbus_ctx && m_connected) {
        modbus_close(m_modbus_ctx.get());
    }
    m_connected = false;
    return StatusCode::OK;
}

bool ModbusAdapter::is_connected() const {
    return m_connected;
}

/**
 * 依次读取所有采集点，按映射顺序输出
 * @return 任一点读取失败即返回 Error，已读取的指标不输出
 */
StatusCode ModbusAdapter::collect_metrics(const Context& ctx, std::vector<Metric>& metrics) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_connected) {
        return StatusCode::NotConnected;
    }

    std::vector<Metric> collected;
    collected.reserve(m_points.size());
    for (const auto& point : m_points) {
        if (ctx.is_cancelled()) {
            return StatusCode::Cancelled;
        }
        float raw = 0.0f;
        StatusCode result = read_point(point, raw);
        if (result != StatusCode::OK) {
            return result;
        }
        collected.push_back(Metric{ point.mapping.metric_type, point.mapping.apply_transform(raw) });
    }

    metrics = std::move(collected);
    return StatusCode::OK;
}

StatusCode ModbusAdapter::collect_metric(const Context& ctx, MetricType type, Metric& metric) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_connected) {
        return StatusCode::NotConnected;
    }
    if (ctx.is_cancelled()) {
        return StatusCode::Cancelled;
    }

    auto it = std::find_if(m_points.begin(), m_points.end(),
                           [type](const RegisterPoint& p) { return p.mapping.metric_type == type; });
    if (it == m_points.end()) {
        return StatusCode::NotFound;
    }

    float raw = 0.0f;
    StatusCode result = read_point(*it, raw);
    if (result != StatusCode::OK) {
        return result;
    }
    metric.type = type;
    metric.value = it->mapping.apply_transform(raw);
    return StatusCode::OK;
}

/**
 * 解析适配器配置
 * @param config 输入配置
 * @return StatusCode::OK 成功；BadConfig 等
 */
StatusCode ModbusAdapter::parse_config(const AdapterConfig& config) {
    m_name = config.name;
    try_get_config_value(config, "name", m_name);
    if (m_name.empty()) {
        return StatusCode::BadConfig;
    }

    // 1. 获取必需参数：连接类型
    if (!try_get_config_value(config, "connection_type", m_connection_type)) {
        return StatusCode::BadConfig;
    }

    // 2. 根据连接类型，获取各自的必需和可选参数
    if (m_connection_type == "tcp") {
        if (!try_get_config_value(config, "ip_address", m_ip_address)) {
            return StatusCode::BadConfig;
        }
        try_get_config_value(config, "port", m_port);
    } else if (m_connection_type == "rtu") {
        if (!try_get_config_value(config, "device_path", m_device_path)) {
            return StatusCode::BadConfig;
        }
        try_get_config_value(config, "baudrate", m_baudrate);
        try_get_config_value(config, "parity", m_parity);
        try_get_config_value(config, "data_bits", m_data_bits);
        try_get_config_value(config, "stop_bits", m_stop_bits);
    } else {
        return StatusCode::BadConfig;
    }

    // 3. 共用的可选参数
    try_get_config_value(config, "slave_id", m_slave_id);
    try_get_config_value(config, "response_timeout_ms", m_response_timeout_ms);
    if (m_response_timeout_ms <= 0) {
        return StatusCode::BadConfig;
    }

    // 4. 寄存器映射
    m_points.clear();
    for (const auto& mapping : config.mappings) {
        RegisterPoint point;
        if (!parse_register_id(mapping.external_id, point)) {
            log(LOG_ERROR, "[Modbus] " + m_name + ": invalid register id " + mapping.external_id);
            return StatusCode::BadConfig;
        }
        point.mapping = mapping;
        m_points.push_back(point);
    }

    return StatusCode::OK;
}

/**
 * 创建并配置 libmodbus 上下文
 * 根据连接类型创建 TCP/RTU 上下文并设置从站ID。
 */
StatusCode ModbusAdapter::create_modbus_context() {
    if (m_connection_type == "tcp") {
        m_modbus_ctx.reset(modbus_new_tcp(m_ip_address.c_str(), m_port));
    } else if (m_connection_type == "rtu") {
        m_modbus_ctx.reset(modbus_new_rtu(m_device_path.c_str(), m_baudrate, m_parity, m_data_bits, m_stop_bits));
    } else {
        return StatusCode::BadConfig;
    }

    if (!m_modbus_ctx) {
        return StatusCode::Error;
    }

    if (modbus_set_slave(m_modbus_ctx.get(), m_slave_id) == -1) {
        return StatusCode::BadConfig;
    }
    return StatusCode::OK;
}

/**
 * 读取单个采集点的原始值
 * 线圈与离散输入读为 0/1。
 */
StatusCode ModbusAdapter::read_point(const RegisterPoint& point, float& raw) {
    const int count = point.register_count();
    uint16_t regs[2] = { 0, 0 };
    uint8_t bit = 0;
    int result = -1;

    switch (point.kind) {
        case RegisterKind::Holding:
            result = modbus_read_registers(m_modbus_ctx.get(), point.address, count, regs);
            break;
        case RegisterKind::Input:
            result = modbus_read_input_registers(m_modbus_ctx.get(), point.address, count, regs);
            break;
        case RegisterKind::Coil:
            result = modbus_read_bits(m_modbus_ctx.get(), point.address, 1, &bit);
            break;
        case RegisterKind::Discrete:
            result = modbus_read_input_bits(m_modbus_ctx.get(), point.address, 1, &bit);
            break;
    }

    const bool is_bit = point.kind == RegisterKind::Coil || point.kind == RegisterKind::Discrete;
    if (result != (is_bit ? 1 : count)) {
        handle_read_failure(point);
        return StatusCode::Error;
    }

    raw = is_bit ? static_cast<float>(bit) : decode_registers(point.type, regs);
    return StatusCode::OK;
}

/**
 * Modbus 异常码说明设备仍在应答；其他错误视为链路断开，交给重连
 */
void ModbusAdapter::handle_read_failure(const RegisterPoint& point) {
    const int err = errno;
    log(LOG_DEBUG, "[Modbus] " + m_name + " read " + point.mapping.external_id + " failed: " + modbus_strerror(err));
    if (err < MODBUS_ENOBASE) {
        modbus_close(m_modbus_ctx.get());
        m_connected = false;
    }
}

bool ModbusAdapter::parse_register_id(const std::string& external_id, RegisterPoint& point) {
    std::istringstream stream(external_id);
    std::string kind, address, type;
    if (!std::getline(stream, kind, '/') || !std::getline(stream, address, '/') || !std::getline(stream, type)) {
        return false;
    }
    if (!parse_kind(kind, point.kind) || !parse_type(type, point.type)) {
        return false;
    }
    try {
        size_t pos = 0;
        point.address = std::stoi(address, &pos);
        if (pos != address.size() || point.address < 0 || point.address > 0xFFFF) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

float ModbusAdapter::decode_registers(RegisterType type, const uint16_t* regs) {
    const uint32_t word = (static_cast<uint32_t>(regs[0]) << 16) | regs[1];
    switch (type) {
        case RegisterType::Int16:
            return static_cast<float>(static_cast<int16_t>(regs[0]));
        case RegisterType::UInt16:
            return static_cast<float>(regs[0]);
        case RegisterType::Int32:
            return static_cast<float>(static_cast<int32_t>(word));
        case RegisterType::UInt32:
            return static_cast<float>(word);
        case RegisterType::Float32: {
            float value;
            std::memcpy(&value, &word, sizeof(value));
            return value;
        }
    }
    return 0.0f;
}

} // namespace edgebridge
