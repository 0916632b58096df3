#pragma once

#include <edgebridge/IAdapter.hpp>
#include <edgebridge/Types.hpp>
#include <modbus/modbus.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace edgebridge {

/**
 * @brief Modbus 数据区
 */
enum class RegisterKind {
    Holding,    // 功能码 3
    Input,      // 功能码 4
    Coil,       // 功能码 1
    Discrete    // 功能码 2
};

enum class RegisterType {
    Int16,
    UInt16,
    Int32,
    UInt32,
    Float32
};

/**
 * @brief 一个采集点：寄存器位置、编码方式及对应的指标映射
 */
struct RegisterPoint {
    RegisterKind kind = RegisterKind::Holding;
    int address = 0;
    RegisterType type = RegisterType::UInt16;
    MetricMapping mapping;

    int register_count() const {
        return (type == RegisterType::Int32 || type == RegisterType::UInt32 || type == RegisterType::Float32) ? 2 : 1;
    }
};

/**
 * @brief 基于 libmodbus 的适配器（TCP / RTU）
 *
 * 映射的外部标识格式: <holding|input|coil|discrete>/<address>/<int16|uint16|int32|uint32|float32>，
 * 32 位数据按高字在前解析。
 */
class ModbusAdapter : public IAdapter {
public:
    ModbusAdapter();
    ~ModbusAdapter() override;

    // IAdapter 接口实现
    StatusCode init(const AdapterConfig& config) override;
    std::string name() const override;
    StatusCode connect(const Context& ctx) override;
    StatusCode close() override;
    bool is_connected() const override;
    StatusCode collect_metrics(const Context& ctx, std::vector<Metric>& metrics) override;
    StatusCode collect_metric(const Context& ctx, MetricType type, Metric& metric) override;

    const std::vector<RegisterPoint>& points() const { return m_points; }

    /**
     * @brief 解析外部标识
     * @return 格式错误返回 false
     */
    static bool parse_register_id(const std::string& external_id, RegisterPoint& point);

    /**
     * @brief 按数据类型把寄存器内容转换为数值
     */
    static float decode_registers(RegisterType type, const uint16_t* regs);

private:
    // Modbus 相关
    std::unique_ptr<modbus_t, void(*)(modbus_t*)> m_modbus_ctx;
    std::string m_name;
    std::string m_connection_type;  // "rtu" or "tcp"
    std::string m_device_path;      // 串口设备路径 (RTU)
    std::string m_ip_address;       // IP 地址 (TCP)
    int m_port;                     // 端口号 (TCP)
    int m_slave_id;                 // 从站 ID
    int m_baudrate;                 // 波特率 (RTU)
    char m_parity;                  // 校验位 (RTU)
    int m_data_bits;                // 数据位 (RTU)
    int m_stop_bits;                // 停止位 (RTU)
    int m_response_timeout_ms;

    std::vector<RegisterPoint> m_points;

    // 状态管理
    std::atomic<bool> m_connected{false};
    std::atomic<bool> m_initialized{false};
    mutable std::mutex m_mutex;

    // 内部方法
    StatusCode parse_config(const AdapterConfig& config);
    StatusCode create_modbus_context();
    StatusCode read_point(const RegisterPoint& point, float& raw);
    void handle_read_failure(const RegisterPoint& point);

    /**
    * @brief [模板版本] 尝试从配置选项中获取值并转换为目标类型 T。
    * @tparam T 目标数据类型 (int, std::string, char)
    * @param config 适配器配置
    * @param key 要查找的键
    * @param out_value 用于存储结果的目标类型引用
    * @return bool 如果成功找到并转换，返回 true，否则返回 false
    */
    template <typename T>
    bool try_get_config_value(const AdapterConfig& config, const std::string& key, T& out_value)
    {
        auto it = config.options.find(key);
        if (it == config.options.end()) {
            return false;
        }

        const std::string& value_str = it->second;

        if constexpr (std::is_same_v<T, std::string>) {
            out_value = value_str;
            return true;
        } else if constexpr (std::is_same_v<T, int>) {
            try {
                out_value = std::stoi(value_str);
                return true;
            } catch (const std::exception&) {
                return false;
            }
        } else if constexpr (std::is_same_v<T, char>) {
            if (!value_str.empty()) {
                out_value = value_str[0];
                return true;
            }
            return false;
        }

        return false;
    }
};

} // namespace edgebridge
