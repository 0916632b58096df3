#pragma once

#include <edgebridge/IAdapter.hpp>
#include <edgebridge/Types.hpp>
#include <edgebridge/protocol/DeviceClient.hpp>
#include <edgebridge/protocol/Transport.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace edgebridge {

/**
 * @brief 帧协议设备适配器（串口 / TCP）
 *
 * 选项: name, transport=tcp|serial, host, port, device_path, baudrate,
 * response_timeout_ms, metrics（逗号分隔的指标名，空表示全部）。
 * 映射的外部标识为设备侧指标编码或名称，命中映射的指标改名并做线性变换，其余原样输出。
 */
class FrameAdapter : public IAdapter {
public:
    FrameAdapter();
    ~FrameAdapter() override;

    StatusCode init(const AdapterConfig& config) override;

    /**
     * @brief 使用外部提供的链路初始化，忽略 transport 相关选项
     */
    StatusCode init(const AdapterConfig& config, std::unique_ptr<protocol::ITransport> transport);

    std::string name() const override;
    StatusCode connect(const Context& ctx) override;
    StatusCode close() override;
    bool is_connected() const override;
    StatusCode collect_metrics(const Context& ctx, std::vector<Metric>& metrics) override;
    StatusCode collect_metric(const Context& ctx, MetricType type, Metric& metric) override;

    /** 设备上报的事件帧数 */
    uint64_t event_count() const;

private:
    StatusCode parse_options(const AdapterConfig& config);
    Metric translate(const Metric& device_metric) const;
    void on_event(const protocol::Message& event);

    std::string m_name;
    std::vector<MetricType> m_requested;                 // 空表示全部
    std::map<MetricType, MetricMapping> m_by_device;     // 设备编码 -> 映射
    std::chrono::milliseconds m_response_timeout;
    std::unique_ptr<protocol::DeviceClient> m_client;

    mutable std::mutex m_mutex;
    uint64_t m_event_count;
};

} // namespace edgebridge
