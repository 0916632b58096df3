#include "FrameAdapter.hpp"
#include <edgebridge/Logger.hpp>
#include <sstream>

namespace edgebridge {

FrameAdapter::FrameAdapter()
    : m_response_timeout(5000)
    , m_event_count(0) {
}

FrameAdapter::~FrameAdapter() {
    close();
}

/**
 * 初始化适配器
 * @param config 适配器配置
 * @return StatusCode::OK 成功；链路选项不完整或映射无效时返回 BadConfig
 */
StatusCode FrameAdapter::init(const AdapterConfig& config) {
    std::unique_ptr<protocol::ITransport> transport = protocol::create_transport(config);
    if (!transport) {
        log(LOG_ERROR, "[FrameAdapter] " + config.name + ": incomplete transport options");
        return StatusCode::BadConfig;
    }
    return init(config, std::move(transport));
}

StatusCode FrameAdapter::init(const AdapterConfig& config, std::unique_ptr<protocol::ITransport> transport) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_client) {
        return StatusCode::AlreadyConnected;
    }
    if (!transport) {
        return StatusCode::InvalidParam;
    }

    StatusCode result = parse_options(config);
    if (result != StatusCode::OK) {
        return result;
    }

    m_client = std::make_unique<protocol::DeviceClient>(std::move(transport), m_response_timeout);
    m_client->set_event_callback([this](const protocol::Message& event) { on_event(event); });
    return StatusCode::OK;
}

StatusCode FrameAdapter::parse_options(const AdapterConfig& config) {
    m_name = config.name;
    auto it = config.options.find("name");
    if (it != config.options.end() && !it->second.empty()) {
        m_name = it->second;
    }
    if (m_name.empty()) {
        return StatusCode::BadConfig;
    }

    it = config.options.find("response_timeout_ms");
    if (it != config.options.end()) {
        try {
            int ms = std::stoi(it->second);
            if (ms <= 0) {
                return StatusCode::BadConfig;
            }
            m_response_timeout = std::chrono::milliseconds(ms);
        } catch (const std::exception&) {
            return StatusCode::BadConfig;
        }
    }

    m_requested.clear();
    it = config.options.find("metrics");
    if (it != config.options.end()) {
        std::istringstream stream(it->second);
        std::string item;
        while (std::getline(stream, item, ',')) {
            if (item.empty()) continue;
            MetricType type;
            if (!parse_metric_type(item, type)) {
                log(LOG_ERROR, "[FrameAdapter] " + m_name + ": unknown metric " + item);
                return StatusCode::BadConfig;
            }
            m_requested.push_back(type);
        }
    }

    m_by_device.clear();
    for (const auto& mapping : config.mappings) {
        MetricType device_type;
        if (!parse_metric_type(mapping.external_id, device_type)) {
            log(LOG_ERROR, "[FrameAdapter] " + m_name + ": invalid device metric " + mapping.external_id);
            return StatusCode::BadConfig;
        }
        m_by_device[device_type] = mapping;
    }
    return StatusCode::OK;
}

std::string FrameAdapter::name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_name;
}

StatusCode FrameAdapter::connect(const Context& ctx) {
    if (!m_client) {
        return StatusCode::NotInitialized;
    }
    StatusCode result = m_client->connect(ctx);
    if (result == StatusCode::OK) {
        log(LOG_INFO, "[FrameAdapter] " + m_name + " connected via " + m_client->transport_type());
    }
    return result;
}

StatusCode FrameAdapter::close() {
    if (!m_client) {
        return StatusCode::OK;
    }
    return m_client->close();
}

bool FrameAdapter::is_connected() const {
    return m_client && m_client->is_connected();
}

/**
 * 请求配置的指标集合，保持设备上报顺序
 */
StatusCode FrameAdapter::collect_metrics(const Context& ctx, std::vector<Metric>& metrics) {
    if (!m_client) {
        return StatusCode::NotInitialized;
    }

    std::vector<Metric> raw;
    StatusCode result = m_client->request_metrics(ctx, m_requested, raw);
    if (result != StatusCode::OK) {
        return result;
    }

    metrics.clear();
    metrics.reserve(raw.size());
    for (const auto& metric : raw) {
        metrics.push_back(translate(metric));
    }
    return StatusCode::OK;
}

/**
 * 单个指标：先把平台指标类型反查为设备编码，再单独请求
 */
StatusCode FrameAdapter::collect_metric(const Context& ctx, MetricType type, Metric& metric) {
    if (!m_client) {
        return StatusCode::NotInitialized;
    }

    MetricType device_type = type;
    for (const auto& pair : m_by_device) {
        if (pair.second.metric_type == type) {
            device_type = pair.first;
            break;
        }
    }

    std::vector<Metric> raw;
    StatusCode result = m_client->request_metrics(ctx, { device_type }, raw);
    if (result != StatusCode::OK) {
        return result;
    }

    for (const auto& candidate : raw) {
        if (candidate.type == device_type) {
            metric = translate(candidate);
            return StatusCode::OK;
        }
    }
    return StatusCode::NotFound;
}

uint64_t FrameAdapter::event_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_event_count;
}

Metric FrameAdapter::translate(const Metric& device_metric) const {
    auto it = m_by_device.find(device_metric.type);
    if (it == m_by_device.end()) {
        return device_metric;
    }
    return Metric{ it->second.metric_type, it->second.apply_transform(device_metric.value) };
}

void FrameAdapter::on_event(const protocol::Message& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_event_count;
    }
    log(LOG_DEBUG, "[FrameAdapter] " + m_name + " event: " + event.to_string());
}

} // namespace edgebridge
