#pragma once

#include <edgebridge/Context.hpp>
#include <edgebridge/IAdapter.hpp>
#include <edgebridge/Types.hpp>
#include "BoundedQueue.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace edgebridge {

/**
 * @brief 适配器管理器配置
 */
struct ManagerConfig {
    std::chrono::milliseconds collect_interval { std::chrono::seconds(30) };
    int metrics_buffer_size = 10000;           // 输出队列容量，<=0 时取默认值
    int max_concurrent_collections = 10;       // 并发采集上限，<=0 时取默认值
    bool retry_on_failure = true;
    std::chrono::milliseconds retry_interval { std::chrono::seconds(30) };
};

/**
 * @brief 单个适配器一次采集的结果，由采集线程投递给结果处理线程
 */
struct CollectResult {
    std::string adapter_name;
    std::vector<Metric> metrics;
    StatusCode status = StatusCode::OK;
};

/**
 * @brief 单个适配器的采集概况
 */
struct CollectReport {
    StatusCode last_status = StatusCode::OK;
    size_t metric_count = 0;                   // 最近一次成功采集的指标数
    uint32_t consecutive_failures = 0;
    std::chrono::system_clock::time_point last_attempt;
};

/**
 * @brief 适配器管理器
 *
 * 并发管理任意数量的适配器：连接、周期采集、结果汇聚、断线重连。
 * 单个适配器的失败只记录日志，不影响其他适配器和管理器本身；
 * 只有注册表操作的错误会返回给调用者。
 */
class AdapterManager {
public:
    explicit AdapterManager(const ManagerConfig& config = ManagerConfig());
    ~AdapterManager();

    AdapterManager(const AdapterManager&) = delete;
    AdapterManager& operator=(const AdapterManager&) = delete;

    /**
     * @brief 注册适配器
     * @return 同名已存在返回 DuplicateName，空指针或空名称返回 InvalidParam
     */
    StatusCode register_adapter(std::shared_ptr<IAdapter> adapter);

    /**
     * @brief 关闭并移除适配器，关闭失败只记录日志
     * @return 不存在时返回 NotFound
     */
    StatusCode unregister_adapter(const std::string& name);

    /**
     * @brief 并行连接所有适配器
     * @param error_summary 部分失败时的汇总，如 "failed to connect 2 adapters: [a: Timeout; b: Error]"
     */
    StatusCode connect_all(const Context& ctx, std::string& error_summary);
    StatusCode connect_all(const Context& ctx);

    /**
     * @brief 关闭所有适配器，汇总关闭错误
     */
    StatusCode close_all(std::string& error_summary);
    StatusCode close_all();

    /**
     * @brief 连接适配器并启动采集、结果处理和重连线程，立即返回
     * @return 已停止的管理器返回 NotSupported
     */
    StatusCode start(const Context& ctx);

    /**
     * @brief 停止所有线程并关闭适配器；只有第一次调用生效，并发调用等待其完成
     */
    StatusCode stop();

    bool is_running() const;

    /**
     * @brief 立即同步采集所有已连接适配器，单个适配器失败时跳过
     */
    StatusCode collect_now(const Context& ctx, std::vector<Metric>& metrics);

    std::map<std::string, bool> status() const;
    std::vector<std::string> list_adapters() const;
    StatusCode get_adapter(const std::string& name, std::shared_ptr<IAdapter>& adapter) const;

    /** 采集输出队列，满时丢弃最旧的指标 */
    BoundedQueue<Metric>& metrics() { return *m_shared->metrics; }

    /** 因输出队列满而丢失的指标数 */
    uint64_t dropped_metrics() const { return m_shared->dropped.load(); }

    std::map<std::string, CollectReport> collect_report() const;

    const ManagerConfig& config() const { return m_config; }

private:
    // 采集线程可能晚于一次等待结束，它们用到的状态都放在这里共享
    struct Shared {
        Shared(size_t results_capacity, size_t metrics_capacity);

        void record(const std::string& name, StatusCode status, size_t count);

        Context shutdown;
        std::shared_ptr<BoundedQueue<CollectResult>> results;
        std::shared_ptr<BoundedQueue<Metric>> metrics;
        std::atomic<uint64_t> dropped { 0 };

        mutable std::mutex report_mutex;
        std::map<std::string, CollectReport> reports;
        std::set<std::string> registered;        // 与注册表同步，由 report_mutex 保护
    };

    std::vector<std::shared_ptr<IAdapter>> snapshot(bool connected_only) const;

    void collection_loop(Context ctx);
    void trigger_collection(const Context& ctx);
    void result_processor(Context ctx);
    void forward_metric(const Metric& metric);
    void reconnection_loop(Context ctx);
    void reconnect_disconnected(const Context& ctx);

    ManagerConfig m_config;
    std::shared_ptr<Shared> m_shared;

    mutable std::shared_mutex m_registry_mutex;
    std::map<std::string, std::shared_ptr<IAdapter>> m_adapters;

    std::mutex m_lifecycle_mutex;
    std::once_flag m_stop_once;
    std::atomic<bool> m_running;
    bool m_stopped;
    StatusCode m_stop_status;

    std::thread m_collection_thread;
    std::thread m_processor_thread;
    std::thread m_reconnection_thread;

    std::mutex m_orphan_mutex;
    std::vector<std::thread> m_orphan_workers;   // 等待被取消时仍在运行的采集线程
};

} // namespace edgebridge
