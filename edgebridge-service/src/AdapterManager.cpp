#include "AdapterManager.hpp"
#include "Sync.hpp"
#include <edgebridge/Logger.hpp>

namespace edgebridge {

namespace {

constexpr int DEFAULT_METRICS_BUFFER_SIZE = 10000;
constexpr int DEFAULT_MAX_CONCURRENT_COLLECTIONS = 10;
constexpr std::chrono::milliseconds DEFAULT_INTERVAL { std::chrono::seconds(30) };

ManagerConfig sanitize(ManagerConfig config) {
    if (config.metrics_buffer_size <= 0) {
        config.metrics_buffer_size = DEFAULT_METRICS_BUFFER_SIZE;
    }
    if (config.max_concurrent_collections <= 0) {
        config.max_concurrent_collections = DEFAULT_MAX_CONCURRENT_COLLECTIONS;
    }
    if (config.collect_interval.count() <= 0) {
        config.collect_interval = DEFAULT_INTERVAL;
    }
    if (config.retry_interval.count() <= 0) {
        config.retry_interval = DEFAULT_INTERVAL;
    }
    return config;
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string joined = "[";
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            joined += "; ";
        }
        joined += errors[i];
    }
    return joined + "]";
}

} // namespace

AdapterManager::Shared::Shared(size_t results_capacity, size_t metrics_capacity)
    : shutdown(Context::with_cancel(Context::background()))
    , results(std::make_shared<BoundedQueue<CollectResult>>(results_capacity))
    , metrics(std::make_shared<BoundedQueue<Metric>>(metrics_capacity)) {
}

void AdapterManager::Shared::record(const std::string& name, StatusCode status, size_t count) {
    std::lock_guard<std::mutex> lock(report_mutex);
    // 注销后仍在运行的采集线程不再写入报告
    if (registered.count(name) == 0) {
        return;
    }
    CollectReport& report = reports[name];
    report.last_status = status;
    report.last_attempt = std::chrono::system_clock::now();
    if (status == StatusCode::OK) {
        report.metric_count = count;
        report.consecutive_failures = 0;
    } else {
        ++report.consecutive_failures;
    }
}

/**
 * @brief 构造函数
 * @details 非正的缓冲区大小、并发数和时间间隔回退为默认值
 */
AdapterManager::AdapterManager(const ManagerConfig& config)
    : m_config(sanitize(config))
    , m_running(false)
    , m_stopped(false)
    , m_stop_status(StatusCode::OK) {
    m_shared = std::make_shared<Shared>(static_cast<size_t>(m_config.max_concurrent_collections),
                                        static_cast<size_t>(m_config.metrics_buffer_size));
}

AdapterManager::~AdapterManager() {
    stop();
}

/**
 * @brief 注册适配器
 * @param adapter 适配器实例，名称取 adapter->name()
 * @return 操作状态码
 */
StatusCode AdapterManager::register_adapter(std::shared_ptr<IAdapter> adapter) {
    if (!adapter) {
        return StatusCode::InvalidParam;
    }
    const std::string name = adapter->name();
    if (name.empty()) {
        return StatusCode::InvalidParam;
    }

    std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
    if (m_adapters.count(name) > 0) {
        log(LOG_ERROR, "[Manager] Adapter " + name + " already registered");
        return StatusCode::DuplicateName;
    }

    m_adapters.emplace(name, std::move(adapter));
    {
        std::lock_guard<std::mutex> report_lock(m_shared->report_mutex);
        m_shared->registered.insert(name);
    }
    log(LOG_INFO, "[Manager] Registered adapter: " + name);
    return StatusCode::OK;
}

/**
 * @brief 注销适配器
 * @details 先关闭再移除，关闭失败不影响移除
 */
StatusCode AdapterManager::unregister_adapter(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
    auto it = m_adapters.find(name);
    if (it == m_adapters.end()) {
        return StatusCode::NotFound;
    }

    StatusCode status = it->second->close();
    if (status != StatusCode::OK) {
        log(LOG_ERROR, "[Manager] Error closing adapter " + name + ": " + to_string(status));
    }
    m_adapters.erase(it);

    {
        std::lock_guard<std::mutex> report_lock(m_shared->report_mutex);
        m_shared->registered.erase(name);
        m_shared->reports.erase(name);
    }

    log(LOG_INFO, "[Manager] Unregistered adapter: " + name);
    return StatusCode::OK;
}

std::vector<std::shared_ptr<IAdapter>> AdapterManager::snapshot(bool connected_only) const {
    std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
    std::vector<std::shared_ptr<IAdapter>> adapters;
    adapters.reserve(m_adapters.size());
    for (const auto& pair : m_adapters) {
        if (!connected_only || pair.second->is_connected()) {
            adapters.push_back(pair.second);
        }
    }
    return adapters;
}

/**
 * @brief 并行连接所有已注册适配器
 * @param error_summary 输出失败汇总，按适配器名称排序
 * @return 全部成功返回 OK，否则返回 Error
 */
StatusCode AdapterManager::connect_all(const Context& ctx, std::string& error_summary) {
    const auto adapters = snapshot(false);
    std::vector<StatusCode> results(adapters.size(), StatusCode::OK);
    std::vector<std::thread> workers;
    workers.reserve(adapters.size());

    for (size_t i = 0; i < adapters.size(); ++i) {
        workers.emplace_back([&ctx, &results, &adapters, i]() {
            results[i] = adapters[i]->connect(ctx);
            if (results[i] == StatusCode::OK) {
                log(LOG_INFO, "[Manager] Connected adapter: " + adapters[i]->name());
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::vector<std::string> errors;
    for (size_t i = 0; i < adapters.size(); ++i) {
        if (results[i] != StatusCode::OK) {
            errors.push_back(adapters[i]->name() + ": " + to_string(results[i]));
        }
    }

    error_summary.clear();
    if (!errors.empty()) {
        error_summary = "failed to connect " + std::to_string(errors.size()) + " adapters: " + join_errors(errors);
        return StatusCode::Error;
    }
    return StatusCode::OK;
}

StatusCode AdapterManager::connect_all(const Context& ctx) {
    std::string error_summary;
    return connect_all(ctx, error_summary);
}

StatusCode AdapterManager::close_all(std::string& error_summary) {
    std::unique_lock<std::shared_mutex> lock(m_registry_mutex);

    std::vector<std::string> errors;
    for (const auto& pair : m_adapters) {
        StatusCode status = pair.second->close();
        if (status != StatusCode::OK) {
            errors.push_back(pair.first + ": " + to_string(status));
        }
    }

    error_summary.clear();
    if (!errors.empty()) {
        error_summary = "errors closing adapters: " + join_errors(errors);
        return StatusCode::Error;
    }
    return StatusCode::OK;
}

StatusCode AdapterManager::close_all() {
    std::string error_summary;
    return close_all(error_summary);
}

/**
 * @brief 启动管理器
 * @param ctx 调用方上下文，取消后各后台线程退出
 * @return 操作状态码
 * @details 连接失败的适配器只记录日志，由重连线程后续处理
 */
StatusCode AdapterManager::start(const Context& ctx) {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);

    if (m_stopped) {
        log(LOG_ERROR, "[Manager] Cannot start a stopped manager");
        return StatusCode::NotSupported;
    }
    if (m_running) {
        log(LOG_INFO, "[Manager] Already running");
        return StatusCode::OK;
    }

    std::string error_summary;
    if (connect_all(ctx, error_summary) != StatusCode::OK) {
        log(LOG_ERROR, "[Manager] Warning: some adapters failed to connect: " + error_summary);
    }

    Context loop_ctx = Context::any_of(ctx, m_shared->shutdown);
    m_running = true;
    m_collection_thread = std::thread(&AdapterManager::collection_loop, this, loop_ctx);
    m_processor_thread = std::thread(&AdapterManager::result_processor, this, loop_ctx);
    if (m_config.retry_on_failure) {
        m_reconnection_thread = std::thread(&AdapterManager::reconnection_loop, this, loop_ctx);
    }

    log(LOG_INFO, "[Manager] Started with " + std::to_string(list_adapters().size()) + " adapters");
    return StatusCode::OK;
}

/**
 * @brief 停止管理器
 * @return 第一次调用返回关闭适配器的汇总状态，之后的调用返回 OK
 * @details 停止后不可再次启动
 */
StatusCode AdapterManager::stop() {
    bool executed = false;
    std::call_once(m_stop_once, [this, &executed]() {
        executed = true;
        std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
        m_stopped = true;
        m_shared->shutdown.cancel();

        for (std::thread* t : { &m_collection_thread, &m_processor_thread, &m_reconnection_thread }) {
            if (t->joinable()) {
                t->join();
            }
        }
        {
            std::lock_guard<std::mutex> orphan_lock(m_orphan_mutex);
            for (auto& worker : m_orphan_workers) {
                worker.join();
            }
            m_orphan_workers.clear();
        }

        std::string error_summary;
        m_stop_status = close_all(error_summary);
        if (m_stop_status != StatusCode::OK) {
            log(LOG_ERROR, "[Manager] " + error_summary);
        }

        if (m_running.exchange(false)) {
            log(LOG_INFO, "[Manager] Stopped");
        }
    });
    return executed ? m_stop_status : StatusCode::OK;
}

bool AdapterManager::is_running() const {
    return m_running;
}

/**
 * @brief 按需同步采集
 * @param metrics 输出所有成功适配器的指标，适配器之间无顺序保证
 * @return 始终返回 OK，单个适配器失败只记录日志
 */
StatusCode AdapterManager::collect_now(const Context& ctx, std::vector<Metric>& metrics) {
    metrics.clear();
    const auto adapters = snapshot(true);

    Semaphore semaphore(static_cast<size_t>(m_config.max_concurrent_collections));
    std::mutex metrics_mutex;
    std::vector<std::thread> workers;
    workers.reserve(adapters.size());

    // 先取得信号量再创建线程，同时存在的采集线程不超过并发上限
    const Context collect_ctx = Context::any_of(ctx, m_shared->shutdown);
    for (const auto& adapter : adapters) {
        if (!semaphore.acquire(ctx, m_shared->shutdown)) {
            break;
        }
        workers.emplace_back([&, adapter]() {
            std::vector<Metric> collected;
            StatusCode status = adapter->collect_metrics(collect_ctx, collected);

            m_shared->record(adapter->name(), status, collected.size());
            if (status != StatusCode::OK) {
                log(LOG_ERROR, "[Manager] Error collecting from " + adapter->name() + ": " + to_string(status));
            } else {
                std::lock_guard<std::mutex> lock(metrics_mutex);
                metrics.insert(metrics.end(), collected.begin(), collected.end());
            }
            semaphore.release();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return StatusCode::OK;
}

void AdapterManager::collection_loop(Context ctx) {
    log(LOG_DEBUG, "[Manager] Collection loop started");
    while (!ctx.wait_for(m_config.collect_interval)) {
        trigger_collection(ctx);
    }
    log(LOG_DEBUG, "[Manager] Collection loop stopped");
}

/**
 * @brief 一轮周期采集
 * @details 每个已连接适配器一个采集线程，并发数受信号量限制。
 *          等待被取消时不再等待剩余线程，它们在 stop() 中回收
 */
void AdapterManager::trigger_collection(const Context& ctx) {
    const auto adapters = snapshot(true);
    if (adapters.empty()) {
        return;
    }

    auto shared = m_shared;
    auto semaphore = std::make_shared<Semaphore>(static_cast<size_t>(m_config.max_concurrent_collections));
    auto wait_group = std::make_shared<WaitGroup>();
    std::vector<std::thread> workers;
    workers.reserve(adapters.size());

    for (const auto& adapter : adapters) {
        if (!semaphore->acquire(ctx, shared->shutdown)) {
            break;
        }
        wait_group->add();
        workers.emplace_back([shared, semaphore, wait_group, adapter, ctx]() {
            CollectResult result;
            result.adapter_name = adapter->name();
            result.status = adapter->collect_metrics(ctx, result.metrics);
            shared->record(result.adapter_name, result.status, result.metrics.size());

            if (!shared->results->push(std::move(result), ctx, shared->shutdown)) {
                log(LOG_DEBUG, "[Manager] Result from " + adapter->name() + " discarded on shutdown");
            }
            semaphore->release();
            wait_group->done();
        });
    }

    if (wait_group->wait(ctx, shared->shutdown)) {
        for (auto& worker : workers) {
            worker.join();
        }
        return;
    }

    std::lock_guard<std::mutex> lock(m_orphan_mutex);
    for (auto& worker : workers) {
        m_orphan_workers.push_back(std::move(worker));
    }
}

/**
 * @brief 结果处理线程，唯一的结果队列消费者
 */
void AdapterManager::result_processor(Context ctx) {
    CollectResult result;
    while (m_shared->results->pop(result, ctx)) {
        if (result.status != StatusCode::OK) {
            log(LOG_ERROR, "[Manager] Collection error from " + result.adapter_name + ": " + to_string(result.status));
            continue;
        }

        for (const auto& metric : result.metrics) {
            forward_metric(metric);
        }

        if (!result.metrics.empty()) {
            log(LOG_INFO, "[Manager] Collected " + std::to_string(result.metrics.size()) + " metrics from " +
                result.adapter_name);
        }
    }
}

/**
 * @details 输出队列满时丢弃最旧的一条再重试一次，仍失败则丢弃当前指标。
 *          两种丢失都计入 dropped_metrics()
 */
void AdapterManager::forward_metric(const Metric& metric) {
    BoundedQueue<Metric>& queue = *m_shared->metrics;
    if (queue.try_push(metric)) {
        return;
    }

    Metric oldest;
    if (queue.try_pop(oldest)) {
        ++m_shared->dropped;
    }
    if (!queue.try_push(metric)) {
        ++m_shared->dropped;
    }
}

void AdapterManager::reconnection_loop(Context ctx) {
    while (!ctx.wait_for(m_config.retry_interval)) {
        reconnect_disconnected(ctx);
    }
}

void AdapterManager::reconnect_disconnected(const Context& ctx) {
    std::vector<std::shared_ptr<IAdapter>> disconnected;
    for (const auto& adapter : snapshot(false)) {
        if (!adapter->is_connected()) {
            disconnected.push_back(adapter);
        }
    }

    for (const auto& adapter : disconnected) {
        if (ctx.is_cancelled()) {
            return;
        }
        log(LOG_INFO, "[Manager] Attempting to reconnect " + adapter->name() + "...");
        StatusCode status = adapter->connect(ctx);
        if (status != StatusCode::OK) {
            log(LOG_ERROR, "[Manager] Reconnection failed for " + adapter->name() + ": " + to_string(status));
        } else {
            log(LOG_INFO, "[Manager] Reconnected " + adapter->name());
        }
    }
}

std::map<std::string, bool> AdapterManager::status() const {
    std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
    std::map<std::string, bool> result;
    for (const auto& pair : m_adapters) {
        result[pair.first] = pair.second->is_connected();
    }
    return result;
}

std::vector<std::string> AdapterManager::list_adapters() const {
    std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
    std::vector<std::string> names;
    names.reserve(m_adapters.size());
    for (const auto& pair : m_adapters) {
        names.push_back(pair.first);
    }
    return names;
}

StatusCode AdapterManager::get_adapter(const std::string& name, std::shared_ptr<IAdapter>& adapter) const {
    std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
    auto it = m_adapters.find(name);
    if (it == m_adapters.end()) {
        return StatusCode::NotFound;
    }
    adapter = it->second;
    return StatusCode::OK;
}

std::map<std::string, CollectReport> AdapterManager::collect_report() const {
    std::lock_guard<std::mutex> lock(m_shared->report_mutex);
    return m_shared->reports;
}

} // namespace edgebridge
