#include "AdapterManager.hpp"
#include <edgebridge/Logger.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <thread>

using namespace edgebridge;
using namespace std::chrono;

namespace {

/**
 * @brief 可编程的内存适配器
 */
class FakeAdapter : public IAdapter {
public:
    explicit FakeAdapter(std::string name, std::vector<Metric> metrics = {})
        : m_name(std::move(name)), m_metrics(std::move(metrics)) {}

    StatusCode init(const AdapterConfig&) override { return StatusCode::OK; }

    std::string name() const override { return m_name; }

    StatusCode connect(const Context& ctx) override {
        ++connect_calls;
        if (ctx.is_cancelled()) {
            return StatusCode::Cancelled;
        }
        if (connect_failures > 0) {
            --connect_failures;
            return StatusCode::Error;
        }
        if (connect_status != StatusCode::OK) {
            return connect_status;
        }
        connected = true;
        return StatusCode::OK;
    }

    StatusCode close() override {
        ++close_calls;
        connected = false;
        return close_status;
    }

    bool is_connected() const override { return connected; }

    StatusCode collect_metrics(const Context& ctx, std::vector<Metric>& metrics) override {
        ++collect_calls;
        if (collect_delay.count() > 0 && ctx.wait_for(collect_delay)) {
            return StatusCode::Cancelled;
        }
        if (collect_status != StatusCode::OK) {
            return collect_status;
        }
        if (metrics_once && collect_calls > 1) {
            metrics.clear();
            return StatusCode::OK;
        }
        metrics = m_metrics;
        return StatusCode::OK;
    }

    StatusCode collect_metric(const Context&, MetricType, Metric&) override {
        return StatusCode::NotSupported;
    }

    std::atomic<bool> connected { false };
    std::atomic<int> connect_calls { 0 };
    std::atomic<int> connect_failures { 0 };
    std::atomic<int> close_calls { 0 };
    std::atomic<int> collect_calls { 0 };
    StatusCode connect_status = StatusCode::OK;
    StatusCode close_status = StatusCode::OK;
    StatusCode collect_status = StatusCode::OK;
    milliseconds collect_delay { 0 };
    bool metrics_once = false;

private:
    std::string m_name;
    std::vector<Metric> m_metrics;
};

bool wait_until(const std::function<bool()>& predicate, milliseconds timeout = seconds(3)) {
    const auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }
    return predicate();
}

// 当前进程的线程数，取自 /proc/self/status
int thread_count() {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 8, "Threads:") == 0) {
            return std::stoi(line.substr(8));
        }
    }
    return -1;
}

ManagerConfig fast_config() {
    ManagerConfig config;
    config.collect_interval = milliseconds(20);
    config.retry_interval = milliseconds(20);
    return config;
}

} // namespace

class AdapterManagerTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_level(LOG_ERROR); }
    void TearDown() override { set_log_level(LOG_INFO); }
};

TEST_F(AdapterManagerTest, RejectsDuplicateName) {
    AdapterManager manager;
    EXPECT_EQ(manager.register_adapter(std::make_shared<FakeAdapter>("a")), StatusCode::OK);
    EXPECT_EQ(manager.register_adapter(std::make_shared<FakeAdapter>("a")), StatusCode::DuplicateName);
    EXPECT_EQ(manager.list_adapters(), std::vector<std::string>{ "a" });
}

TEST_F(AdapterManagerTest, RejectsNullAndUnnamedAdapters) {
    AdapterManager manager;
    EXPECT_EQ(manager.register_adapter(nullptr), StatusCode::InvalidParam);
    EXPECT_EQ(manager.register_adapter(std::make_shared<FakeAdapter>("")), StatusCode::InvalidParam);
    EXPECT_TRUE(manager.list_adapters().empty());
}

/**
 * @brief 注销时先关闭适配器，未知名称返回 NotFound
 */
TEST_F(AdapterManagerTest, UnregisterClosesAdapter) {
    AdapterManager manager;
    auto adapter = std::make_shared<FakeAdapter>("a");
    adapter->close_status = StatusCode::Error;
    ASSERT_EQ(manager.register_adapter(adapter), StatusCode::OK);

    EXPECT_EQ(manager.unregister_adapter("missing"), StatusCode::NotFound);
    EXPECT_EQ(manager.unregister_adapter("a"), StatusCode::OK);
    EXPECT_EQ(adapter->close_calls.load(), 1);

    std::shared_ptr<IAdapter> found;
    EXPECT_EQ(manager.get_adapter("a", found), StatusCode::NotFound);
    EXPECT_EQ(manager.unregister_adapter("a"), StatusCode::NotFound);
}

TEST_F(AdapterManagerTest, GetAdapterReturnsRegisteredInstance) {
    AdapterManager manager;
    auto adapter = std::make_shared<FakeAdapter>("a");
    ASSERT_EQ(manager.register_adapter(adapter), StatusCode::OK);

    std::shared_ptr<IAdapter> found;
    ASSERT_EQ(manager.get_adapter("a", found), StatusCode::OK);
    EXPECT_EQ(found.get(), adapter.get());
}

TEST_F(AdapterManagerTest, ConnectAllSummarizesFailures) {
    AdapterManager manager;
    auto a = std::make_shared<FakeAdapter>("a");
    auto b = std::make_shared<FakeAdapter>("b");
    auto c = std::make_shared<FakeAdapter>("c");
    b->connect_status = StatusCode::Timeout;
    c->connect_status = StatusCode::Error;
    for (const auto& adapter : { a, b, c }) {
        ASSERT_EQ(manager.register_adapter(adapter), StatusCode::OK);
    }

    std::string summary;
    EXPECT_EQ(manager.connect_all(Context::background(), summary), StatusCode::Error);
    EXPECT_EQ(summary, "failed to connect 2 adapters: [b: timeout; c: error]");

    const auto status = manager.status();
    EXPECT_TRUE(status.at("a"));
    EXPECT_FALSE(status.at("b"));
    EXPECT_FALSE(status.at("c"));
}

TEST_F(AdapterManagerTest, ConnectAllSucceedsWithNoAdapters) {
    AdapterManager manager;
    std::string summary = "previous";
    EXPECT_EQ(manager.connect_all(Context::background(), summary), StatusCode::OK);
    EXPECT_TRUE(summary.empty());
}

TEST_F(AdapterManagerTest, CloseAllSummarizesFailures) {
    AdapterManager manager;
    auto a = std::make_shared<FakeAdapter>("a");
    auto b = std::make_shared<FakeAdapter>("b");
    b->close_status = StatusCode::Error;
    manager.register_adapter(a);
    manager.register_adapter(b);

    std::string summary;
    EXPECT_EQ(manager.close_all(summary), StatusCode::Error);
    EXPECT_EQ(summary, "errors closing adapters: [b: error]");
    EXPECT_EQ(a->close_calls.load(), 1);
}

/**
 * @brief 单个适配器失败不影响其他适配器的结果，未连接的适配器不参与
 */
TEST_F(AdapterManagerTest, CollectNowSkipsFailingAdapters) {
    AdapterManager manager;
    auto a = std::make_shared<FakeAdapter>("a", std::vector<Metric>{ { MetricType::Temperature, 21.0f },
                                                                     { MetricType::Humidity, 40.0f } });
    auto b = std::make_shared<FakeAdapter>("b", std::vector<Metric>{ { MetricType::Voltage, 48.0f } });
    auto c = std::make_shared<FakeAdapter>("c", std::vector<Metric>{ { MetricType::Current, 3.0f } });
    b->collect_status = StatusCode::Error;
    c->connect_status = StatusCode::Error;
    for (const auto& adapter : { a, b, c }) {
        manager.register_adapter(adapter);
    }
    manager.connect_all(Context::background());

    std::vector<Metric> metrics;
    EXPECT_EQ(manager.collect_now(Context::background(), metrics), StatusCode::OK);
    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_EQ(metrics[0].type, MetricType::Temperature);
    EXPECT_EQ(c->collect_calls.load(), 0);

    const auto report = manager.collect_report();
    EXPECT_EQ(report.at("a").last_status, StatusCode::OK);
    EXPECT_EQ(report.at("a").metric_count, 2u);
    EXPECT_EQ(report.at("b").last_status, StatusCode::Error);
    EXPECT_EQ(report.at("b").consecutive_failures, 1u);
    EXPECT_EQ(report.count("c"), 0u);
}

TEST_F(AdapterManagerTest, CollectReportResetsFailuresAfterSuccess) {
    AdapterManager manager;
    auto a = std::make_shared<FakeAdapter>("a", std::vector<Metric>{ { MetricType::Uptime, 1.0f } });
    manager.register_adapter(a);
    manager.connect_all(Context::background());

    std::vector<Metric> metrics;
    a->collect_status = StatusCode::Timeout;
    manager.collect_now(Context::background(), metrics);
    manager.collect_now(Context::background(), metrics);
    EXPECT_EQ(manager.collect_report().at("a").consecutive_failures, 2u);

    a->collect_status = StatusCode::OK;
    manager.collect_now(Context::background(), metrics);
    const auto report = manager.collect_report().at("a");
    EXPECT_EQ(report.consecutive_failures, 0u);
    EXPECT_EQ(report.metric_count, 1u);
}

/**
 * @brief 同时存在的采集线程数不超过 max_concurrent_collections
 */
TEST_F(AdapterManagerTest, CollectNowBoundsWorkerThreads) {
    ManagerConfig config;
    config.max_concurrent_collections = 2;
    AdapterManager manager(config);

    std::vector<std::shared_ptr<FakeAdapter>> adapters;
    for (int i = 0; i < 12; ++i) {
        auto adapter = std::make_shared<FakeAdapter>("a" + std::to_string(i),
                                                     std::vector<Metric>{ { MetricType::Uptime, 1.0f } });
        adapter->collect_delay = milliseconds(40);
        manager.register_adapter(adapter);
        adapters.push_back(adapter);
    }
    manager.connect_all(Context::background());

    const int baseline = thread_count();
    ASSERT_GT(baseline, 0);

    std::atomic<bool> sampling { true };
    std::atomic<int> peak { 0 };
    std::thread sampler([&]() {
        while (sampling) {
            peak = std::max(peak.load(), thread_count());
            std::this_thread::sleep_for(milliseconds(2));
        }
    });

    std::vector<Metric> metrics;
    EXPECT_EQ(manager.collect_now(Context::background(), metrics), StatusCode::OK);
    sampling = false;
    sampler.join();

    EXPECT_EQ(metrics.size(), 12u);
    // 采样线程占一个；刚释放信号量的线程退出前可能仍被计入
    EXPECT_LE(peak.load(), baseline + 1 + 2 + 2);
}

TEST_F(AdapterManagerTest, StopCancelsOnDemandCollection) {
    AdapterManager manager;
    auto slow = std::make_shared<FakeAdapter>("slow", std::vector<Metric>{ { MetricType::Uptime, 1.0f } });
    slow->collect_delay = seconds(10);
    manager.register_adapter(slow);
    manager.connect_all(Context::background());

    std::vector<Metric> metrics;
    std::thread collector([&]() { manager.collect_now(Context::background(), metrics); });
    ASSERT_TRUE(wait_until([&]() { return slow->collect_calls.load() == 1; }));

    const auto started = steady_clock::now();
    manager.stop();
    collector.join();
    EXPECT_LT(steady_clock::now() - started, seconds(5));
    EXPECT_TRUE(metrics.empty());
}

/**
 * @brief 注销时仍在进行的采集不会把报告写回
 */
TEST_F(AdapterManagerTest, UnregisteredAdapterLeavesNoReport) {
    AdapterManager manager;
    auto slow = std::make_shared<FakeAdapter>("slow", std::vector<Metric>{ { MetricType::Uptime, 1.0f } });
    slow->collect_delay = milliseconds(200);
    manager.register_adapter(slow);
    manager.connect_all(Context::background());

    std::vector<Metric> metrics;
    std::thread collector([&]() { manager.collect_now(Context::background(), metrics); });
    ASSERT_TRUE(wait_until([&]() { return slow->collect_calls.load() == 1; }));

    EXPECT_EQ(manager.unregister_adapter("slow"), StatusCode::OK);
    collector.join();

    EXPECT_EQ(manager.collect_report().count("slow"), 0u);
    EXPECT_TRUE(manager.list_adapters().empty());
}

TEST_F(AdapterManagerTest, SanitizesNonPositiveSettings) {
    ManagerConfig config;
    config.metrics_buffer_size = 0;
    config.max_concurrent_collections = -1;
    config.collect_interval = milliseconds(0);
    AdapterManager manager(config);

    EXPECT_EQ(manager.config().metrics_buffer_size, 10000);
    EXPECT_EQ(manager.config().max_concurrent_collections, 10);
    EXPECT_EQ(manager.config().collect_interval, seconds(30));
    EXPECT_EQ(manager.metrics().capacity(), 10000u);
}

/**
 * @brief 周期采集的结果经结果处理线程进入输出队列
 */
TEST_F(AdapterManagerTest, PeriodicCollectionFillsOutputQueue) {
    AdapterManager manager(fast_config());
    auto a = std::make_shared<FakeAdapter>("a", std::vector<Metric>{ { MetricType::CpuUsage, 12.0f },
                                                                     { MetricType::MemoryUsage, 34.0f } });
    manager.register_adapter(a);
    ASSERT_EQ(manager.start(Context::background()), StatusCode::OK);
    EXPECT_TRUE(manager.is_running());

    Metric first, second;
    ASSERT_TRUE(manager.metrics().pop_for(first, seconds(3)));
    ASSERT_TRUE(manager.metrics().pop_for(second, seconds(3)));
    EXPECT_EQ(first, (Metric{ MetricType::CpuUsage, 12.0f }));
    EXPECT_EQ(second, (Metric{ MetricType::MemoryUsage, 34.0f }));

    EXPECT_EQ(manager.stop(), StatusCode::OK);
    EXPECT_FALSE(manager.is_running());
    EXPECT_FALSE(a->connected);
}

/**
 * @brief 输出队列满时丢弃最旧的指标，队列中保留最新的指标
 */
TEST_F(AdapterManagerTest, EvictsOldestMetricsWhenBufferFull) {
    ManagerConfig config = fast_config();
    config.metrics_buffer_size = 2;
    config.retry_on_failure = false;
    AdapterManager manager(config);

    std::vector<Metric> produced;
    for (int i = 1; i <= 5; ++i) {
        produced.push_back(Metric{ MetricType::Temperature, static_cast<float>(i) });
    }
    auto a = std::make_shared<FakeAdapter>("a", produced);
    a->metrics_once = true;
    manager.register_adapter(a);

    ASSERT_EQ(manager.start(Context::background()), StatusCode::OK);
    ASSERT_TRUE(wait_until([&]() { return manager.dropped_metrics() >= 3; }));
    manager.stop();

    EXPECT_EQ(manager.dropped_metrics(), 3u);
    ASSERT_EQ(manager.metrics().size(), 2u);
    Metric metric;
    ASSERT_TRUE(manager.metrics().try_pop(metric));
    EXPECT_FLOAT_EQ(metric.value, 4.0f);
    ASSERT_TRUE(manager.metrics().try_pop(metric));
    EXPECT_FLOAT_EQ(metric.value, 5.0f);
}

TEST_F(AdapterManagerTest, ReconnectsDisconnectedAdapters) {
    AdapterManager manager(fast_config());
    auto a = std::make_shared<FakeAdapter>("a");
    a->connect_failures = 2;
    manager.register_adapter(a);

    ASSERT_EQ(manager.start(Context::background()), StatusCode::OK);
    EXPECT_TRUE(wait_until([&]() { return a->connected.load(); }));
    EXPECT_GE(a->connect_calls.load(), 3);
    manager.stop();
}

TEST_F(AdapterManagerTest, NoReconnectionWhenRetryDisabled) {
    ManagerConfig config = fast_config();
    config.retry_on_failure = false;
    AdapterManager manager(config);
    auto a = std::make_shared<FakeAdapter>("a");
    a->connect_failures = 1;
    manager.register_adapter(a);

    ASSERT_EQ(manager.start(Context::background()), StatusCode::OK);
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(a->connect_calls.load(), 1);
    EXPECT_FALSE(a->connected);
    manager.stop();
}

TEST_F(AdapterManagerTest, StartTwiceIsHarmless) {
    AdapterManager manager(fast_config());
    EXPECT_EQ(manager.start(Context::background()), StatusCode::OK);
    EXPECT_EQ(manager.start(Context::background()), StatusCode::OK);
    EXPECT_TRUE(manager.is_running());
}

TEST_F(AdapterManagerTest, CannotRestartAfterStop) {
    AdapterManager manager(fast_config());
    ASSERT_EQ(manager.start(Context::background()), StatusCode::OK);
    manager.stop();
    EXPECT_EQ(manager.start(Context::background()), StatusCode::NotSupported);
    EXPECT_FALSE(manager.is_running());
}

/**
 * @brief 并发 stop 只执行一次关闭，其余调用等待并返回 OK
 */
TEST_F(AdapterManagerTest, ConcurrentStopRunsOnce) {
    AdapterManager manager(fast_config());
    auto a = std::make_shared<FakeAdapter>("a", std::vector<Metric>{ { MetricType::Uptime, 1.0f } });
    manager.register_adapter(a);
    ASSERT_EQ(manager.start(Context::background()), StatusCode::OK);

    std::vector<std::thread> stoppers;
    std::atomic<int> ok_count { 0 };
    for (int i = 0; i < 4; ++i) {
        stoppers.emplace_back([&]() {
            if (manager.stop() == StatusCode::OK) {
                ++ok_count;
            }
        });
    }
    for (auto& t : stoppers) {
        t.join();
    }

    EXPECT_EQ(ok_count.load(), 4);
    EXPECT_EQ(a->close_calls.load(), 1);
    EXPECT_FALSE(manager.is_running());
    EXPECT_EQ(manager.stop(), StatusCode::OK);
}

/**
 * @brief 采集阻塞中的适配器不会拖住 stop
 */
TEST_F(AdapterManagerTest, StopInterruptsSlowCollection) {
    AdapterManager manager(fast_config());
    auto a = std::make_shared<FakeAdapter>("a", std::vector<Metric>{ { MetricType::Uptime, 1.0f } });
    a->collect_delay = seconds(30);
    manager.register_adapter(a);
    ASSERT_EQ(manager.start(Context::background()), StatusCode::OK);
    ASSERT_TRUE(wait_until([&]() { return a->collect_calls > 0; }));

    const auto begin = steady_clock::now();
    manager.stop();
    EXPECT_LT(steady_clock::now() - begin, seconds(5));
}

TEST_F(AdapterManagerTest, CallerContextCancellationStopsLoops) {
    AdapterManager manager(fast_config());
    auto a = std::make_shared<FakeAdapter>("a", std::vector<Metric>{ { MetricType::Uptime, 1.0f } });
    manager.register_adapter(a);

    Context ctx = Context::with_cancel(Context::background());
    ASSERT_EQ(manager.start(ctx), StatusCode::OK);
    ASSERT_TRUE(wait_until([&]() { return a->collect_calls > 0; }));
    ctx.cancel();

    std::this_thread::sleep_for(milliseconds(50));
    const int calls = a->collect_calls;
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(a->collect_calls.load(), calls);
    EXPECT_EQ(manager.stop(), StatusCode::OK);
}
