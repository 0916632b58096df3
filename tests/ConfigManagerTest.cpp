#include "ConfigManager.hpp"
#include <edgebridge/Logger.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace edgebridge;
using namespace std::chrono;

namespace {

const char* SAMPLE_CONFIG = R"(
# 全局配置
plugin_dir = /opt/edgebridge/plugins
log_level = 2
station_id = site-042
command_device = controller
collect_interval = 15
retry_interval = 5
metrics_buffer_size = 500
max_concurrent_collections = 4
retry_on_failure = true
command_poll_interval = 20

[controller]
adapter_type = frame-adapter
transport = serial
device_path = /dev/ttyS1
baudrate = 57600
mapping = id:TEMPERATURE,metric:TEMPERATURE,scale:0.1,offset:-2,desc:cabinet temperature
mapping = id:0x04,metric:humidity

[plc]
adapter_type = modbus-adapter
enabled = false
connection_type = tcp
ip_address = 10.0.0.5
mapping = id:holding/100/float32,metric:VOLTAGE
)";

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_level(LOG_ERROR); }
    void TearDown() override { set_log_level(LOG_INFO); }

    bool validate(const std::string& content, std::string& error) {
        if (!config.load_from_string(content)) {
            error = "load failed";
            return false;
        }
        return config.validate_config(error);
    }

    ConfigManager config;
};

TEST_F(ConfigManagerTest, ParsesGlobalsAndSections) {
    ASSERT_TRUE(config.load_from_string(SAMPLE_CONFIG));
    std::string error;
    EXPECT_TRUE(config.validate_config(error)) << error;

    const ServiceConfig& service = config.get_service_config();
    EXPECT_EQ(service.plugin_dir, "/opt/edgebridge/plugins");
    EXPECT_EQ(service.log_level, 2);
    EXPECT_EQ(service.station_id, "site-042");
    EXPECT_EQ(service.command_device, "controller");
    EXPECT_EQ(service.manager.collect_interval, seconds(15));
    EXPECT_EQ(service.manager.retry_interval, seconds(5));
    EXPECT_EQ(service.manager.metrics_buffer_size, 500);
    EXPECT_EQ(service.manager.max_concurrent_collections, 4);
    EXPECT_TRUE(service.manager.retry_on_failure);
    EXPECT_EQ(service.command_poll_interval, seconds(20));
    ASSERT_EQ(config.get_all_devices().size(), 2u);

    const DeviceConfig* controller = config.get_device_config("controller");
    ASSERT_NE(controller, nullptr);
    EXPECT_EQ(controller->adapter_type, "frame-adapter");
    EXPECT_TRUE(controller->enabled);
    EXPECT_EQ(controller->adapter_config.name, "controller");
    EXPECT_EQ(controller->adapter_config.options.at("device_path"), "/dev/ttyS1");
    EXPECT_EQ(controller->adapter_config.options.at("baudrate"), "57600");
    EXPECT_EQ(controller->adapter_config.options.count("adapter_type"), 0u);

    ASSERT_EQ(controller->adapter_config.mappings.size(), 2u);
    const MetricMapping& temperature = controller->adapter_config.mappings[0];
    EXPECT_EQ(temperature.external_id, "TEMPERATURE");
    EXPECT_EQ(temperature.metric_type, MetricType::Temperature);
    EXPECT_FLOAT_EQ(temperature.scale, 0.1f);
    EXPECT_FLOAT_EQ(temperature.offset, -2.0f);
    EXPECT_EQ(temperature.description, "cabinet temperature");
    EXPECT_EQ(controller->adapter_config.mappings[1].metric_type, MetricType::Humidity);

    const DeviceConfig* plc = config.get_device_config("plc");
    ASSERT_NE(plc, nullptr);
    EXPECT_FALSE(plc->enabled);
    EXPECT_EQ(plc->adapter_config.mappings[0].external_id, "holding/100/float32");
}

TEST_F(ConfigManagerTest, EmptyContentUsesDefaults) {
    ASSERT_TRUE(config.load_from_string(""));
    const ServiceConfig& service = config.get_service_config();
    EXPECT_EQ(service.plugin_dir, "/usr/lib/edgebridge/plugins");
    EXPECT_EQ(service.log_level, LOG_INFO);
    EXPECT_EQ(service.manager.collect_interval, seconds(30));
    EXPECT_EQ(service.manager.metrics_buffer_size, 10000);
    EXPECT_TRUE(config.get_all_devices().empty());
    EXPECT_TRUE(config.validate_config());
}

TEST_F(ConfigManagerTest, UnknownSectionReturnsNull) {
    ASSERT_TRUE(config.load_from_string(SAMPLE_CONFIG));
    EXPECT_EQ(config.get_device_config("missing"), nullptr);
}

/**
 * @brief 解析失败时保留之前的配置
 */
TEST_F(ConfigManagerTest, MalformedLineKeepsPreviousConfig) {
    ASSERT_TRUE(config.load_from_string(SAMPLE_CONFIG));
    EXPECT_FALSE(config.load_from_string("plugin_dir = /tmp\nthis line has no separator\n"));
    EXPECT_EQ(config.get_service_config().plugin_dir, "/opt/edgebridge/plugins");
}

TEST_F(ConfigManagerTest, NonNumericIntervalFailsToLoad) {
    EXPECT_FALSE(config.load_from_string("collect_interval = soon\n"));
    EXPECT_FALSE(config.load_from_string("log_level = 1x\n"));
}

TEST_F(ConfigManagerTest, RejectsDuplicateSections) {
    std::string error;
    EXPECT_FALSE(validate("[a]\nadapter_type = x\n[a]\nadapter_type = y\n", error));
    EXPECT_EQ(error, "Duplicate section: a");
}

TEST_F(ConfigManagerTest, RejectsSectionWithoutAdapterType) {
    std::string error;
    EXPECT_FALSE(validate("[a]\nhost = 1.2.3.4\n", error));
    EXPECT_EQ(error, "Adapter type not specified for section: a");
}

TEST_F(ConfigManagerTest, RejectsInvalidMappings) {
    std::string error;
    EXPECT_FALSE(validate("[a]\nadapter_type = x\nmapping = id:1,metric:NOT_A_METRIC\n", error));
    EXPECT_NE(error.find("Invalid mapping in section a"), std::string::npos);

    EXPECT_FALSE(validate("[a]\nadapter_type = x\nmapping = metric:TEMPERATURE\n", error));
    EXPECT_FALSE(validate("[a]\nadapter_type = x\nmapping = id:1,metric:ALL\n", error));
    EXPECT_FALSE(validate("[a]\nadapter_type = x\nmapping = id:1,metric:TEMPERATURE,scale:big\n", error));
}

TEST_F(ConfigManagerTest, RejectsUnknownCommandDevice) {
    std::string error;
    EXPECT_FALSE(validate("command_device = ghost\n[a]\nadapter_type = x\n", error));
    EXPECT_EQ(error, "command_device refers to unknown section: ghost");
}

TEST_F(ConfigManagerTest, RejectsNonPositiveIntervals) {
    std::string error;
    EXPECT_FALSE(validate("collect_interval = 0\n", error));
    EXPECT_EQ(error, "collect_interval must be positive");

    EXPECT_FALSE(validate("retry_interval = -1\n", error));
    EXPECT_TRUE(validate("retry_interval = -1\nretry_on_failure = false\n", error)) << error;

    EXPECT_FALSE(validate("command_poll_interval = 0\n", error));
    EXPECT_EQ(error, "command_poll_interval must be positive");
}

TEST_F(ConfigManagerTest, RejectsEmptyPluginDir) {
    std::string error;
    EXPECT_FALSE(validate("plugin_dir =\n", error));
    EXPECT_EQ(error, "Plugin directory not specified");
}

TEST_F(ConfigManagerTest, LoadAndReloadFromFile) {
    const std::string path = ::testing::TempDir() + "edgebridge_config_test.conf";
    {
        std::ofstream out(path);
        out << "station_id = first\n";
    }
    ASSERT_TRUE(config.load_config(path));
    EXPECT_EQ(config.get_service_config().station_id, "first");

    {
        std::ofstream out(path);
        out << "station_id = second\n";
    }
    ASSERT_TRUE(config.reload_config());
    EXPECT_EQ(config.get_service_config().station_id, "second");
    std::remove(path.c_str());
}

TEST_F(ConfigManagerTest, MissingFileFailsToLoad) {
    EXPECT_FALSE(config.load_config("/nonexistent/edgebridge.conf"));
    EXPECT_FALSE(config.reload_config());
}
