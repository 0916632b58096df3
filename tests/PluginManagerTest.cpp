#include "PluginManager.hpp"
#include <edgebridge/Logger.hpp>
#include <gtest/gtest.h>

using namespace edgebridge;

class PluginManagerTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_level(LOG_ERROR); }
    void TearDown() override { set_log_level(LOG_INFO); }

    PluginManager plugins;
};

TEST_F(PluginManagerTest, ExtractsCanonicalPluginName) {
    EXPECT_EQ(PluginManager::extract_plugin_name("/usr/lib/edgebridge/plugins/libframe-adapter.so.1.0.0"),
              "frame-adapter");
    EXPECT_EQ(PluginManager::extract_plugin_name("libmodbus-adapter.so"), "modbus-adapter");
    EXPECT_EQ(PluginManager::extract_plugin_name("custom.so"), "custom");
    EXPECT_EQ(PluginManager::extract_plugin_name("/plugins/libreader.so.2"), "reader");
}

TEST_F(PluginManagerTest, MissingDirectoryLoadsNothing) {
    EXPECT_EQ(plugins.load_plugins("/nonexistent/edgebridge/plugins"), 0);
    EXPECT_TRUE(plugins.get_loaded_plugins().empty());
}

TEST_F(PluginManagerTest, MissingFileFailsToLoad) {
    EXPECT_FALSE(plugins.load_plugin("/nonexistent/libghost-adapter.so"));
    EXPECT_FALSE(plugins.is_plugin_loaded("ghost-adapter"));
    EXPECT_EQ(plugins.create_adapter_instance("ghost-adapter"), nullptr);
    EXPECT_EQ(plugins.unload_plugin("ghost-adapter"), StatusCode::NotFound);
}

#ifdef EDGEBRIDGE_TEST_FRAME_PLUGIN

/**
 * @brief 卸载插件后，已创建的实例仍然可用
 */
TEST_F(PluginManagerTest, InstancesOutliveUnloadedPlugin) {
    ASSERT_TRUE(plugins.load_plugin(EDGEBRIDGE_TEST_FRAME_PLUGIN));
    ASSERT_TRUE(plugins.is_plugin_loaded("frame-adapter"));
    EXPECT_TRUE(plugins.load_plugin(EDGEBRIDGE_TEST_FRAME_PLUGIN));

    std::shared_ptr<IAdapter> adapter = plugins.create_adapter_instance("frame-adapter");
    ASSERT_NE(adapter, nullptr);

    AdapterConfig config;
    config.name = "cabinet";
    config.options["transport"] = "tcp";
    config.options["host"] = "127.0.0.1";
    config.options["port"] = "5020";
    ASSERT_EQ(adapter->init(config), StatusCode::OK);

    EXPECT_EQ(plugins.unload_plugin("frame-adapter"), StatusCode::OK);
    EXPECT_FALSE(plugins.is_plugin_loaded("frame-adapter"));
    EXPECT_EQ(adapter->name(), "cabinet");
    EXPECT_FALSE(adapter->is_connected());
    adapter.reset();
}

#endif
