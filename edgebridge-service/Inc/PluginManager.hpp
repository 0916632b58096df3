#pragma once

#include <edgebridge/Factory.hpp>
#include <edgebridge/IAdapter.hpp>
#include <edgebridge/Types.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace edgebridge {

/**
 * @brief 插件管理器，负责动态加载适配器插件并创建实例
 *
 * 创建出的实例持有所属动态库的引用，卸载插件或销毁管理器后，
 * 已创建的实例仍可安全使用，动态库在最后一个实例销毁后才被关闭。
 */
class PluginManager {
public:
    PluginManager();
    ~PluginManager();

    /**
     * @brief 从指定目录加载所有插件
     * @param plugin_dir 插件目录路径
     * @return 加载成功的插件数量
     */
    int load_plugins(const std::string& plugin_dir);

    /**
     * @brief 加载单个插件
     * @param plugin_path 插件文件路径
     * @return 是否加载成功
     */
    bool load_plugin(const std::string& plugin_path);

    void unload_all_plugins();

    /**
     * @brief 卸载指定插件
     * @param plugin_name 规范化插件名
     * @return 不存在返回 NotFound
     */
    StatusCode unload_plugin(const std::string& plugin_name);

    /**
     * @brief 创建适配器实例，删除器调用插件的 destroy_adapter
     * @param plugin_name 插件名称（例如 "frame-adapter"）
     * @return 失败返回空指针
     */
    std::shared_ptr<IAdapter> create_adapter_instance(const std::string& plugin_name);

    std::vector<std::string> get_loaded_plugins() const;

    bool is_plugin_loaded(const std::string& plugin_name) const;

    /**
     * @brief 从插件文件路径提取规范化插件名称
     * 规则：去掉前缀"lib"，截断到".so"之前，去除后续版本号
     * 例如：/usr/lib/edgebridge/plugins/libframe-adapter.so.1.0.0 -> frame-adapter
     */
    static std::string extract_plugin_name(const std::string& plugin_path);

private:
    using create_adapter_func_t = IAdapter*(*)();
    using destroy_adapter_func_t = void(*)(IAdapter*);

    // dlopen 句柄，析构时 dlclose
    struct Library {
        explicit Library(void* h) : handle(h) {}
        ~Library();
        Library(const Library&) = delete;
        Library& operator=(const Library&) = delete;

        void* handle;
    };

    struct PluginInfo {
        std::shared_ptr<Library> library;
        std::string path;
        create_adapter_func_t create_func;
        destroy_adapter_func_t destroy_func;
    };

    std::map<std::string, PluginInfo> m_plugins;  // 键为规范化插件名
};

} // namespace edgebridge
