#include "PluginManager.hpp"
#include <edgebridge/Logger.hpp>
#include <dlfcn.h>
#include <filesystem>

namespace edgebridge {

PluginManager::Library::~Library() {
	if (handle) {
		dlclose(handle);
	}
}

PluginManager::PluginManager() {
}

PluginManager::~PluginManager() {
	unload_all_plugins();
}

/**
 * @brief 从指定目录加载所有插件
 * @param plugin_dir 插件目录路径
 * @return 成功加载的插件数量
 * @details 扫描目录下文件名含 .so 的常规文件（含版本化 .so.*）
 */
int PluginManager::load_plugins(const std::string& plugin_dir) {
	int loaded_count = 0;
	std::error_code ec;
	std::filesystem::directory_iterator it(plugin_dir, ec);
	if (ec) {
		log(LOG_ERROR, "[Plugin] Error scanning plugin directory " + plugin_dir + ": " + ec.message());
		return 0;
	}

	for (const auto& entry : it) {
		if (!entry.is_regular_file(ec)) continue;
		const std::string filename = entry.path().filename().string();
		if (filename.find(".so") == std::string::npos) continue;
		if (load_plugin(entry.path().string())) loaded_count++;
	}
	return loaded_count;
}

/**
 * @brief 加载单个插件
 * @param plugin_path 插件文件路径
 * @return true 加载成功，false 加载失败
 * @details dlopen 后解析工厂符号，缺少任一符号即拒绝
 */
bool PluginManager::load_plugin(const std::string& plugin_path) {
	std::string plugin_name = extract_plugin_name(plugin_path);
	if (plugin_name.empty()) {
		log(LOG_ERROR, "[Plugin] Cannot extract plugin name from: " + plugin_path);
		return false;
	}

	if (is_plugin_loaded(plugin_name)) {
		log(LOG_INFO, "[Plugin] Plugin already loaded: " + plugin_name);
		return true;
	}

	void* handle = dlopen(plugin_path.c_str(), RTLD_NOW | RTLD_LOCAL);
	if (!handle) {
		const char* err = dlerror();
		log(LOG_ERROR, "[Plugin] Failed to load " + plugin_path + ": " + (err ? err : "unknown error"));
		return false;
	}
	auto library = std::make_shared<Library>(handle);

	auto create_func = reinterpret_cast<create_adapter_func_t>(dlsym(handle, "create_adapter"));
	auto destroy_func = reinterpret_cast<destroy_adapter_func_t>(dlsym(handle, "destroy_adapter"));
	if (!create_func || !destroy_func) {
		log(LOG_ERROR, "[Plugin] Missing factory functions in: " + plugin_path);
		return false;
	}

	PluginInfo info{};
	info.library = library;
	info.path = plugin_path;
	info.create_func = create_func;
	info.destroy_func = destroy_func;
	m_plugins[plugin_name] = info;

	log(LOG_INFO, "[Plugin] Loaded plugin: " + plugin_name);
	return true;
}

void PluginManager::unload_all_plugins() {
	m_plugins.clear();
}

StatusCode PluginManager::unload_plugin(const std::string& plugin_name) {
	auto it = m_plugins.find(plugin_name);
	if (it == m_plugins.end()) {
		return StatusCode::NotFound;
	}
	m_plugins.erase(it);
	log(LOG_INFO, "[Plugin] Unloaded plugin: " + plugin_name);
	return StatusCode::OK;
}

/**
 * @brief 创建适配器实例
 * @param plugin_name 插件名称
 * @return 适配器实例，失败返回空指针
 * @details 删除器同时持有动态库引用，保证 destroy_adapter 调用时库仍在内存中
 */
std::shared_ptr<IAdapter> PluginManager::create_adapter_instance(const std::string& plugin_name) {
	auto it = m_plugins.find(plugin_name);
	if (it == m_plugins.end()) {
		return nullptr;
	}

	IAdapter* raw = it->second.create_func();
	if (!raw) {
		log(LOG_ERROR, "[Plugin] Factory of " + plugin_name + " returned null");
		return nullptr;
	}

	std::shared_ptr<Library> library = it->second.library;
	destroy_adapter_func_t destroy_func = it->second.destroy_func;
	return std::shared_ptr<IAdapter>(raw, [library, destroy_func](IAdapter* adapter) {
		destroy_func(adapter);
	});
}

std::vector<std::string> PluginManager::get_loaded_plugins() const {
	std::vector<std::string> names;
	names.reserve(m_plugins.size());
	for (const auto& kv : m_plugins) names.push_back(kv.first);
	return names;
}

bool PluginManager::is_plugin_loaded(const std::string& plugin_name) const {
	return m_plugins.find(plugin_name) != m_plugins.end();
}

std::string PluginManager::extract_plugin_name(const std::string& plugin_path) {
	std::string filename = std::filesystem::path(plugin_path).filename().string();
	// 截断到 ".so" 之前，同时去掉版本号
	size_t so_pos = filename.find(".so");
	if (so_pos != std::string::npos) {
		filename = filename.substr(0, so_pos);
	}
	const std::string lib_prefix = "lib";
	if (filename.rfind(lib_prefix, 0) == 0) {
		filename = filename.substr(lib_prefix.size());
	}
	return filename;
}

} // namespace edgebridge
