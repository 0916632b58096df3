#pragma once

#include "edgebridge/Context.hpp"
#include "edgebridge/Types.hpp"

namespace edgebridge {

/**
 * @brief 协议适配器能力契约
 *
 * AdapterManager 可能在多个线程中并发调用这些方法（例如状态查询与采集周期同时进行），
 * 实现者需自行保证内部同步。
 */
class IAdapter {
public:
	virtual ~IAdapter() = default;

	/**
	 * 初始化适配器实例（插件创建后调用一次）
	 */
	virtual StatusCode init(const AdapterConfig &config) = 0;

	/**
	 * 适配器名称，在 AdapterManager 生命周期内唯一
	 */
	virtual std::string name() const = 0;

	/**
	 * 连接到物理设备，可能阻塞在网络/串口 I/O 上，须响应 ctx 取消
	 */
	virtual StatusCode connect(const Context &ctx) = 0;

	/**
	 * 断开与物理设备的连接
	 */
	virtual StatusCode close() = 0;

	/**
	 * 当前是否已连接，必须廉价且不阻塞
	 */
	virtual bool is_connected() const = 0;

	/**
	 * [同步] 采集设备全部可用指标，保持设备上报顺序
	 */
	virtual StatusCode collect_metrics(const Context &ctx, std::vector<Metric> &metrics) = 0;

	/**
	 * [同步] 采集单个指标；推送型适配器返回 StatusCode::NotSupported
	 */
	virtual StatusCode collect_metric(const Context &ctx, MetricType type, Metric &metric) = 0;
};

} // namespace edgebridge
