#pragma once

#include <edgebridge/Context.hpp>
#include <edgebridge/Types.hpp>
#include "edgebridge/protocol/FrameParser.hpp"
#include "edgebridge/protocol/Message.hpp"
#include "edgebridge/protocol/Payloads.hpp"
#include "edgebridge/protocol/Transport.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace edgebridge {
namespace protocol {

/**
 * @brief 本地设备命令下发接口，CommandExecutor 通过它把命令送到设备
 */
class IDeviceDispatcher {
public:
	virtual ~IDeviceDispatcher() = default;

	/**
	 * @brief 下发命令并等待结果
	 * @param params 命令参数原始字节
	 * @param result 设备返回的执行结果
	 */
	virtual StatusCode execute_command(CommandType type, const std::vector<uint8_t> &params,
	                                   CommandResultPayload &result) = 0;
};

/**
 * @brief 基于帧协议的设备客户端
 *
 * 持有一条链路和该链路专属的 FrameParser。请求按序列号匹配响应，
 * 等待期间收到的事件帧交给事件回调。所有请求串行化执行。
 */
class DeviceClient : public IDeviceDispatcher {
public:
	using EventCallback = std::function<void(const Message &)>;

	explicit DeviceClient(std::unique_ptr<ITransport> transport,
	                      std::chrono::milliseconds response_timeout = std::chrono::milliseconds(5000));
	~DeviceClient() override;

	DeviceClient(const DeviceClient &) = delete;
	DeviceClient &operator=(const DeviceClient &) = delete;

	StatusCode connect(const Context &ctx);
	StatusCode close();
	bool is_connected() const;

	/**
	 * @brief 发送请求并等待同序列号的响应
	 * @return StatusCode::OK；超过响应超时返回 Timeout；ctx 取消返回 Cancelled；
	 *         链路 I/O 出错时标记断开并返回 NotConnected
	 */
	StatusCode send_and_wait(const Context &ctx, const Message &request, Message &response);

	StatusCode ping(const Context &ctx);

	/**
	 * @brief 请求指标，types 为空表示全部
	 */
	StatusCode request_metrics(const Context &ctx, const std::vector<MetricType> &types,
	                           std::vector<Metric> &metrics);

	StatusCode request_status(const Context &ctx, StatusPayload &status);

	StatusCode execute_command(const Context &ctx, CommandType type, const std::vector<uint8_t> &params,
	                           CommandResultPayload &result);

	StatusCode execute_command(CommandType type, const std::vector<uint8_t> &params,
	                           CommandResultPayload &result) override;

	/** 未请求的事件帧回调，在请求线程中调用，回调内不得再调用本客户端 */
	void set_event_callback(EventCallback callback);

	uint32_t crc_errors() const;

	std::string transport_type() const;

private:
	uint8_t next_sequence();
	void mark_disconnected();

	std::unique_ptr<ITransport> m_transport;
	std::chrono::milliseconds m_response_timeout;
	FrameParser m_parser;
	uint8_t m_sequence;
	std::atomic<bool> m_connected;

	mutable std::mutex m_io_mutex;       // 保护链路、解析器和序列号
	std::mutex m_callback_mutex;
	EventCallback m_event_callback;
};

} // namespace protocol
} // namespace edgebridge
