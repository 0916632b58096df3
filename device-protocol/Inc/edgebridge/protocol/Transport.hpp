#pragma once

#include <edgebridge/Types.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace edgebridge {
namespace protocol {

/**
 * @brief 设备链路抽象（串口 / TCP）
 */
class ITransport {
public:
	virtual ~ITransport() = default;

	/**
	 * @brief 建立连接，最长阻塞 timeout
	 */
	virtual StatusCode open(std::chrono::milliseconds timeout) = 0;

	virtual StatusCode close() = 0;

	virtual bool is_open() const = 0;

	/**
	 * @brief 发送完整数据
	 */
	virtual StatusCode send(const std::vector<uint8_t> &data) = 0;

	/**
	 * @brief 读取数据，最长等待 timeout
	 * @param received 实际读取字节数；超时不是错误，返回 OK 且 received 为 0
	 */
	virtual StatusCode receive(uint8_t *buffer, size_t size, std::chrono::milliseconds timeout,
	                           size_t &received) = 0;

	/** 链路类型标识，如 "tcp"、"serial" */
	virtual std::string type() const = 0;
};

/**
 * @brief 基于 POSIX 套接字的 TCP 链路
 */
class TcpTransport : public ITransport {
public:
	TcpTransport(const std::string &host, int port);
	~TcpTransport() override;

	StatusCode open(std::chrono::milliseconds timeout) override;
	StatusCode close() override;
	bool is_open() const override;
	StatusCode send(const std::vector<uint8_t> &data) override;
	StatusCode receive(uint8_t *buffer, size_t size, std::chrono::milliseconds timeout,
	                   size_t &received) override;
	std::string type() const override { return "tcp"; }

	std::string address() const;

private:
	std::string m_host;
	int m_port;
	int m_fd;
};

/**
 * @brief 基于 termios 的串口链路（原始模式，8N1）
 */
class SerialTransport : public ITransport {
public:
	SerialTransport(const std::string &device_path, int baudrate);
	~SerialTransport() override;

	StatusCode open(std::chrono::milliseconds timeout) override;
	StatusCode close() override;
	bool is_open() const override;
	StatusCode send(const std::vector<uint8_t> &data) override;
	StatusCode receive(uint8_t *buffer, size_t size, std::chrono::milliseconds timeout,
	                   size_t &received) override;
	std::string type() const override { return "serial"; }

private:
	std::string m_device_path;
	int m_baudrate;
	int m_fd;
};

/**
 * @brief 根据适配器配置创建链路
 * @details options: transport=tcp|serial，host/port 或 device_path/baudrate
 * @return 配置不完整时返回 nullptr
 */
std::unique_ptr<ITransport> create_transport(const AdapterConfig &config);

} // namespace protocol
} // namespace edgebridge
