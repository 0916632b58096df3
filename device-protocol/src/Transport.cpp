#include <edgebridge/protocol/Transport.hpp>
#include <edgebridge/Logger.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

namespace edgebridge {
namespace protocol {

namespace {

int to_poll_timeout(std::chrono::milliseconds timeout) {
	return timeout.count() < 0 ? 0 : static_cast<int>(timeout.count());
}

/**
 * @brief poll 等待可读；返回 >0 可读，0 超时，<0 出错
 */
int wait_readable(int fd, std::chrono::milliseconds timeout) {
	pollfd pfd {};
	pfd.fd = fd;
	pfd.events = POLLIN;
	int rc;
	do {
		rc = ::poll(&pfd, 1, to_poll_timeout(timeout));
	} while (rc < 0 && errno == EINTR);
	return rc;
}

/**
 * @brief 写满 data，非阻塞描述符写缓冲满时等待可写
 */
StatusCode write_all(int fd, const std::vector<uint8_t> &data, int flags, bool is_socket) {
	size_t written = 0;
	while (written < data.size()) {
		ssize_t n = is_socket ? ::send(fd, data.data() + written, data.size() - written, flags)
		                      : ::write(fd, data.data() + written, data.size() - written);
		if (n > 0) {
			written += static_cast<size_t>(n);
			continue;
		}
		if (n < 0 && errno == EINTR) {
			continue;
		}
		if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
			pollfd pfd {};
			pfd.fd = fd;
			pfd.events = POLLOUT;
			if (::poll(&pfd, 1, 1000) <= 0) {
				return StatusCode::Timeout;
			}
			continue;
		}
		return StatusCode::Error;
	}
	return StatusCode::OK;
}

speed_t to_speed(int baudrate) {
	switch (baudrate) {
		case 1200: return B1200;
		case 2400: return B2400;
		case 4800: return B4800;
		case 9600: return B9600;
		case 19200: return B19200;
		case 38400: return B38400;
		case 57600: return B57600;
		case 115200: return B115200;
		case 230400: return B230400;
		default: return B0;
	}
}

bool option_int(const AdapterConfig &config, const std::string &key, int &out) {
	auto it = config.options.find(key);
	if (it == config.options.end()) {
		return false;
	}
	try {
		out = std::stoi(it->second);
		return true;
	} catch (const std::exception &) {
		return false;
	}
}

std::string option_str(const AdapterConfig &config, const std::string &key) {
	auto it = config.options.find(key);
	return it != config.options.end() ? it->second : std::string();
}

} // namespace

// ==================== TcpTransport ====================

TcpTransport::TcpTransport(const std::string &host, int port)
    : m_host(host), m_port(port), m_fd(-1) {
}

TcpTransport::~TcpTransport() {
	close();
}

std::string TcpTransport::address() const {
	return m_host + ":" + std::to_string(m_port);
}

/**
 * @brief 非阻塞 connect + poll，实现带超时的连接
 */
StatusCode TcpTransport::open(std::chrono::milliseconds timeout) {
	if (m_fd >= 0) {
		return StatusCode::OK;
	}

	addrinfo hints {};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	addrinfo *result = nullptr;
	const std::string port_str = std::to_string(m_port);
	int rc = ::getaddrinfo(m_host.c_str(), port_str.c_str(), &hints, &result);
	if (rc != 0 || !result) {
		log(LOG_DEBUG, "[Transport] Cannot resolve " + address() + ": " + gai_strerror(rc));
		return StatusCode::Error;
	}

	StatusCode status = StatusCode::Error;
	for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
		int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
		if (fd < 0) {
			continue;
		}

		rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
		if (rc < 0 && errno == EINPROGRESS) {
			pollfd pfd {};
			pfd.fd = fd;
			pfd.events = POLLOUT;
			rc = ::poll(&pfd, 1, to_poll_timeout(timeout));
			if (rc == 0) {
				status = StatusCode::Timeout;
				::close(fd);
				continue;
			}
			int so_error = 0;
			socklen_t len = sizeof(so_error);
			if (rc < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
				::close(fd);
				continue;
			}
			rc = 0;
		}
		if (rc == 0) {
			m_fd = fd;
			status = StatusCode::OK;
			break;
		}
		::close(fd);
	}
	::freeaddrinfo(result);

	if (status != StatusCode::OK) {
		log(LOG_DEBUG, "[Transport] Failed to connect to " + address() + ": " + to_string(status));
	}
	return status;
}

StatusCode TcpTransport::close() {
	if (m_fd >= 0) {
		::close(m_fd);
		m_fd = -1;
	}
	return StatusCode::OK;
}

bool TcpTransport::is_open() const {
	return m_fd >= 0;
}

StatusCode TcpTransport::send(const std::vector<uint8_t> &data) {
	if (m_fd < 0) {
		return StatusCode::NotConnected;
	}
	return write_all(m_fd, data, MSG_NOSIGNAL, true);
}

StatusCode TcpTransport::receive(uint8_t *buffer, size_t size, std::chrono::milliseconds timeout,
                                 size_t &received) {
	received = 0;
	if (m_fd < 0) {
		return StatusCode::NotConnected;
	}

	int rc = wait_readable(m_fd, timeout);
	if (rc == 0) {
		return StatusCode::OK; // 超时不算错误
	}
	if (rc < 0) {
		return StatusCode::Error;
	}

	ssize_t n = ::recv(m_fd, buffer, size, 0);
	if (n > 0) {
		received = static_cast<size_t>(n);
		return StatusCode::OK;
	}
	if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
		return StatusCode::OK;
	}
	// 对端关闭或读错误
	close();
	return StatusCode::NotConnected;
}

// ==================== SerialTransport ====================

SerialTransport::SerialTransport(const std::string &device_path, int baudrate)
    : m_device_path(device_path), m_baudrate(baudrate), m_fd(-1) {
}

SerialTransport::~SerialTransport() {
	close();
}

StatusCode SerialTransport::open(std::chrono::milliseconds /*timeout*/) {
	if (m_fd >= 0) {
		return StatusCode::OK;
	}

	const speed_t speed = to_speed(m_baudrate);
	if (speed == B0) {
		log(LOG_ERROR, "[Transport] Unsupported baudrate: " + std::to_string(m_baudrate));
		return StatusCode::BadConfig;
	}

	int fd = ::open(m_device_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
	if (fd < 0) {
		log(LOG_DEBUG, "[Transport] Cannot open " + m_device_path + ": " + std::strerror(errno));
		return StatusCode::Error;
	}

	termios tty {};
	if (::tcgetattr(fd, &tty) != 0) {
		::close(fd);
		return StatusCode::Error;
	}
	::cfmakeraw(&tty);
	tty.c_cflag |= (CLOCAL | CREAD);
	tty.c_cflag &= ~CSTOPB;
	tty.c_cflag &= ~CRTSCTS;
	tty.c_cc[VMIN] = 0;
	tty.c_cc[VTIME] = 0;
	::cfsetispeed(&tty, speed);
	::cfsetospeed(&tty, speed);
	if (::tcsetattr(fd, TCSANOW, &tty) != 0) {
		::close(fd);
		return StatusCode::Error;
	}
	::tcflush(fd, TCIOFLUSH);

	m_fd = fd;
	return StatusCode::OK;
}

StatusCode SerialTransport::close() {
	if (m_fd >= 0) {
		::close(m_fd);
		m_fd = -1;
	}
	return StatusCode::OK;
}

bool SerialTransport::is_open() const {
	return m_fd >= 0;
}

StatusCode SerialTransport::send(const std::vector<uint8_t> &data) {
	if (m_fd < 0) {
		return StatusCode::NotConnected;
	}
	return write_all(m_fd, data, 0, false);
}

StatusCode SerialTransport::receive(uint8_t *buffer, size_t size, std::chrono::milliseconds timeout,
                                    size_t &received) {
	received = 0;
	if (m_fd < 0) {
		return StatusCode::NotConnected;
	}

	int rc = wait_readable(m_fd, timeout);
	if (rc == 0) {
		return StatusCode::OK;
	}
	if (rc < 0) {
		return StatusCode::Error;
	}

	ssize_t n = ::read(m_fd, buffer, size);
	if (n > 0) {
		received = static_cast<size_t>(n);
		return StatusCode::OK;
	}
	if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
		return StatusCode::OK;
	}
	close();
	return StatusCode::NotConnected;
}

// ==================== 工厂 ====================

std::unique_ptr<ITransport> create_transport(const AdapterConfig &config) {
	const std::string kind = option_str(config, "transport");

	if (kind == "tcp") {
		const std::string host = option_str(config, "host");
		int port = 0;
		if (host.empty() || !option_int(config, "port", port) || port <= 0) {
			return nullptr;
		}
		return std::make_unique<TcpTransport>(host, port);
	}

	if (kind == "serial") {
		const std::string device_path = option_str(config, "device_path");
		int baudrate = 115200;
		option_int(config, "baudrate", baudrate);
		if (device_path.empty()) {
			return nullptr;
		}
		return std::make_unique<SerialTransport>(device_path, baudrate);
	}

	return nullptr;
}

} // namespace protocol
} // namespace edgebridge
