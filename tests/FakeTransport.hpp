#pragma once

#include <edgebridge/protocol/FrameParser.hpp>
#include <edgebridge/protocol/Message.hpp>
#include <edgebridge/protocol/Transport.hpp>
#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace edgebridge {
namespace test {

/**
 * @brief 内存链路：解析发出的帧，交给 responder 生成应答帧后放入接收缓冲
 */
class FakeTransport : public protocol::ITransport {
public:
    using Responder = std::function<std::vector<protocol::Message>(const protocol::Message&)>;

    explicit FakeTransport(Responder responder = nullptr) : m_responder(std::move(responder)) {}

    StatusCode open(std::chrono::milliseconds) override {
        ++open_calls;
        if (open_status != StatusCode::OK) {
            return open_status;
        }
        m_open = true;
        return StatusCode::OK;
    }

    StatusCode close() override {
        m_open = false;
        return StatusCode::OK;
    }

    bool is_open() const override { return m_open; }

    StatusCode send(const std::vector<uint8_t>& data) override {
        if (!m_open) {
            return StatusCode::NotConnected;
        }
        if (send_status != StatusCode::OK) {
            return send_status;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& request : m_parser.parse(data)) {
            m_requests.push_back(request);
            if (!m_responder) {
                continue;
            }
            for (const auto& reply : m_responder(request)) {
                std::vector<uint8_t> frame;
                if (protocol::build_frame(reply, frame) == StatusCode::OK) {
                    m_rx.insert(m_rx.end(), frame.begin(), frame.end());
                }
            }
        }
        return StatusCode::OK;
    }

    StatusCode receive(uint8_t* buffer, size_t size, std::chrono::milliseconds timeout,
                       size_t& received) override {
        received = 0;
        if (!m_open) {
            return StatusCode::NotConnected;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_rx.empty()) {
                received = std::min(size, m_rx.size());
                std::copy(m_rx.begin(), m_rx.begin() + received, buffer);
                m_rx.erase(m_rx.begin(), m_rx.begin() + received);
                return StatusCode::OK;
            }
        }
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(10)));
        return StatusCode::OK;
    }

    std::string type() const override { return "fake"; }

    /** 追加原始字节（可以是损坏的帧） */
    void inject(const std::vector<uint8_t>& bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_rx.insert(m_rx.end(), bytes.begin(), bytes.end());
    }

    std::vector<protocol::Message> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    std::atomic<int> open_calls { 0 };
    StatusCode open_status = StatusCode::OK;
    StatusCode send_status = StatusCode::OK;

private:
    Responder m_responder;
    std::atomic<bool> m_open { false };

    mutable std::mutex m_mutex;
    protocol::FrameParser m_parser;
    std::vector<uint8_t> m_rx;
    std::vector<protocol::Message> m_requests;
};

/**
 * @brief 以请求的序列号构造应答
 */
inline protocol::Message reply_to(const protocol::Message& request, uint8_t type,
                                  std::vector<uint8_t> payload = {}) {
    protocol::Message msg;
    msg.type = type;
    msg.sequence = request.sequence;
    msg.payload = std::move(payload);
    return msg;
}

} // namespace test
} // namespace edgebridge
