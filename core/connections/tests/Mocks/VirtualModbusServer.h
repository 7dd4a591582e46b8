// =============================================================================
// connections/tests/Mocks/VirtualModbusServer.h
// 테스트용 인프로세스 Modbus TCP 서버 (POSIX 소켓, MBAP 프레이밍)
// =============================================================================

#ifndef OTLINK_TESTS_VIRTUAL_MODBUS_SERVER_H
#define OTLINK_TESTS_VIRTUAL_MODBUS_SERVER_H

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace OtLink {
namespace Testing {

/**
 * @brief 127.0.0.1 의 임의 포트에서 FC1-4 를 처리한다
 *
 * 주소가 register_count 이상이면 예외 응답 (fc | 0x80, 0x02 Illegal Data
 * Address) 을 보낸다. silent 이면 요청을 읽기만 하고 응답하지 않는다.
 */
class VirtualModbusServer {
public:
  explicit VirtualModbusServer(uint16_t register_count = 16)
      : registers_(register_count, 0) {
    for (uint16_t i = 0; i < register_count; ++i) {
      registers_[i] = static_cast<uint16_t>(100 + i);
    }
  }

  ~VirtualModbusServer() { Stop(); }

  bool Start() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
      return false;
    }
    int reuse = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) <
            0 ||
        ::listen(listen_fd_, 8) < 0) {
      ::close(listen_fd_);
      listen_fd_ = -1;
      return false;
    }

    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    running_ = true;
    accept_thread_ = std::thread(&VirtualModbusServer::AcceptLoop, this);
    return true;
  }

  void Stop() {
    if (!running_.exchange(false)) {
      return;
    }
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    std::vector<std::thread> clients;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      clients.swap(client_threads_);
    }
    for (auto &t : clients) {
      if (t.joinable()) {
        t.join();
      }
    }
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
      listen_fd_ = -1;
    }
  }

  int GetPort() const { return port_; }
  int GetRequestCount() const { return request_count_.load(); }
  int GetAcceptedCount() const { return accepted_count_.load(); }

  void SetSilent(bool silent) { silent_ = silent; }

private:
  void AcceptLoop() {
    while (running_.load()) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      int client_fd = ::accept(listen_fd_, nullptr, nullptr);
      if (client_fd < 0) {
        continue;
      }
      accepted_count_++;
      std::lock_guard<std::mutex> lock(mutex_);
      client_threads_.emplace_back(&VirtualModbusServer::ClientLoop, this,
                                   client_fd);
    }
  }

  // stop 을 확인하면서 정확히 size 바이트 읽기
  bool ReadExact(int fd, uint8_t *buffer, size_t size) {
    size_t received = 0;
    while (received < size) {
      if (!running_.load()) {
        return false;
      }
      pollfd pfd{fd, POLLIN, 0};
      int ready = ::poll(&pfd, 1, 50);
      if (ready == 0) {
        continue;
      }
      if (ready < 0) {
        return false;
      }
      ssize_t n = ::recv(fd, buffer + received, size - received, 0);
      if (n <= 0) {
        return false;
      }
      received += static_cast<size_t>(n);
    }
    return true;
  }

  void ClientLoop(int fd) {
    uint8_t header[7];
    while (ReadExact(fd, header, sizeof(header))) {
      uint16_t length = static_cast<uint16_t>((header[4] << 8) | header[5]);
      if (length < 2 || length > 256) {
        break;
      }
      std::vector<uint8_t> pdu(length - 1);
      if (!ReadExact(fd, pdu.data(), pdu.size())) {
        break;
      }
      request_count_++;
      if (silent_.load()) {
        continue;
      }

      std::vector<uint8_t> response = HandlePdu(pdu);
      std::vector<uint8_t> frame;
      frame.push_back(header[0]); // transaction id
      frame.push_back(header[1]);
      frame.push_back(0); // protocol id
      frame.push_back(0);
      uint16_t out_length = static_cast<uint16_t>(response.size() + 1);
      frame.push_back(static_cast<uint8_t>(out_length >> 8));
      frame.push_back(static_cast<uint8_t>(out_length & 0xFF));
      frame.push_back(header[6]); // unit id
      frame.insert(frame.end(), response.begin(), response.end());
      if (::send(fd, frame.data(), frame.size(), MSG_NOSIGNAL) < 0) {
        break;
      }
    }
    ::close(fd);
  }

  std::vector<uint8_t> HandlePdu(const std::vector<uint8_t> &pdu) {
    uint8_t function_code = pdu.empty() ? 0 : pdu[0];
    if (function_code < 1 || function_code > 4 || pdu.size() < 5) {
      return {static_cast<uint8_t>(function_code | 0x80), 0x01};
    }
    uint16_t start = static_cast<uint16_t>((pdu[1] << 8) | pdu[2]);
    uint16_t quantity = static_cast<uint16_t>((pdu[3] << 8) | pdu[4]);
    if (quantity == 0 || start + quantity > registers_.size()) {
      return {static_cast<uint8_t>(function_code | 0x80), 0x02};
    }

    std::vector<uint8_t> response{function_code};
    if (function_code <= 2) {
      // 코일/입력: 홀수 주소만 ON
      uint8_t byte_count = static_cast<uint8_t>((quantity + 7) / 8);
      response.push_back(byte_count);
      std::vector<uint8_t> bits(byte_count, 0);
      for (uint16_t i = 0; i < quantity; ++i) {
        if ((start + i) % 2 == 1) {
          bits[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
        }
      }
      response.insert(response.end(), bits.begin(), bits.end());
    } else {
      // FC4 입력 레지스터는 홀딩 레지스터 + 1000
      uint16_t offset = function_code == 4 ? 1000 : 0;
      response.push_back(static_cast<uint8_t>(quantity * 2));
      for (uint16_t i = 0; i < quantity; ++i) {
        uint16_t value = static_cast<uint16_t>(registers_[start + i] + offset);
        response.push_back(static_cast<uint8_t>(value >> 8));
        response.push_back(static_cast<uint8_t>(value & 0xFF));
      }
    }
    return response;
  }

  std::vector<uint16_t> registers_;
  int listen_fd_ = -1;
  int port_ = 0;
  std::atomic<bool> running_{false};
  std::atomic<bool> silent_{false};
  std::atomic<int> request_count_{0};
  std::atomic<int> accepted_count_{0};
  std::thread accept_thread_;
  std::mutex mutex_;
  std::vector<std::thread> client_threads_;
};

} // namespace Testing
} // namespace OtLink

#endif // OTLINK_TESTS_VIRTUAL_MODBUS_SERVER_H
