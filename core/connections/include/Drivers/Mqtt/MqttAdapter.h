// =============================================================================
// connections/include/Drivers/Mqtt/MqttAdapter.h
// Eclipse Paho MQTT C++ 기반 MQTT 어댑터
// =============================================================================

#ifndef OTLINK_DRIVERS_MQTT_ADAPTER_H
#define OTLINK_DRIVERS_MQTT_ADAPTER_H

#include "Drivers/Common/IOtAdapter.h"

#include <mqtt/async_client.h>
#include <mqtt/callback.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace OtLink {
namespace Drivers {

// =============================================================================
// MqttMessageRouter - paho 콜백을 등록된 리스너들로 전달
// =============================================================================

/**
 * @brief paho 콜백 스레드에서 호출된다. 리스너는 AddListener/RemoveListener 로
 *        수집 구간 동안만 등록된다.
 */
class MqttMessageRouter : public virtual mqtt::callback {
public:
  using Listener = std::function<void(const Structs::MqttMessage &)>;

  explicit MqttMessageRouter(const std::string &server_uri)
      : server_uri_(server_uri) {}

  void connected(const std::string &cause) override;
  void connection_lost(const std::string &cause) override;
  void message_arrived(mqtt::const_message_ptr msg) override;
  void delivery_complete(mqtt::delivery_token_ptr) override {}

  int AddListener(Listener listener);
  void RemoveListener(int id);

  bool IsConnectionLost() const { return connection_lost_.load(); }

  /**
   * @brief payload 를 JSON 으로 파싱, 실패하면 원문 문자열
   */
  static Structs::JsonType ParsePayload(const std::string &payload);

private:
  std::string server_uri_;
  std::mutex listeners_mutex_;
  std::map<int, Listener> listeners_;
  int next_listener_id_ = 1;
  std::atomic<bool> connection_lost_{false};
};

// =============================================================================
// MqttMessageCollector - 수집 구간 동안 구독 필터와 맞는 메시지 누적
// =============================================================================

class MqttMessageCollector {
public:
  explicit MqttMessageCollector(std::vector<std::string> filters)
      : filters_(std::move(filters)) {}

  /**
   * @return 필터와 맞아 보관했으면 true
   */
  bool Accept(const Structs::MqttMessage &message);

  /**
   * @brief 현재까지 모은 결과 (topic_count / message_count / timestamp 채움)
   */
  Structs::MqttCollectResult Snapshot() const;

private:
  std::vector<std::string> filters_;
  mutable std::mutex mutex_;
  Structs::MqttCollectResult data_;
};

// =============================================================================
// MqttSession
// =============================================================================

/**
 * @brief 라우터가 client 보다 먼저 선언되어 client 가 먼저 파괴된다
 */
class MqttSession : public AdapterSession {
public:
  MqttSession() : AdapterSession(ProtocolType::MQTT) {}
  ~MqttSession() override = default;

  std::string server_uri;
  std::string client_id;
  std::shared_ptr<MqttMessageRouter> router;
  std::unique_ptr<mqtt::async_client> client;
};

// =============================================================================
// MqttAdapter
// =============================================================================

class MqttAdapter : public IMqttAdapter {
public:
  MqttAdapter() = default;
  ~MqttAdapter() override = default;

  ProtocolType GetProtocolType() const override { return ProtocolType::MQTT; }

  SessionPtr Connect(const ConnectionConfig &config,
                     ErrorInfo &error) override;
  bool VerifyLive(const SessionPtr &session) override;
  bool Probe(const SessionPtr &session, std::string &message,
             ErrorInfo &error) override;
  void Disconnect(const SessionPtr &session) override;

  bool CollectMessages(const SessionPtr &session,
                       const std::vector<std::string> &topics, int qos,
                       std::chrono::milliseconds window,
                       Structs::MqttCollectResult &result,
                       ErrorInfo &error) override;

  /**
   * @brief <scheme>://<broker>:<port> (mqtt -> tcp, mqtts -> ssl)
   */
  static std::string BuildServerUri(const Structs::MqttSettings &settings);

private:
  static std::shared_ptr<MqttSession> AsMqttSession(const SessionPtr &session);
};

} // namespace Drivers
} // namespace OtLink

#endif // OTLINK_DRIVERS_MQTT_ADAPTER_H
