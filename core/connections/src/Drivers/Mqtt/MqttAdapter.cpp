// =============================================================================
// connections/src/Drivers/Mqtt/MqttAdapter.cpp
// MQTT 어댑터 구현 (paho.mqtt.cpp async_client)
// =============================================================================

#include "Drivers/Mqtt/MqttAdapter.h"
#include "Drivers/Mqtt/MqttTopicFilter.h"
#include "Logging/LogManager.h"

#include <mqtt/connect_options.h>
#include <mqtt/ssl_options.h>

#include <algorithm>
#include <chrono>
#include <thread>

namespace OtLink {
namespace Drivers {

using namespace std::chrono;

// =============================================================================
// MqttMessageRouter
// =============================================================================

void MqttMessageRouter::connected(const std::string &cause) {
  connection_lost_ = false;
  LogManager::getInstance().logDriver(
      "mqtt", LogLevel::DEBUG,
      "Connected to " + server_uri_ + (cause.empty() ? "" : " (" + cause + ")"));
}

void MqttMessageRouter::connection_lost(const std::string &cause) {
  connection_lost_ = true;
  LogManager::getInstance().logDriver(
      "mqtt", LogLevel::WARN,
      "Connection lost: " + server_uri_ +
          (cause.empty() ? "" : " (" + cause + ")"));
}

void MqttMessageRouter::message_arrived(mqtt::const_message_ptr msg) {
  if (!msg) {
    return;
  }
  Structs::MqttMessage message;
  message.topic = msg->get_topic();
  message.payload = ParsePayload(msg->to_string());
  message.timestamp = BasicTypes::NowIso8601();

  std::lock_guard<std::mutex> lock(listeners_mutex_);
  for (auto &pair : listeners_) {
    pair.second(message);
  }
}

int MqttMessageRouter::AddListener(Listener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  int id = next_listener_id_++;
  listeners_[id] = std::move(listener);
  return id;
}

void MqttMessageRouter::RemoveListener(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(id);
}

Structs::JsonType MqttMessageRouter::ParsePayload(const std::string &payload) {
  auto parsed = Structs::JsonType::parse(payload, nullptr, false);
  if (parsed.is_discarded()) {
    return Structs::JsonType(payload);
  }
  return parsed;
}

// =============================================================================
// MqttMessageCollector
// =============================================================================

bool MqttMessageCollector::Accept(const Structs::MqttMessage &message) {
  if (!TopicMatchesAny(filters_, message.topic)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  data_.topic_data[message.topic].push_back(message.payload);
  data_.messages.push_back(message);
  return true;
}

Structs::MqttCollectResult MqttMessageCollector::Snapshot() const {
  Structs::MqttCollectResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result = data_;
  }
  result.timestamp = BasicTypes::NowIso8601();
  result.topic_count = result.topic_data.size();
  result.message_count = result.messages.size();
  return result;
}

// =============================================================================
// MqttAdapter
// =============================================================================

std::string MqttAdapter::BuildServerUri(const Structs::MqttSettings &settings) {
  std::string scheme = settings.scheme;
  if (scheme.empty() || scheme == "mqtt" || scheme == "tcp") {
    scheme = "tcp";
  } else if (scheme == "mqtts" || scheme == "ssl") {
    scheme = "ssl";
  }
  return scheme + "://" + settings.broker + ":" + std::to_string(settings.port);
}

std::shared_ptr<MqttSession>
MqttAdapter::AsMqttSession(const SessionPtr &session) {
  return std::dynamic_pointer_cast<MqttSession>(session);
}

SessionPtr MqttAdapter::Connect(const ConnectionConfig &config,
                                ErrorInfo &error) {
  const auto &settings = config.mqtt;
  if (settings.broker.empty()) {
    error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                      "MQTT broker and port are required");
    return nullptr;
  }

  auto session = std::make_shared<MqttSession>();
  session->server_uri = BuildServerUri(settings);
  session->client_id =
      settings.client_id.empty()
          ? "mqtt_client_" + std::to_string(BasicTypes::NowEpochMs())
          : settings.client_id;

  auto start_time = steady_clock::now();
  try {
    session->router = std::make_shared<MqttMessageRouter>(session->server_uri);
    session->client = std::make_unique<mqtt::async_client>(session->server_uri,
                                                           session->client_id);
    session->client->set_callback(*session->router);

    mqtt::connect_options connOpts;
    connOpts.set_keep_alive_interval(settings.keep_alive_s);
    connOpts.set_clean_session(true);
    connOpts.set_automatic_reconnect(false);
    connOpts.set_connect_timeout(milliseconds(settings.connect_timeout_ms));

    if (!settings.username.empty()) {
      connOpts.set_user_name(settings.username);
    }
    if (!settings.password.empty()) {
      connOpts.set_password(settings.password);
    }
    if (session->server_uri.compare(0, 6, "ssl://") == 0 ||
        session->server_uri.compare(0, 6, "wss://") == 0) {
      connOpts.set_ssl(mqtt::ssl_options());
    }

    auto token = session->client->connect(connOpts);
    bool success =
        token->wait_for(milliseconds(settings.connect_timeout_ms));

    if (!success || !session->client->is_connected()) {
      error = ErrorInfo::Timeout("MQTT connection timeout",
                                 settings.connect_timeout_ms);
      LogManager::getInstance().logDriver(
          "mqtt", LogLevel::WARN,
          "Connect timeout: " + session->server_uri + " after " +
              std::to_string(settings.connect_timeout_ms) + "ms");
      // 연결 시도가 남아있을 수 있으므로 best-effort 정리
      Disconnect(session);
      return nullptr;
    }
  } catch (const mqtt::exception &e) {
    error = ErrorInfo(ErrorCode::CONNECTION_FAILED,
                      std::string("MQTT connection failed: ") + e.what());
    LogManager::getInstance().logDriver("mqtt", LogLevel::LOG_ERROR,
                                        error.message);
    return nullptr;
  } catch (const std::exception &e) {
    error = ErrorInfo(ErrorCode::CONNECTION_FAILED,
                      std::string("Failed to create MQTT client: ") + e.what());
    LogManager::getInstance().logDriver("mqtt", LogLevel::LOG_ERROR,
                                        error.message);
    return nullptr;
  }

  auto elapsed =
      duration_cast<milliseconds>(steady_clock::now() - start_time).count();
  LogManager::getInstance().logDriver(
      "mqtt", LogLevel::INFO,
      "Connected to " + settings.broker + ":" + std::to_string(settings.port) +
          " as " + session->client_id + " (" + std::to_string(elapsed) +
          "ms)");
  return session;
}

bool MqttAdapter::VerifyLive(const SessionPtr &session) {
  auto mqtt_session = AsMqttSession(session);
  if (!mqtt_session || !mqtt_session->client) {
    return false;
  }
  return mqtt_session->client->is_connected();
}

bool MqttAdapter::Probe(const SessionPtr &session, std::string &message,
                        ErrorInfo &error) {
  if (!VerifyLive(session)) {
    error = ErrorInfo(ErrorCode::CONNECTION_LOST, "MQTT client not connected");
    return false;
  }
  message = "MQTT connection successful";
  return true;
}

void MqttAdapter::Disconnect(const SessionPtr &session) {
  auto mqtt_session = AsMqttSession(session);
  if (!mqtt_session || !mqtt_session->client) {
    return;
  }
  auto io_lock = mqtt_session->TryLockIo(kDisconnectLockWait);
  if (!io_lock.owns_lock()) {
    // 포기된 연산이 진행 중. 세션 소멸 시 닫힌다
    LogManager::getInstance().logDriver(
        "mqtt", LogLevel::WARN,
        "Session busy, deferring close: " + mqtt_session->server_uri);
    return;
  }
  try {
    if (mqtt_session->client->is_connected()) {
      mqtt_session->client->disconnect()->wait_for(milliseconds(2000));
    }
    LogManager::getInstance().logDriver(
        "mqtt", LogLevel::DEBUG, "Disconnected: " + mqtt_session->server_uri);
  } catch (const std::exception &e) {
    LogManager::getInstance().logDriver(
        "mqtt", LogLevel::WARN,
        "Error closing MQTT client " + mqtt_session->server_uri + ": " +
            e.what());
  }
}

bool MqttAdapter::CollectMessages(const SessionPtr &session,
                                  const std::vector<std::string> &topics,
                                  int qos, milliseconds window,
                                  Structs::MqttCollectResult &result,
                                  ErrorInfo &error) {
  auto mqtt_session = AsMqttSession(session);
  if (!mqtt_session || !mqtt_session->client) {
    error = ErrorInfo(ErrorCode::INTERNAL_ERROR, "Invalid MQTT session");
    return false;
  }
  if (topics.empty()) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "At least one MQTT topic is required");
    return false;
  }
  for (const auto &topic : topics) {
    if (!IsValidTopicFilter(topic)) {
      error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                        "Invalid MQTT topic filter: " + topic);
      return false;
    }
  }
  if (qos < 0 || qos > 2) {
    qos = 0;
  }

  auto io_lock = mqtt_session->LockIo();
  auto &client = *mqtt_session->client;
  if (!client.is_connected()) {
    error = ErrorInfo(ErrorCode::CONNECTION_LOST, "MQTT client not connected");
    return false;
  }

  // 수집기는 콜백 스레드와 공유된다
  auto collector = std::make_shared<MqttMessageCollector>(topics);
  int listener_id = mqtt_session->router->AddListener(
      [collector](const Structs::MqttMessage &message) {
        collector->Accept(message);
      });

  std::vector<std::string> subscribed;
  bool subscribe_ok = true;
  try {
    for (const auto &topic : topics) {
      auto token = client.subscribe(topic, qos);
      if (!token->wait_for(milliseconds(5000))) {
        error = ErrorInfo::Timeout("MQTT subscribe timeout: " + topic, 5000);
        subscribe_ok = false;
        break;
      }
      subscribed.push_back(topic);
      LogManager::getInstance().logDriver("mqtt", LogLevel::DEBUG,
                                          "Subscribed to MQTT topic: " + topic);
    }
  } catch (const mqtt::exception &e) {
    error = ErrorInfo(ErrorCode::READ_FAILED,
                      std::string("MQTT subscribe failed: ") + e.what());
    subscribe_ok = false;
  }

  if (subscribe_ok) {
    auto deadline = steady_clock::now() + window;
    while (steady_clock::now() < deadline) {
      if (mqtt_session->router->IsConnectionLost()) {
        break;
      }
      auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
      std::this_thread::sleep_for(std::min(remaining, milliseconds(50)));
    }
  }

  mqtt_session->router->RemoveListener(listener_id);

  for (const auto &topic : subscribed) {
    try {
      client.unsubscribe(topic)->wait_for(milliseconds(2000));
    } catch (const mqtt::exception &e) {
      LogManager::getInstance().logDriver(
          "mqtt", LogLevel::WARN,
          "Failed to unsubscribe from topic " + topic + ": " + e.what());
    }
  }

  if (!subscribe_ok) {
    LogManager::getInstance().logDriver("mqtt", LogLevel::LOG_ERROR,
                                        error.message);
    return false;
  }
  if (mqtt_session->router->IsConnectionLost()) {
    error = ErrorInfo(ErrorCode::CONNECTION_LOST,
                      "MQTT connection lost during collection");
    return false;
  }

  result = collector->Snapshot();

  LogManager::getInstance().logDriver(
      "mqtt", LogLevel::DEBUG,
      "Collected " + std::to_string(result.message_count) + " messages from " +
          std::to_string(result.topic_count) + " topics");
  return true;
}

} // namespace Drivers
} // namespace OtLink
