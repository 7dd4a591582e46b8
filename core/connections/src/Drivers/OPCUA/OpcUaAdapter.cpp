// =============================================================================
// connections/src/Drivers/OPCUA/OpcUaAdapter.cpp
// =============================================================================

#include "Drivers/OPCUA/OpcUaAdapter.h"
#include "Logging/LogManager.h"

#include <open62541/client_config_default.h>
#include <open62541/client_highlevel.h>

#include <algorithm>
#include <chrono>

namespace OtLink {
namespace Drivers {

namespace {

std::string StatusName(UA_StatusCode status) {
  return std::string(UA_StatusCode_name(status));
}

std::string DateTimeToIso(UA_DateTime value) {
  int64_t epoch_ms = (value - UA_DATETIME_UNIX_EPOCH) / UA_DATETIME_MSEC;
  return BasicTypes::TimestampToIso8601(
      BasicTypes::Timestamp(std::chrono::milliseconds(epoch_ms)));
}

UA_MessageSecurityMode ToSecurityMode(const std::string &mode) {
  if (mode == "Sign") {
    return UA_MESSAGESECURITYMODE_SIGN;
  }
  if (mode == "SignAndEncrypt") {
    return UA_MESSAGESECURITYMODE_SIGNANDENCRYPT;
  }
  return UA_MESSAGESECURITYMODE_NONE;
}

Structs::JsonType ScalarToJson(const UA_DataType *type, const void *data) {
  using Structs::JsonType;
  if (type == &UA_TYPES[UA_TYPES_BOOLEAN])
    return JsonType(*static_cast<const UA_Boolean *>(data) != 0);
  if (type == &UA_TYPES[UA_TYPES_SBYTE])
    return JsonType(*static_cast<const UA_SByte *>(data));
  if (type == &UA_TYPES[UA_TYPES_BYTE])
    return JsonType(*static_cast<const UA_Byte *>(data));
  if (type == &UA_TYPES[UA_TYPES_INT16])
    return JsonType(*static_cast<const UA_Int16 *>(data));
  if (type == &UA_TYPES[UA_TYPES_UINT16])
    return JsonType(*static_cast<const UA_UInt16 *>(data));
  if (type == &UA_TYPES[UA_TYPES_INT32])
    return JsonType(*static_cast<const UA_Int32 *>(data));
  if (type == &UA_TYPES[UA_TYPES_UINT32])
    return JsonType(*static_cast<const UA_UInt32 *>(data));
  if (type == &UA_TYPES[UA_TYPES_INT64])
    return JsonType(*static_cast<const UA_Int64 *>(data));
  if (type == &UA_TYPES[UA_TYPES_UINT64])
    return JsonType(*static_cast<const UA_UInt64 *>(data));
  if (type == &UA_TYPES[UA_TYPES_FLOAT])
    return JsonType(*static_cast<const UA_Float *>(data));
  if (type == &UA_TYPES[UA_TYPES_DOUBLE])
    return JsonType(*static_cast<const UA_Double *>(data));
  if (type == &UA_TYPES[UA_TYPES_STRING]) {
    const auto *s = static_cast<const UA_String *>(data);
    return JsonType(std::string(reinterpret_cast<const char *>(s->data),
                                s->length));
  }
  if (type == &UA_TYPES[UA_TYPES_DATETIME])
    return JsonType(DateTimeToIso(*static_cast<const UA_DateTime *>(data)));
  if (type == &UA_TYPES[UA_TYPES_LOCALIZEDTEXT]) {
    const auto *t = static_cast<const UA_LocalizedText *>(data);
    return JsonType(std::string(reinterpret_cast<const char *>(t->text.data),
                                t->text.length));
  }
  return JsonType(nullptr);
}

} // namespace

std::string OpcUaAdapter::SecurityPolicyUri(const std::string &policy) {
  if (policy.empty() || policy == "None") {
    return "http://opcfoundation.org/UA/SecurityPolicy#None";
  }
  if (policy.find("http://") == 0) {
    return policy;
  }
  return "http://opcfoundation.org/UA/SecurityPolicy#" + policy;
}

Structs::JsonType OpcUaAdapter::VariantToJson(const UA_Variant &variant) {
  if (UA_Variant_isEmpty(&variant)) {
    return Structs::JsonType(nullptr);
  }
  if (UA_Variant_isScalar(&variant)) {
    return ScalarToJson(variant.type, variant.data);
  }
  Structs::JsonType array = Structs::JsonType::array();
  const auto *bytes = static_cast<const uint8_t *>(variant.data);
  for (size_t i = 0; i < variant.arrayLength; ++i) {
    array.push_back(ScalarToJson(variant.type, bytes + i * variant.type->memSize));
  }
  return array;
}

std::shared_ptr<OpcUaSession>
OpcUaAdapter::AsOpcUaSession(const SessionPtr &session) {
  return std::dynamic_pointer_cast<OpcUaSession>(session);
}

// =============================================================================
// 연결 관리
// =============================================================================

SessionPtr OpcUaAdapter::Connect(const ConnectionConfig &config,
                                 ErrorInfo &error) {
  const auto &settings = config.opcua;
  if (settings.endpoint.empty()) {
    error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                      "OPC UA endpoint is required");
    return nullptr;
  }

  auto session = std::make_shared<OpcUaSession>();
  session->endpoint = settings.endpoint;
  session->client = UA_Client_new();
  if (!session->client) {
    error = ErrorInfo(ErrorCode::INTERNAL_ERROR,
                      "Failed to create OPC UA client");
    return nullptr;
  }

  UA_ClientConfig *ua_config = UA_Client_getConfig(session->client);
  UA_ClientConfig_setDefault(ua_config);
  ua_config->timeout = settings.client_timeout_ms;
  ua_config->securityMode = ToSecurityMode(settings.security_mode);
  UA_String_clear(&ua_config->securityPolicyUri);
  ua_config->securityPolicyUri =
      UA_STRING_ALLOC(SecurityPolicyUri(settings.security_policy).c_str());

  UA_StatusCode retval;
  if (!settings.username.empty()) {
    retval = UA_Client_connectUsername(session->client,
                                       settings.endpoint.c_str(),
                                       settings.username.c_str(),
                                       settings.password.c_str());
  } else {
    retval = UA_Client_connect(session->client, settings.endpoint.c_str());
  }

  if (retval != UA_STATUSCODE_GOOD) {
    ErrorCode code = (retval == UA_STATUSCODE_BADUSERACCESSDENIED ||
                      retval == UA_STATUSCODE_BADIDENTITYTOKENINVALID ||
                      retval == UA_STATUSCODE_BADIDENTITYTOKENREJECTED)
                         ? ErrorCode::AUTHENTICATION_FAILED
                         : ErrorCode::CONNECTION_FAILED;
    error = ErrorInfo(code, "Failed to connect to OPC UA server: " +
                                StatusName(retval));
    LogManager::getInstance().logDriver(
        "opcua", LogLevel::WARN, settings.endpoint + ": " + error.message);
    return nullptr;
  }

  LogManager::getInstance().logDriver(
      "opcua", LogLevel::INFO,
      "Connected to " + settings.endpoint + " (" +
          (settings.username.empty() ? std::string("anonymous")
                                     : settings.username) +
          ")");
  return session;
}

bool OpcUaAdapter::ReadServerState(OpcUaSession &session,
                                   UA_StatusCode &status) {
  if (!session.client) {
    status = UA_STATUSCODE_BADCONNECTIONCLOSED;
    return false;
  }
  UA_Variant value;
  UA_Variant_init(&value);
  status = UA_Client_readValueAttribute(
      session.client, UA_NODEID_NUMERIC(0, UA_NS0ID_SERVER_SERVERSTATUS_STATE),
      &value);
  UA_Variant_clear(&value);
  return status == UA_STATUSCODE_GOOD;
}

bool OpcUaAdapter::VerifyLive(const SessionPtr &session) {
  auto opcua_session = AsOpcUaSession(session);
  if (!opcua_session) {
    return false;
  }
  auto io_lock = opcua_session->LockIo();
  UA_StatusCode status;
  return ReadServerState(*opcua_session, status);
}

bool OpcUaAdapter::Probe(const SessionPtr &session, std::string &message,
                         ErrorInfo &error) {
  auto opcua_session = AsOpcUaSession(session);
  if (!opcua_session) {
    error = ErrorInfo(ErrorCode::INTERNAL_ERROR, "Invalid OPC UA session");
    return false;
  }
  auto io_lock = opcua_session->LockIo();
  UA_StatusCode status;
  if (!ReadServerState(*opcua_session, status)) {
    error = ErrorInfo(ErrorCode::CONNECTION_LOST,
                      "OPC UA session check failed: " + StatusName(status));
    return false;
  }
  message = "OPC UA connection successful";
  return true;
}

void OpcUaAdapter::Disconnect(const SessionPtr &session) {
  auto opcua_session = AsOpcUaSession(session);
  if (!opcua_session) {
    return;
  }
  auto io_lock = opcua_session->TryLockIo(kDisconnectLockWait);
  if (!io_lock.owns_lock()) {
    // 포기된 연산이 진행 중. 세션 소멸 시 닫힌다
    LogManager::getInstance().logDriver(
        "opcua", LogLevel::WARN,
        "Session busy, deferring close: " + opcua_session->endpoint);
    return;
  }
  opcua_session->Close();
  LogManager::getInstance().logDriver("opcua", LogLevel::DEBUG,
                                      "Disconnected: " +
                                          opcua_session->endpoint);
}

// =============================================================================
// 배치 읽기
// =============================================================================

bool OpcUaAdapter::ReadNodes(const SessionPtr &session,
                             const std::vector<std::string> &node_ids,
                             Structs::OpcUaReadResult &result,
                             ErrorInfo &error) {
  auto opcua_session = AsOpcUaSession(session);
  if (!opcua_session) {
    error = ErrorInfo(ErrorCode::INTERNAL_ERROR, "Invalid OPC UA session");
    return false;
  }

  result = Structs::OpcUaReadResult();
  result.timestamp = BasicTypes::NowIso8601();
  result.values.resize(node_ids.size());

  // 파싱 가능한 노드만 요청에 담고 원래 인덱스를 기억한다
  std::vector<UA_ReadValueId> items;
  std::vector<size_t> item_index;
  items.reserve(node_ids.size());

  for (size_t i = 0; i < node_ids.size(); ++i) {
    auto &entry = result.values[i];
    entry.node_id = node_ids[i];
    entry.timestamp = result.timestamp;

    UA_NodeId node_id = UA_NODEID_NULL;
    UA_StatusCode parsed =
        UA_NodeId_parse(&node_id, UA_STRING(const_cast<char *>(node_ids[i].c_str())));
    if (parsed != UA_STATUSCODE_GOOD) {
      entry.quality = Enums::DataQuality::BAD;
      entry.status_code = StatusName(UA_STATUSCODE_BADNODEIDINVALID);
      continue;
    }

    UA_ReadValueId item;
    UA_ReadValueId_init(&item);
    item.nodeId = node_id;
    item.attributeId = UA_ATTRIBUTEID_VALUE;
    items.push_back(item);
    item_index.push_back(i);
  }

  if (items.empty()) {
    return true;
  }

  auto io_lock = opcua_session->LockIo();
  if (!opcua_session->client) {
    for (auto &item : items) {
      UA_ReadValueId_clear(&item);
    }
    error = ErrorInfo(ErrorCode::CONNECTION_LOST, "OPC UA client is closed");
    return false;
  }

  UA_ReadRequest request;
  UA_ReadRequest_init(&request);
  request.nodesToRead = items.data();
  request.nodesToReadSize = items.size();
  request.timestampsToReturn = UA_TIMESTAMPSTORETURN_BOTH;

  UA_ReadResponse response =
      UA_Client_Service_read(opcua_session->client, request);

  bool ok = true;
  UA_StatusCode service_result = response.responseHeader.serviceResult;
  if (service_result != UA_STATUSCODE_GOOD) {
    error = ErrorInfo(ErrorCode::READ_FAILED,
                      "Failed to read OPC UA nodes: " +
                          StatusName(service_result));
    ok = false;
  } else if (response.resultsSize != items.size()) {
    error = ErrorInfo(ErrorCode::PROTOCOL_ERROR,
                      "OPC UA read returned " +
                          std::to_string(response.resultsSize) +
                          " results for " + std::to_string(items.size()) +
                          " nodes");
    ok = false;
  } else {
    for (size_t r = 0; r < response.resultsSize; ++r) {
      const UA_DataValue &dv = response.results[r];
      auto &entry = result.values[item_index[r]];
      UA_StatusCode status = dv.hasStatus ? dv.status : UA_STATUSCODE_GOOD;
      entry.status_code = StatusName(status);
      entry.quality = IsGoodStatus(status) ? Enums::DataQuality::GOOD
                                           : Enums::DataQuality::BAD;
      if (dv.hasValue) {
        entry.value = VariantToJson(dv.value);
      }
      if (dv.hasSourceTimestamp) {
        entry.timestamp = DateTimeToIso(dv.sourceTimestamp);
      }
    }
  }

  UA_ReadResponse_clear(&response);
  // request.nodesToRead 는 items 벡터 소유이므로 NodeId 만 해제
  for (auto &item : items) {
    UA_ReadValueId_clear(&item);
  }

  if (!ok) {
    LogManager::getInstance().logDriver(
        "opcua", LogLevel::LOG_ERROR,
        opcua_session->endpoint + ": " + error.message);
  }
  return ok;
}

} // namespace Drivers
} // namespace OtLink
