// =============================================================================
// connections/include/Drivers/OPCUA/OpcUaAdapter.h
// open62541 기반 OPC UA 클라이언트 어댑터
// =============================================================================

#ifndef OTLINK_DRIVERS_OPCUA_ADAPTER_H
#define OTLINK_DRIVERS_OPCUA_ADAPTER_H

#include "Drivers/Common/IOtAdapter.h"

#include <open62541/client.h>

#include <string>

namespace OtLink {
namespace Drivers {

/**
 * @brief UA_Client 소유 세션
 */
class OpcUaSession : public AdapterSession {
public:
  OpcUaSession() : AdapterSession(ProtocolType::OPCUA) {}
  ~OpcUaSession() override { Close(); }

  void Close() {
    if (client) {
      UA_Client_disconnect(client);
      UA_Client_delete(client);
      client = nullptr;
    }
  }

  UA_Client *client = nullptr;
  std::string endpoint;
};

class OpcUaAdapter : public IOpcUaAdapter {
public:
  OpcUaAdapter() = default;
  ~OpcUaAdapter() override = default;

  ProtocolType GetProtocolType() const override { return ProtocolType::OPCUA; }

  SessionPtr Connect(const ConnectionConfig &config,
                     ErrorInfo &error) override;

  /**
   * @brief 세션 왕복 확인 (Server_ServerStatus_State 읽기)
   */
  bool VerifyLive(const SessionPtr &session) override;
  bool Probe(const SessionPtr &session, std::string &message,
             ErrorInfo &error) override;
  void Disconnect(const SessionPtr &session) override;

  bool ReadNodes(const SessionPtr &session,
                 const std::vector<std::string> &node_ids,
                 Structs::OpcUaReadResult &result, ErrorInfo &error) override;

  /**
   * @brief "None" / "Basic256Sha256" 등을 정책 URI 로 변환
   */
  static std::string SecurityPolicyUri(const std::string &policy);

  /**
   * @brief 상위 2비트가 0 이면 Good
   */
  static bool IsGoodStatus(UA_StatusCode status) {
    return (status & 0xC0000000) == 0;
  }

  /**
   * @brief 스칼라/배열 Variant 를 JSON 으로 변환 (미지원 타입은 null)
   */
  static Structs::JsonType VariantToJson(const UA_Variant &variant);

private:
  static bool ReadServerState(OpcUaSession &session, UA_StatusCode &status);
  static std::shared_ptr<OpcUaSession>
  AsOpcUaSession(const SessionPtr &session);
};

} // namespace Drivers
} // namespace OtLink

#endif // OTLINK_DRIVERS_OPCUA_ADAPTER_H
