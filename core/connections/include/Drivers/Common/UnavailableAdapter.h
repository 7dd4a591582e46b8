// connections/include/Drivers/Common/UnavailableAdapter.h
// 드라이버가 비활성화되었거나 탑재되지 않은 프로토콜용 어댑터
#ifndef OTLINK_DRIVERS_UNAVAILABLE_ADAPTER_H
#define OTLINK_DRIVERS_UNAVAILABLE_ADAPTER_H

#include "Drivers/Common/IOtAdapter.h"

namespace OtLink {
namespace Drivers {

/**
 * @brief 모든 연결 시도를 즉시 DRIVER_UNAVAILABLE 로 실패시킨다
 */
class UnavailableAdapter : public IOtAdapter {
public:
  UnavailableAdapter(ProtocolType protocol, const std::string &reason)
      : protocol_(protocol), reason_(reason) {}

  ProtocolType GetProtocolType() const override { return protocol_; }
  bool IsAvailable() const override { return false; }

  SessionPtr Connect(const ConnectionConfig &, ErrorInfo &error) override {
    error = ErrorInfo(ErrorCode::DRIVER_UNAVAILABLE, UnavailableMessage());
    return nullptr;
  }

  bool VerifyLive(const SessionPtr &) override { return false; }

  bool Probe(const SessionPtr &, std::string &, ErrorInfo &error) override {
    error = ErrorInfo(ErrorCode::DRIVER_UNAVAILABLE, UnavailableMessage());
    return false;
  }

  void Disconnect(const SessionPtr &) override {}

  std::string UnavailableMessage() const {
    return Enums::ProtocolDisplayName(protocol_) +
           " driver unavailable: " + reason_;
  }

private:
  ProtocolType protocol_;
  std::string reason_;
};

} // namespace Drivers
} // namespace OtLink

#endif // OTLINK_DRIVERS_UNAVAILABLE_ADAPTER_H
