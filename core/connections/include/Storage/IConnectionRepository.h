// connections/include/Storage/IConnectionRepository.h
#ifndef OTLINK_STORAGE_ICONNECTION_REPOSITORY_H
#define OTLINK_STORAGE_ICONNECTION_REPOSITORY_H

#include "Common/Structs.h"

#include <string>
#include <vector>

namespace OtLink {
namespace Storage {

using ConnectionRecord = OtLink::Structs::ConnectionRecord;
using StatusUpdate = OtLink::Structs::StatusUpdate;

/**
 * @brief 연결 레코드 저장소 (CRUD 계층이 생성/편집, 스케줄러가 읽기/갱신)
 */
class IConnectionRepository {
public:
  virtual ~IConnectionRepository() = default;

  /**
   * @brief OT 계열 프로토콜 레코드 전체
   * @return 저장소 오류 시 false
   */
  virtual bool ListOtConnections(std::vector<ConnectionRecord> &records) = 0;

  /**
   * @brief 상태/최근 테스트 시각/에러/지연 갱신
   * @return 레코드가 없거나 저장 실패 시 false
   */
  virtual bool UpdateConnectionStatus(const std::string &id,
                                      const StatusUpdate &update) = 0;
};

} // namespace Storage
} // namespace OtLink

#endif // OTLINK_STORAGE_ICONNECTION_REPOSITORY_H
