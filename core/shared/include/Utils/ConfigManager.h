#ifndef OTLINK_UTILS_CONFIG_MANAGER_H
#define OTLINK_UTILS_CONFIG_MANAGER_H

/**
 * @file ConfigManager.h
 * @brief 통합 설정 관리자 (.env 기반)
 * @author OtLink Development Team
 *
 * 탐색 순서:
 * - OTLINK_CONFIG_DIR 환경변수
 * - ./config, ../config, ../../config
 *
 * 로드 순서는 .env 다음 CONFIG_FILES 에 나열된 파일들 (기본 connections.env).
 * 메모리 설정이 우선이고, 없으면 프로세스 환경변수를 본다.
 */

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @class ConfigManager
 * @brief 전역 설정 관리자 (스레드 안전)
 */
class ConfigManager {
public:
  // ==========================================================================
  // 전역 싱글톤 패턴
  // ==========================================================================

  static ConfigManager &getInstance() {
    static ConfigManager instance;
    instance.ensureInitialized();
    return instance;
  }

  bool isInitialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  // ==========================================================================
  // 읽기 인터페이스
  // ==========================================================================

  void reload();
  void load(const std::string &filepath) { loadConfigFile(filepath); }
  std::string get(const std::string &key) const;
  std::string getOrDefault(const std::string &key,
                           const std::string &defaultValue) const;
  void set(const std::string &key, const std::string &value);
  bool hasKey(const std::string &key) const;

  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;

  std::string expandVariables(const std::string &value) const;

  // 경로 관련
  std::string getConfigDirectory() const;
  std::string getDatabasePath() const;
  std::vector<std::string> getLoadedFiles() const;

  /**
   * @brief 설정 디렉토리를 명시적으로 지정하고 다시 로드
   * @details 명령행 --config 옵션과 테스트에서 사용
   */
  void setConfigDirectory(const std::string &dir);

private:
  ConfigManager();
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  void ensureInitialized();
  bool doInitialize();

  std::string findConfigDirectory();
  void createConnectionsEnvFile();
  void loadMainConfig();
  void loadAdditionalConfigs();
  void loadConfigFile(const std::string &filepath);
  void parseLine(const std::string &line);
  void expandAllVariables();

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;

  mutable std::mutex configMutex;
  std::map<std::string, std::string> configMap;

  std::string configDir_;
  std::string explicitConfigDir_;
  std::vector<std::string> loadedFiles_;
  std::vector<std::string> searchLog_;
};

#endif // OTLINK_UTILS_CONFIG_MANAGER_H
