/**
 * @file ConfigManager.cpp
 * @brief 통합 설정 관리자 구현
 * @author OtLink Development Team
 */

#include "Utils/ConfigManager.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager() : initialized_(false) {}

// =============================================================================
// 초기화 관련
// =============================================================================

void ConfigManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }

  static thread_local bool in_config_init = false;
  if (in_config_init) {
    return; // 현재 스레드에서 이미 초기화 중이면 재진입 방지
  }

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }

  in_config_init = true;
  doInitialize();
  in_config_init = false;

  initialized_.store(true, std::memory_order_release);
}

bool ConfigManager::doInitialize() {
  // 1. 설정 디렉토리 찾기
  configDir_ = findConfigDirectory();
  if (configDir_.empty()) {
    // 설정 디렉토리 없음 - 환경변수만 사용
    for (const auto &line : searchLog_) {
      LogManager::getInstance().log("config", LogLevel::WARN, line);
    }
    initialized_.store(true);
    return false;
  }

  // 2. 기본 템플릿 생성
  createConnectionsEnvFile();

  // 3. 설정 파일들 로드
  loadMainConfig();
  loadAdditionalConfigs();
  expandAllVariables();

  initialized_.store(true);
  return true;
}

void ConfigManager::reload() {
  LogManager::getInstance().log("config", LogLevel::INFO,
                                "ConfigManager 재로딩 시작...");

  std::lock_guard<std::recursive_mutex> init_lock(init_mutex_);
  {
    std::lock_guard<std::mutex> lock(configMutex);
    configMap.clear();
    loadedFiles_.clear();
    searchLog_.clear();
  }

  initialized_.store(false);
  doInitialize();
  initialized_.store(true, std::memory_order_release);
}

void ConfigManager::setConfigDirectory(const std::string &dir) {
  {
    std::lock_guard<std::recursive_mutex> init_lock(init_mutex_);
    explicitConfigDir_ = dir;
  }
  reload();
}

// =============================================================================
// 디렉토리 탐색
// =============================================================================

std::string ConfigManager::findConfigDirectory() {
  searchLog_.clear();

  std::error_code ec;
  if (!explicitConfigDir_.empty()) {
    if (fs::is_directory(explicitConfigDir_, ec)) {
      searchLog_.push_back("지정됨: " + explicitConfigDir_);
      return explicitConfigDir_;
    }
    searchLog_.push_back("지정된 디렉토리 없음: " + explicitConfigDir_);
  }

  const char *env_config = std::getenv("OTLINK_CONFIG_DIR");
  if (env_config && fs::is_directory(env_config, ec)) {
    searchLog_.push_back("환경변수: " + std::string(env_config));
    return std::string(env_config);
  }

  const std::vector<std::string> search_paths = {"./config", "../config",
                                                 "../../config"};
  for (const auto &path : search_paths) {
    if (fs::is_directory(path, ec)) {
      std::string absolute_path = fs::absolute(path, ec).lexically_normal().string();
      if (ec) {
        searchLog_.push_back("발견: " + path + " (절대경로 변환 실패)");
        return path;
      }
      searchLog_.push_back("발견: " + path + " -> " + absolute_path);
      return absolute_path;
    }
    searchLog_.push_back("없음: " + path);
  }

  searchLog_.push_back("설정 디렉토리를 찾을 수 없음");
  return "";
}

void ConfigManager::createConnectionsEnvFile() {
  fs::path env_path = fs::path(configDir_) / "connections.env";
  std::error_code ec;
  if (fs::exists(env_path, ec)) {
    return;
  }

  std::ofstream file(env_path);
  if (!file.is_open()) {
    LogManager::getInstance().log("config", LogLevel::WARN,
                                  "템플릿 생성 실패: " + env_path.string());
    return;
  }

  file << R"(# =============================================================================
# OtLink 연결 관리 설정 (connections.env) - 자동 생성됨
# =============================================================================

# 헬스체크 스케줄러
HEALTH_CHECK_ENABLED=true
HEALTH_CHECK_INTERVAL_MS=300000
PROBE_TIMEOUT_MS=5000

# 읽기 타임아웃
OPCUA_READ_TIMEOUT_MS=10000
MODBUS_READ_TIMEOUT_MS=10000
MQTT_COLLECT_WINDOW_MS=5000
MQTT_COLLECT_GRACE_MS=5000

# 드라이버 레벨 타임아웃
OPCUA_CLIENT_TIMEOUT_MS=10000
MQTT_CONNECT_TIMEOUT_MS=10000
MODBUS_RESPONSE_TIMEOUT_MS=3000

# 드라이버 활성화
DRIVER_OPCUA_ENABLED=true
DRIVER_MQTT_ENABLED=true
DRIVER_MODBUS_ENABLED=true

# 상태 변경 알림 쿨다운 (0 = 억제 없음)
NOTIFY_COOLDOWN_MS=0

# 종료 시 진행 중인 네트워크 워커 대기 한도
EXECUTOR_DRAIN_MS=3000
)";
  LogManager::getInstance().log("config", LogLevel::INFO,
                                "템플릿 생성: " + env_path.string());
}

// =============================================================================
// 파일 로드
// =============================================================================

void ConfigManager::loadMainConfig() {
  fs::path main_env_path = fs::path(configDir_) / ".env";
  std::error_code ec;

  if (fs::exists(main_env_path, ec)) {
    loadConfigFile(main_env_path.string());
    LogManager::getInstance().log("config", LogLevel::INFO,
                                  "메인 설정 로드: .env");
  } else {
    LogManager::getInstance().log("config", LogLevel::DEBUG,
                                  "메인 설정 파일 없음: .env");
  }
}

void ConfigManager::loadAdditionalConfigs() {
  std::string config_files;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    auto it = configMap.find("CONFIG_FILES");
    config_files = (it != configMap.end()) ? it->second : "connections.env";
  }

  std::stringstream ss(config_files);
  std::string filename;

  while (std::getline(ss, filename, ',')) {
    filename.erase(0, filename.find_first_not_of(" \t"));
    filename.erase(filename.find_last_not_of(" \t") + 1);
    if (filename.empty()) {
      continue;
    }

    fs::path full_path = fs::path(configDir_) / filename;
    std::error_code ec;
    if (fs::exists(full_path, ec)) {
      loadConfigFile(full_path.string());
      LogManager::getInstance().log("config", LogLevel::INFO,
                                    "추가 설정 로드: " + filename);
    } else {
      LogManager::getInstance().log("config", LogLevel::DEBUG,
                                    "추가 설정 파일 없음: " + filename);
    }
  }
}

void ConfigManager::loadConfigFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    LogManager::getInstance().log("config", LogLevel::LOG_ERROR,
                                  "파일 열기 실패: " + filepath);
    return;
  }

  std::string line;
  int line_count = 0;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    while (std::getline(file, line)) {
      line_count++;
      parseLine(line);
    }
    loadedFiles_.push_back(filepath);
  }

  LogManager::getInstance().log("config", LogLevel::DEBUG,
                                fs::path(filepath).filename().string() + " - " +
                                    std::to_string(line_count) +
                                    " 라인 처리됨");
}

void ConfigManager::parseLine(const std::string &raw_line) {
  std::string line = raw_line;
  line.erase(0, line.find_first_not_of(" \t\r\n"));
  if (line.empty() || line[0] == '#') {
    return;
  }

  if (line.compare(0, 7, "export ") == 0) {
    line = line.substr(7);
  }

  size_t pos = line.find('=');
  if (pos == std::string::npos) {
    return;
  }

  std::string key = line.substr(0, pos);
  std::string value = line.substr(pos + 1);

  key.erase(0, key.find_first_not_of(" \t\r\n"));
  key.erase(key.find_last_not_of(" \t\r\n") + 1);
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  value.erase(value.find_last_not_of(" \t\r\n") + 1);

  if (value.length() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.length() - 2);
  } else {
    // 따옴표 없는 값의 인라인 주석 제거
    size_t comment = value.find(" #");
    if (comment != std::string::npos) {
      value = value.substr(0, comment);
      value.erase(value.find_last_not_of(" \t") + 1);
    }
  }

  if (!key.empty()) {
    configMap[key] = value;
  }
}

// =============================================================================
// 읽기 인터페이스
// =============================================================================

std::string ConfigManager::get(const std::string &key) const {
  // 1. 메모리 설정 확인 (파일 로드 또는 set())
  {
    std::lock_guard<std::mutex> lock(configMutex);
    auto it = configMap.find(key);
    if (it != configMap.end() && !it->second.empty()) {
      return it->second;
    }
  }

  // 2. 환경변수 확인
  const char *env_val = std::getenv(key.c_str());
  if (env_val) {
    return std::string(env_val);
  }

  return "";
}

std::string ConfigManager::getOrDefault(const std::string &key,
                                        const std::string &defaultValue) const {
  std::string value = get(key);
  if (!value.empty()) {
    return value;
  }
  return defaultValue;
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap[key] = value;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap.find(key) != configMap.end();
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;

  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  return (value == "true" || value == "yes" || value == "1" || value == "on");
}

std::string ConfigManager::getConfigDirectory() const {
  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  return configDir_;
}

std::string ConfigManager::getDatabasePath() const {
  std::string path = get("DATABASE_PATH");
  if (!path.empty()) {
    return path;
  }
  std::string data_dir = getOrDefault("DATA_DIR", "./data");
  return (fs::path(data_dir) / "otlink.db").string();
}

std::vector<std::string> ConfigManager::getLoadedFiles() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return loadedFiles_;
}

// =============================================================================
// 변수 확장
// =============================================================================

void ConfigManager::expandAllVariables() {
  std::map<std::string, std::string> snapshot;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    snapshot = configMap;
  }

  for (auto &[key, value] : snapshot) {
    value = expandVariables(value);
  }

  std::lock_guard<std::mutex> lock(configMutex);
  configMap = std::move(snapshot);
}

std::string ConfigManager::expandVariables(const std::string &value) const {
  std::string result = value;

  // ${VARIABLE} 패턴 처리
  static const std::regex var_pattern(R"(\$\{([^}]+)\})");
  std::smatch match;
  int guard = 0;

  while (std::regex_search(result, match, var_pattern) && guard++ < 64) {
    std::string var_name = match[1].str();
    std::string replacement;

    if (var_name == "CONFIG_DIR") {
      replacement = configDir_;
    } else {
      replacement = get(var_name);
    }

    result.replace(match.position(), match.length(), replacement);
  }

  return result;
}
