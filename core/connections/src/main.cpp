#include "Core/ConnectionsApplication.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

using namespace OtLink::Core;

namespace {

void PrintUsage(const char *program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "  --config <dir>              설정 디렉토리 (.env, connections.env)\n"
            << "  --once                      헬스체크 스윕 1회 실행 후 종료\n"
            << "  --test <protocol> '<json>'  연결 테스트 1회 (결과 JSON 출력)\n"
            << "  --help                      도움말\n"
            << "옵션이 없으면 스케줄러를 실행하고 SIGINT/SIGTERM 까지 대기한다."
            << std::endl;
}

/**
 * @brief SIGINT/SIGTERM 을 전용 스레드에서 sigwait 로 받는다
 * @details 호출 이후 생성되는 모든 스레드는 두 시그널이 블록된 상태를
 *          상속하므로 시그널은 이 스레드로만 전달된다.
 */
void InstallSignalWatcher(ConnectionsApplication &app) {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::thread([signals, &app]() {
    int signal_num = 0;
    if (sigwait(&signals, &signal_num) == 0) {
      std::cout << "\n🛑 종료 신호 받음 (Signal: " << signal_num << ")"
                << std::endl;
      app.Stop();
    }
  }).detach();
}

} // namespace

int main(int argc, char *argv[]) {
  bool run_once = false;
  bool run_test = false;
  std::string test_protocol;
  std::string test_config;
  std::string config_dir;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else if (arg == "--once") {
      run_once = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_dir = argv[++i];
    } else if (arg.find("--config=") == 0) {
      config_dir = arg.substr(9);
    } else if (arg == "--test" && i + 2 < argc) {
      run_test = true;
      test_protocol = argv[++i];
      test_config = argv[++i];
    } else {
      std::cerr << "❌ Error: Unknown or incomplete option: " << arg
                << std::endl;
      PrintUsage(argv[0]);
      return 2;
    }
  }

  if (!config_dir.empty()) {
    ConfigManager::getInstance().setConfigDirectory(config_dir);
  }

  auto app = std::make_unique<ConnectionsApplication>();

  if (run_test) {
    auto result = app->TestConnection(test_protocol, test_config);
    std::cout << result.ToJson().dump(2) << std::endl;
    return result.success ? 0 : 1;
  }

  if (run_once) {
    return app->RunOnce() ? 0 : 1;
  }

  InstallSignalWatcher(*app);
  std::cout << "🚀 OtLink Connections (OT connection health manager)"
            << std::endl;
  return app->Run() ? 0 : 1;
}
