/**
 * @file test_health_check_scheduler.cpp
 * @brief HealthCheckScheduler - 생명주기, 스윕 격리, 전이 이벤트, 타임아웃
 */

#include "Core/OtConnectionManager.h"
#include "Drivers/Common/AdapterRegistry.h"
#include "Drivers/Modbus/ModbusAdapter.h"
#include "Logging/LogManager.h"
#include "Mocks/FakeAdapters.h"
#include "Mocks/InMemoryConnectionRepository.h"
#include "Mocks/MockStatusNotifier.h"
#include "Mocks/VirtualModbusServer.h"
#include "Scheduler/HealthCheckScheduler.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace OtLink;
using namespace OtLink::Scheduler;
using namespace OtLink::Testing;
using namespace std::chrono;
using OtLink::Enums::ConnectionStatus;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::NiceMock;

namespace {

Storage::ConnectionRecord MakeRecord(const std::string &id,
                                     const std::string &protocol,
                                     const std::string &config_json,
                                     ConnectionStatus status) {
  Storage::ConnectionRecord record;
  record.id = id;
  record.organization_id = "org-1";
  record.name = id;
  record.protocol = protocol;
  record.config_json = config_json;
  record.status = status;
  return record;
}

std::string ModbusJson(const std::string &host, int port = 502) {
  return "{\"host\":\"" + host + "\",\"port\":" + std::to_string(port) + "}";
}

} // namespace

class HealthCheckSchedulerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::WARN);
    modbus_ = std::make_shared<FakeModbusAdapter>();
    registry_ = std::make_shared<Drivers::AdapterRegistry>();
    registry_->RegisterAdapter(modbus_);
    repository_ = std::make_shared<InMemoryConnectionRepository>();
    notifier_ = std::make_shared<NiceMock<MockStatusNotifier>>();
  }

  void TearDown() override {
    if (scheduler_) {
      scheduler_->Stop();
    }
    if (executor_) {
      executor_->Drain(seconds(5));
    }
    scheduler_.reset();
    if (manager_) {
      manager_->CloseAll();
    }
  }

  void Build(milliseconds probe_timeout = milliseconds(200),
             std::shared_ptr<IStatusChangeNotifier> notifier = nullptr) {
    pool_ = std::make_shared<Pool::ConnectionPool>(registry_);
    executor_ = std::make_shared<Pool::TimedExecutor>();
    manager_ = std::make_shared<Core::OtConnectionManager>(
        pool_, executor_, Config::ConnectionConfigParser());

    SchedulerOptions options;
    options.interval = milliseconds(3600000);
    options.probe_timeout = probe_timeout;
    std::shared_ptr<IStatusChangeNotifier> sink = notifier;
    if (!sink) {
      sink = notifier_;
    }
    scheduler_ = std::make_unique<HealthCheckScheduler>(
        repository_, manager_, sink, Config::ConnectionConfigParser(), options);
  }

  std::shared_ptr<FakeModbusAdapter> modbus_;
  std::shared_ptr<Drivers::AdapterRegistry> registry_;
  std::shared_ptr<InMemoryConnectionRepository> repository_;
  std::shared_ptr<NiceMock<MockStatusNotifier>> notifier_;
  std::shared_ptr<Pool::ConnectionPool> pool_;
  std::shared_ptr<Pool::TimedExecutor> executor_;
  std::shared_ptr<Core::OtConnectionManager> manager_;
  std::unique_ptr<HealthCheckScheduler> scheduler_;
};

TEST_F(HealthCheckSchedulerTest, StartAndStopAreIdempotent) {
  Build();
  EXPECT_FALSE(scheduler_->IsRunning());
  EXPECT_TRUE(scheduler_->Start());
  EXPECT_FALSE(scheduler_->Start());
  EXPECT_TRUE(scheduler_->IsRunning());

  scheduler_->Stop();
  EXPECT_FALSE(scheduler_->IsRunning());
  scheduler_->Stop();
  EXPECT_FALSE(scheduler_->IsRunning());

  // 다시 시작할 수 있다
  EXPECT_TRUE(scheduler_->Start());
  scheduler_->Stop();
}

TEST_F(HealthCheckSchedulerTest, StartSweepsImmediatelyAndStopClosesPool) {
  repository_->Add(MakeRecord("m1", "modbus", ModbusJson("10.0.0.1"),
                              ConnectionStatus::INACTIVE));
  Build();

  ASSERT_TRUE(scheduler_->Start(milliseconds(3600000)));
  auto deadline = steady_clock::now() + seconds(3);
  while (scheduler_->GetSweepCount() == 0 && steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(10));
  }
  EXPECT_EQ(scheduler_->GetSweepCount(), 1u);
  EXPECT_EQ(pool_->Size(), 1u);

  auto stop_start = steady_clock::now();
  scheduler_->Stop();
  EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - stop_start).count(),
            1000);
  EXPECT_EQ(pool_->Size(), 0u);
}

TEST_F(HealthCheckSchedulerTest, EveryRecordIsPersistedEvenWhenSomeTimeOut) {
  for (int i = 0; i < 5; ++i) {
    std::string host = "10.0.1." + std::to_string(i);
    repository_->Add(MakeRecord("r" + std::to_string(i), "modbus",
                                ModbusJson(host), ConnectionStatus::INACTIVE));
  }
  modbus_->slow_delay = milliseconds(1000);
  modbus_->AddSlowKey("modbus|10.0.1.1|502|1");
  modbus_->AddSlowKey("modbus|10.0.1.3|502|1");
  Build(milliseconds(150));

  SweepSummary summary = scheduler_->RunSweepOnce();

  EXPECT_FALSE(summary.skipped);
  EXPECT_EQ(summary.total, 5u);
  EXPECT_EQ(summary.persisted, 5u);
  EXPECT_EQ(summary.succeeded, 3u);
  EXPECT_EQ(summary.failed, 2u);
  EXPECT_EQ(repository_->update_count.load(), 5);

  auto slow = repository_->Get("r1");
  EXPECT_EQ(slow.status, ConnectionStatus::CONNECTION_ERROR);
  EXPECT_EQ(slow.last_error, "Modbus test timeout after 150ms");
  EXPECT_FALSE(slow.last_tested_at.empty());

  auto fast = repository_->Get("r2");
  EXPECT_EQ(fast.status, ConnectionStatus::ACTIVE);
  EXPECT_TRUE(fast.last_error.empty());
}

TEST_F(HealthCheckSchedulerTest, EventsFireOnlyOnStatusChange) {
  repository_->Add(MakeRecord("steady", "modbus", ModbusJson("10.0.2.1"),
                              ConnectionStatus::ACTIVE));
  repository_->Add(MakeRecord("recovering", "modbus", ModbusJson("10.0.2.2"),
                              ConnectionStatus::CONNECTION_ERROR));
  repository_->Add(MakeRecord("failing", "modbus", ModbusJson("10.0.2.3"),
                              ConnectionStatus::ACTIVE));
  modbus_->AddFailingKey("modbus|10.0.2.3|502|1");

  auto strict = std::make_shared<::testing::StrictMock<MockStatusNotifier>>();
  EXPECT_CALL(*strict,
              OnStatusChange(AllOf(
                  Field(&StatusTransitionEvent::connection_id, "recovering"),
                  Field(&StatusTransitionEvent::old_status,
                        ConnectionStatus::CONNECTION_ERROR),
                  Field(&StatusTransitionEvent::new_status,
                        ConnectionStatus::ACTIVE))))
      .Times(1);
  EXPECT_CALL(*strict,
              OnStatusChange(AllOf(
                  Field(&StatusTransitionEvent::connection_id, "failing"),
                  Field(&StatusTransitionEvent::new_status,
                        ConnectionStatus::CONNECTION_ERROR))))
      .Times(1);
  Build(milliseconds(200), strict);

  SweepSummary first = scheduler_->RunSweepOnce();
  EXPECT_EQ(first.transitions, 2u);

  // 두 번째 스윕은 상태가 같으므로 이벤트 없음, 저장은 계속
  SweepSummary second = scheduler_->RunSweepOnce();
  EXPECT_EQ(second.transitions, 0u);
  EXPECT_EQ(second.persisted, 3u);
  EXPECT_EQ(repository_->update_count.load(), 6);
}

TEST_F(HealthCheckSchedulerTest, ThrowingNotifierDoesNotAbortSweep) {
  repository_->Add(MakeRecord("a", "modbus", ModbusJson("10.0.3.1"),
                              ConnectionStatus::INACTIVE));
  repository_->Add(MakeRecord("b", "modbus", ModbusJson("10.0.3.2"),
                              ConnectionStatus::INACTIVE));
  EXPECT_CALL(*notifier_, OnStatusChange(_))
      .Times(2)
      .WillRepeatedly(::testing::Throw(std::runtime_error("broadcast down")));
  Build();

  SweepSummary summary = scheduler_->RunSweepOnce();
  EXPECT_EQ(summary.persisted, 2u);
  EXPECT_EQ(summary.transitions, 2u);
  EXPECT_EQ(summary.record_errors, 0u);
  EXPECT_EQ(repository_->Get("b").status, ConnectionStatus::ACTIVE);
}

TEST_F(HealthCheckSchedulerTest, NonStandardNotifierExceptionDoesNotAbortSweep) {
  repository_->Add(MakeRecord("a", "modbus", ModbusJson("10.0.3.3"),
                              ConnectionStatus::INACTIVE));
  repository_->Add(MakeRecord("b", "modbus", ModbusJson("10.0.3.4"),
                              ConnectionStatus::INACTIVE));
  EXPECT_CALL(*notifier_, OnStatusChange(_))
      .Times(2)
      .WillRepeatedly(::testing::Throw(42));
  Build();

  SweepSummary summary = scheduler_->RunSweepOnce();
  EXPECT_EQ(summary.persisted, 2u);
  EXPECT_EQ(summary.transitions, 2u);
  EXPECT_EQ(summary.record_errors, 0u);
  EXPECT_EQ(repository_->Get("a").status, ConnectionStatus::ACTIVE);
  EXPECT_EQ(repository_->Get("b").status, ConnectionStatus::ACTIVE);
}

TEST_F(HealthCheckSchedulerTest, NonDriverProtocolsGetSyntheticSuccess) {
  repository_->Add(MakeRecord("hist", "dataHistorian",
                              R"({"server":"h","database":"plant"})",
                              ConnectionStatus::INACTIVE));
  Build();

  SweepSummary summary = scheduler_->RunSweepOnce();
  EXPECT_EQ(summary.succeeded, 1u);
  EXPECT_EQ(modbus_->connect_calls.load(), 0);

  auto record = repository_->Get("hist");
  EXPECT_EQ(record.status, ConnectionStatus::ACTIVE);
  EXPECT_TRUE(record.last_error.empty());
}

TEST_F(HealthCheckSchedulerTest, NonDriverConfigIsParsedBeforeMarkingActive) {
  repository_->Add(MakeRecord("scada-bad-json", "scada", "{not json",
                              ConnectionStatus::ACTIVE));
  repository_->Add(MakeRecord("scada-incomplete", "scada",
                              R"({"protocol":"dnp3"})",
                              ConnectionStatus::INACTIVE));
  repository_->Add(MakeRecord("scada-ok", "scada",
                              R"({"protocol":"dnp3","endpoint":"10.0.9.1"})",
                              ConnectionStatus::INACTIVE));
  Build();

  SweepSummary summary = scheduler_->RunSweepOnce();
  EXPECT_EQ(summary.failed, 2u);
  EXPECT_EQ(summary.succeeded, 1u);

  auto bad_json = repository_->Get("scada-bad-json");
  EXPECT_NE(bad_json.status, ConnectionStatus::ACTIVE);
  EXPECT_EQ(bad_json.status, ConnectionStatus::CONNECTION_ERROR);
  EXPECT_EQ(bad_json.last_error, "Invalid configuration: malformed JSON");

  auto incomplete = repository_->Get("scada-incomplete");
  EXPECT_EQ(incomplete.status, ConnectionStatus::CONNECTION_ERROR);
  EXPECT_EQ(incomplete.last_error, "SCADA protocol and endpoint are required");

  EXPECT_EQ(repository_->Get("scada-ok").status, ConnectionStatus::ACTIVE);
}

TEST_F(HealthCheckSchedulerTest, InvalidStoredConfigBecomesError) {
  repository_->Add(MakeRecord("broken", "modbus", "{not json",
                              ConnectionStatus::ACTIVE));
  repository_->Add(MakeRecord("ok", "modbus", ModbusJson("10.0.4.1"),
                              ConnectionStatus::ACTIVE));
  Build();

  SweepSummary summary = scheduler_->RunSweepOnce();
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.succeeded, 1u);

  auto broken = repository_->Get("broken");
  EXPECT_EQ(broken.status, ConnectionStatus::CONNECTION_ERROR);
  EXPECT_EQ(broken.last_error, "Invalid configuration: malformed JSON");
}

TEST_F(HealthCheckSchedulerTest, RepositoryFailureEndsOnlyThatSweep) {
  repository_->Add(MakeRecord("a", "modbus", ModbusJson("10.0.5.1"),
                              ConnectionStatus::INACTIVE));
  Build();

  repository_->fail_list = true;
  SweepSummary failed = scheduler_->RunSweepOnce();
  EXPECT_TRUE(failed.aborted);
  EXPECT_EQ(repository_->update_count.load(), 0);

  repository_->fail_list = false;
  SweepSummary recovered = scheduler_->RunSweepOnce();
  EXPECT_FALSE(recovered.aborted);
  EXPECT_EQ(recovered.persisted, 1u);
}

TEST_F(HealthCheckSchedulerTest, OverlappingSweepIsSkipped) {
  repository_->Add(MakeRecord("slow", "modbus", ModbusJson("10.0.6.1"),
                              ConnectionStatus::INACTIVE));
  modbus_->probe_delay = milliseconds(400);
  Build(milliseconds(2000));

  std::thread first([this]() { scheduler_->RunSweepOnce(); });
  std::this_thread::sleep_for(milliseconds(100));
  SweepSummary overlapping = scheduler_->RunSweepOnce();
  first.join();

  EXPECT_TRUE(overlapping.skipped);
  EXPECT_EQ(scheduler_->GetSweepCount(), 1u);
  EXPECT_EQ(repository_->update_count.load(), 1);
}

// =============================================================================
// libmodbus + 가상 서버 종단 간 시나리오
// =============================================================================

class HealthCheckSchedulerModbusTest : public HealthCheckSchedulerTest {
protected:
  void SetUp() override {
    HealthCheckSchedulerTest::SetUp();
    registry_ = std::make_shared<Drivers::AdapterRegistry>();
    registry_->RegisterAdapter(std::make_shared<Drivers::ModbusAdapter>());
    ASSERT_TRUE(responsive_.Start());
    ASSERT_TRUE(silent_.Start());
    silent_.SetSilent(true);
  }

  void TearDown() override {
    HealthCheckSchedulerTest::TearDown();
    responsive_.Stop();
    silent_.Stop();
  }

  VirtualModbusServer responsive_;
  VirtualModbusServer silent_;
};

TEST_F(HealthCheckSchedulerModbusTest, UnresponsiveDeviceIsMarkedErrorAtDeadline) {
  // 장치 응답 대기(2s)가 probe 마감(300ms)보다 길다
  repository_->Add(MakeRecord(
      "c1", "modbus",
      "{\"host\":\"127.0.0.1\",\"port\":" + std::to_string(silent_.GetPort()) +
          ",\"timeout\":2000}",
      ConnectionStatus::ACTIVE));
  repository_->Add(MakeRecord("c2", "modbus",
                              ModbusJson("127.0.0.1", responsive_.GetPort()),
                              ConnectionStatus::INACTIVE));

  std::mutex events_mutex;
  std::vector<StatusTransitionEvent> events;
  auto collector = std::make_shared<CallbackStatusNotifier>(
      [&events_mutex, &events](const StatusTransitionEvent &event) {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.push_back(event);
      });
  Build(milliseconds(300), collector);

  auto start = steady_clock::now();
  SweepSummary summary = scheduler_->RunSweepOnce();
  auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

  EXPECT_LT(elapsed.count(), 1500);
  EXPECT_EQ(summary.persisted, 2u);

  auto c1 = repository_->Get("c1");
  EXPECT_EQ(c1.status, ConnectionStatus::CONNECTION_ERROR);
  EXPECT_EQ(c1.last_error, "Modbus test timeout after 300ms");

  auto c2 = repository_->Get("c2");
  EXPECT_EQ(c2.status, ConnectionStatus::ACTIVE);

  std::lock_guard<std::mutex> lock(events_mutex);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].connection_id, "c1");
  EXPECT_EQ(events[0].old_status, ConnectionStatus::ACTIVE);
  EXPECT_EQ(events[0].new_status, ConnectionStatus::CONNECTION_ERROR);
  EXPECT_EQ(events[1].connection_id, "c2");
  EXPECT_EQ(events[1].new_status, ConnectionStatus::ACTIVE);
}
