/**
 * @file test_modbus_adapter.cpp
 * @brief libmodbus 어댑터 - 인프로세스 가상 Modbus TCP 서버 대상
 */

#include "Drivers/Modbus/ModbusAdapter.h"
#include "Logging/LogManager.h"
#include "Mocks/VirtualModbusServer.h"

#include <gtest/gtest.h>

using namespace OtLink;
using namespace OtLink::Drivers;
using namespace OtLink::Testing;
using OtLink::Enums::ErrorCode;
using OtLink::Enums::ProtocolType;

class ModbusAdapterTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::WARN);
    ASSERT_TRUE(server_.Start());
  }

  void TearDown() override {
    if (session_) {
      adapter_.Disconnect(session_);
    }
    server_.Stop();
  }

  Structs::ConnectionConfig Config(uint32_t timeout_ms = 1000) const {
    Structs::ConnectionConfig config;
    config.protocol = ProtocolType::MODBUS;
    config.modbus.transport = "TCP";
    config.modbus.host = "127.0.0.1";
    config.modbus.port = server_.GetPort();
    config.modbus.has_port = true;
    config.modbus.unit_id = 1;
    config.modbus.has_unit_id = true;
    config.modbus.response_timeout_ms = timeout_ms;
    return config;
  }

  void Connect(uint32_t timeout_ms = 1000) {
    Structs::ErrorInfo error;
    session_ = adapter_.Connect(Config(timeout_ms), error);
    ASSERT_NE(session_, nullptr) << error.message;
  }

  VirtualModbusServer server_{16};
  ModbusAdapter adapter_;
  SessionPtr session_;
};

TEST_F(ModbusAdapterTest, ReadsHoldingRegisters) {
  Connect();
  Structs::ModbusReadResult result;
  Structs::ErrorInfo error;
  ASSERT_TRUE(adapter_.ReadAddresses(session_, {0, 1, 5}, 3, result, error));

  ASSERT_EQ(result.values.size(), 3u);
  EXPECT_EQ(result.values[0].value.value_or(-1), 100);
  EXPECT_EQ(result.values[1].value.value_or(-1), 101);
  EXPECT_EQ(result.values[2].value.value_or(-1), 105);
  EXPECT_EQ(result.failed_count, 0u);
  EXPECT_FALSE(result.link_suspect);
  EXPECT_EQ(result.function_code, 3);
}

TEST_F(ModbusAdapterTest, ReadsInputRegistersWithFunctionCode4) {
  Connect();
  Structs::ModbusReadResult result;
  Structs::ErrorInfo error;
  ASSERT_TRUE(adapter_.ReadAddresses(session_, {2}, 4, result, error));
  ASSERT_EQ(result.values.size(), 1u);
  EXPECT_EQ(result.values[0].value.value_or(-1), 1102);
}

TEST_F(ModbusAdapterTest, ReadsCoilsAndDiscreteInputs) {
  Connect();
  Structs::ModbusReadResult coils;
  Structs::ErrorInfo error;
  ASSERT_TRUE(adapter_.ReadAddresses(session_, {2, 3}, 1, coils, error));
  EXPECT_EQ(coils.values[0].value.value_or(-1), 0);
  EXPECT_EQ(coils.values[1].value.value_or(-1), 1);

  Structs::ModbusReadResult inputs;
  ASSERT_TRUE(adapter_.ReadAddresses(session_, {7}, 2, inputs, error));
  EXPECT_EQ(inputs.values[0].value.value_or(-1), 1);
}

TEST_F(ModbusAdapterTest, ExceptionResponseFailsOnlyThatAddress) {
  Connect();
  Structs::ModbusReadResult result;
  Structs::ErrorInfo error;
  ASSERT_TRUE(adapter_.ReadAddresses(session_, {1, 500, 3}, 3, result, error));

  ASSERT_EQ(result.values.size(), 3u);
  EXPECT_EQ(result.values[0].value.value_or(-1), 101);
  EXPECT_FALSE(result.values[1].value.has_value());
  EXPECT_FALSE(result.values[1].error.empty());
  EXPECT_EQ(result.values[2].value.value_or(-1), 103);
  EXPECT_EQ(result.failed_count, 1u);
  // 장치가 응답했으므로 링크는 정상
  EXPECT_FALSE(result.link_suspect);

  auto json = result.ToJson();
  EXPECT_TRUE(json["values"]["500"].is_null());
  EXPECT_EQ(json["values"]["1"], 101);
  EXPECT_EQ(json["failedCount"], 1);
}

TEST_F(ModbusAdapterTest, OutOfRangeAddressIsRejectedLocally) {
  Connect();
  Structs::ModbusReadResult result;
  Structs::ErrorInfo error;
  ASSERT_TRUE(adapter_.ReadAddresses(session_, {-1, 0}, 3, result, error));
  EXPECT_FALSE(result.values[0].value.has_value());
  EXPECT_EQ(result.values[1].value.value_or(-1), 100);
  EXPECT_EQ(server_.GetRequestCount(), 1);
}

TEST_F(ModbusAdapterTest, UnsupportedFunctionCodeIsConfigError) {
  Connect();
  Structs::ModbusReadResult result;
  Structs::ErrorInfo error;
  EXPECT_FALSE(adapter_.ReadAddresses(session_, {0}, 6, result, error));
  EXPECT_EQ(error.code, ErrorCode::UNSUPPORTED_FUNCTION);
  EXPECT_EQ(error.message, "Unsupported Modbus function code: 6");
}

TEST_F(ModbusAdapterTest, ProbeSucceedsAgainstResponsiveDevice) {
  Connect();
  std::string message;
  Structs::ErrorInfo error;
  EXPECT_TRUE(adapter_.Probe(session_, message, error));
  EXPECT_EQ(message, "Modbus connection successful");
}

TEST_F(ModbusAdapterTest, ProbeTimeoutIsFailure) {
  Connect(200);
  server_.SetSilent(true);

  std::string message;
  Structs::ErrorInfo error;
  EXPECT_FALSE(adapter_.Probe(session_, message, error));
  EXPECT_TRUE(error.IsTimeout());
  EXPECT_EQ(error.message, "Modbus test read timeout after 200ms");
}

TEST_F(ModbusAdapterTest, SilentDeviceMarksLinkSuspect) {
  Connect(200);
  server_.SetSilent(true);

  Structs::ModbusReadResult result;
  Structs::ErrorInfo error;
  ASSERT_TRUE(adapter_.ReadAddresses(session_, {0}, 3, result, error));
  EXPECT_EQ(result.failed_count, 1u);
  EXPECT_TRUE(result.link_suspect);
}

TEST_F(ModbusAdapterTest, ConnectToClosedPortFails) {
  auto config = Config();
  server_.Stop();

  Structs::ErrorInfo error;
  EXPECT_EQ(adapter_.Connect(config, error), nullptr);
  EXPECT_EQ(error.code, ErrorCode::CONNECTION_FAILED);
  EXPECT_EQ(error.message.rfind("Modbus connection failed: 127.0.0.1:", 0), 0u);
}

TEST_F(ModbusAdapterTest, UnsupportedTransportIsRejected) {
  auto config = Config();
  config.modbus.transport = "ASCII";
  Structs::ErrorInfo error;
  EXPECT_EQ(adapter_.Connect(config, error), nullptr);
  EXPECT_EQ(error.message, "Unsupported Modbus connection type: ASCII");
}

TEST_F(ModbusAdapterTest, DisconnectClosesSession) {
  Connect();
  adapter_.Disconnect(session_);

  std::string message;
  Structs::ErrorInfo error;
  EXPECT_FALSE(adapter_.Probe(session_, message, error));
  EXPECT_EQ(error.code, ErrorCode::CONNECTION_LOST);
  session_.reset();
}
