/**
 * @file test_connection_config_parser.cpp
 * @brief 연결 설정 파싱 / 검증 / 캐시 키 테스트
 */

#include "Config/ConnectionConfigParser.h"
#include "Logging/LogManager.h"

#include <gtest/gtest.h>

using namespace OtLink;
using namespace OtLink::Config;
using OtLink::Enums::ErrorCode;
using OtLink::Enums::ProtocolType;
using OtLink::Structs::ConnectionConfig;
using OtLink::Structs::ErrorInfo;
using OtLink::Structs::JsonType;

class ConnectionConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::WARN);
  }

  ConnectionConfig ParseOk(ProtocolType protocol, const std::string &json) {
    ConnectionConfig config;
    ErrorInfo error;
    EXPECT_TRUE(parser_.Parse(protocol, json, config, error)) << error.message;
    return config;
  }

  ConnectionConfigParser parser_;
};

TEST_F(ConnectionConfigParserTest, ParsesOpcUaWithDefaults) {
  auto config = ParseOk(ProtocolType::OPCUA,
                        R"({"endpoint":"opc.tcp://plc:4840"})");
  EXPECT_EQ(config.protocol, ProtocolType::OPCUA);
  EXPECT_EQ(config.opcua.endpoint, "opc.tcp://plc:4840");
  EXPECT_EQ(config.opcua.security_mode, "None");
  EXPECT_EQ(config.opcua.security_policy, "None");
  EXPECT_EQ(config.opcua.client_timeout_ms, 10000u);
  EXPECT_TRUE(config.opcua.username.empty());
}

TEST_F(ConnectionConfigParserTest, ParsesMqttNumericStrings) {
  auto config = ParseOk(
      ProtocolType::MQTT,
      R"({"broker":"broker.local","port":"8883","protocol":"mqtts","clientId":"c1"})");
  EXPECT_EQ(config.mqtt.broker, "broker.local");
  EXPECT_EQ(config.mqtt.port, 8883);
  EXPECT_TRUE(config.mqtt.has_port);
  EXPECT_EQ(config.mqtt.scheme, "mqtts");
  EXPECT_EQ(config.mqtt.client_id, "c1");
}

TEST_F(ConnectionConfigParserTest, ParsesModbusTcpAndRtu) {
  auto tcp = ParseOk(ProtocolType::MODBUS,
                     R"({"type":"tcp","host":"10.0.0.5","port":1502,"unitId":7})");
  EXPECT_EQ(tcp.modbus.transport, "TCP");
  EXPECT_EQ(tcp.modbus.host, "10.0.0.5");
  EXPECT_EQ(tcp.modbus.port, 1502);
  EXPECT_EQ(tcp.modbus.unit_id, 7);
  EXPECT_TRUE(tcp.modbus.has_unit_id);
  EXPECT_EQ(tcp.modbus.response_timeout_ms, 3000u);

  auto rtu = ParseOk(
      ProtocolType::MODBUS,
      R"({"type":"RTU","serialPort":"/dev/ttyS1","baudRate":19200,"parity":"e"})");
  EXPECT_EQ(rtu.modbus.transport, "RTU");
  EXPECT_EQ(rtu.modbus.serial_port, "/dev/ttyS1");
  EXPECT_EQ(rtu.modbus.baud_rate, 19200);
  EXPECT_EQ(rtu.modbus.parity, 'E');
}

TEST_F(ConnectionConfigParserTest, DefaultsComeFromParserDefaults) {
  ParserDefaults defaults;
  defaults.modbus_response_timeout_ms = 750;
  ConnectionConfigParser parser(defaults);

  ConnectionConfig config;
  ErrorInfo error;
  ASSERT_TRUE(parser.Parse(ProtocolType::MODBUS,
                           std::string(R"({"host":"h","port":502})"), config,
                           error));
  EXPECT_EQ(config.modbus.response_timeout_ms, 750u);
}

TEST_F(ConnectionConfigParserTest, MalformedJsonIsInvalidConfiguration) {
  ConnectionConfig config;
  ErrorInfo error;
  EXPECT_FALSE(parser_.Parse(ProtocolType::OPCUA, std::string("{not json"),
                             config, error));
  EXPECT_EQ(error.code, ErrorCode::INVALID_CONFIGURATION);
  EXPECT_EQ(error.message, "Invalid configuration: malformed JSON");
}

TEST_F(ConnectionConfigParserTest, WrongFieldTypeIsInvalidConfiguration) {
  ConnectionConfig config;
  ErrorInfo error;
  EXPECT_FALSE(parser_.Parse(ProtocolType::MODBUS,
                             std::string(R"({"host":"h","port":"abc"})"),
                             config, error));
  EXPECT_EQ(error.code, ErrorCode::INVALID_CONFIGURATION);
  EXPECT_EQ(error.message.rfind("Invalid configuration: ", 0), 0u);
}

TEST_F(ConnectionConfigParserTest, OversizedNumbersAreRejectedNotTruncated) {
  const char *inputs[] = {
      R"({"host":"h","port":1e12})",
      R"({"host":"h","port":4294967798})",
      R"({"host":"h","port":-9000000000})",
      R"({"host":"h","port":"99999999999"})",
      R"({"host":"h","unitId":18446744073709551615})",
  };
  for (const char *json : inputs) {
    ConnectionConfig config;
    ErrorInfo error;
    EXPECT_FALSE(parser_.Parse(ProtocolType::MODBUS, std::string(json), config,
                               error))
        << json;
    EXPECT_EQ(error.code, ErrorCode::INVALID_CONFIGURATION) << json;
    EXPECT_NE(error.message.find("is out of range"), std::string::npos)
        << error.message;
  }
}

TEST_F(ConnectionConfigParserTest, FractionalPortIsTruncatedWithinRange) {
  auto config = ParseOk(ProtocolType::MODBUS, R"({"host":"h","port":502.0})");
  EXPECT_EQ(config.modbus.port, 502);
}

TEST_F(ConnectionConfigParserTest, ValidateRejectsPortsAndUnitIdsOutOfRange) {
  ErrorInfo error;

  auto mqtt = ParseOk(ProtocolType::MQTT, R"({"broker":"b","port":70000})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(mqtt, error));
  EXPECT_EQ(error.code, ErrorCode::INVALID_CONFIGURATION);
  EXPECT_EQ(error.message, "MQTT port must be between 1 and 65535");

  auto mqtt_zero = ParseOk(ProtocolType::MQTT, R"({"broker":"b","port":0})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(mqtt_zero, error));
  EXPECT_EQ(error.message, "MQTT port must be between 1 and 65535");

  auto modbus = ParseOk(ProtocolType::MODBUS, R"({"host":"h","port":-1})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(modbus, error));
  EXPECT_EQ(error.message, "Modbus port must be between 1 and 65535");

  auto unit = ParseOk(ProtocolType::MODBUS,
                      R"({"host":"h","port":502,"unitId":256})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(unit, error));
  EXPECT_EQ(error.message, "Modbus unit id must be between 0 and 255");

  auto rtu_unit = ParseOk(ProtocolType::MODBUS, R"({"type":"RTU","unitId":-3})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(rtu_unit, error));
  EXPECT_EQ(error.message, "Modbus unit id must be between 0 and 255");

  EXPECT_TRUE(ConnectionConfigParser::Validate(
      ParseOk(ProtocolType::MODBUS,
              R"({"host":"h","port":65535,"unitId":255})"),
      error));
}

TEST_F(ConnectionConfigParserTest, ValidateReportsRequiredFields) {
  ErrorInfo error;

  auto opcua = ParseOk(ProtocolType::OPCUA, "{}");
  EXPECT_FALSE(ConnectionConfigParser::Validate(opcua, error));
  EXPECT_EQ(error.message, "OPC UA endpoint is required");

  auto mqtt = ParseOk(ProtocolType::MQTT, R"({"broker":"b"})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(mqtt, error));
  EXPECT_EQ(error.message, "MQTT broker and port are required");

  auto modbus = ParseOk(ProtocolType::MODBUS, R"({"host":"h"})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(modbus, error));
  EXPECT_EQ(error.message, "Modbus host and port are required");

  auto serial = ParseOk(ProtocolType::MODBUS, R"({"type":"ascii"})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(serial, error));
  EXPECT_EQ(error.code, ErrorCode::INVALID_CONFIGURATION);

  auto scada = ParseOk(ProtocolType::SCADA, R"({"protocol":"dnp3"})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(scada, error));
  EXPECT_EQ(error.message, "SCADA protocol and endpoint are required");

  auto mes = ParseOk(ProtocolType::MES, "{}");
  EXPECT_FALSE(ConnectionConfigParser::Validate(mes, error));
  EXPECT_EQ(error.message, "MES API URL is required");

  auto historian = ParseOk(ProtocolType::DATA_HISTORIAN, R"({"server":"s"})");
  EXPECT_FALSE(ConnectionConfigParser::Validate(historian, error));
  EXPECT_EQ(error.message, "Data Historian server and database are required");
}

TEST_F(ConnectionConfigParserTest, ValidConfigurationsPass) {
  ErrorInfo error;
  EXPECT_TRUE(ConnectionConfigParser::Validate(
      ParseOk(ProtocolType::OPCUA, R"({"endpoint":"opc.tcp://x:4840"})"),
      error));
  EXPECT_TRUE(ConnectionConfigParser::Validate(
      ParseOk(ProtocolType::MQTT, R"({"broker":"b","port":1883})"), error));
  EXPECT_TRUE(ConnectionConfigParser::Validate(
      ParseOk(ProtocolType::MODBUS, R"({"type":"RTU"})"), error));
  EXPECT_TRUE(ConnectionConfigParser::Validate(
      ParseOk(ProtocolType::MES, R"({"apiUrl":"http://mes"})"), error));
}

TEST_F(ConnectionConfigParserTest, CacheKeysIdentifyLogicalConnections) {
  auto anonymous = ParseOk(ProtocolType::OPCUA,
                           R"({"endpoint":"opc.tcp://a:4840"})");
  auto operator_user = ParseOk(
      ProtocolType::OPCUA,
      R"({"endpoint":"opc.tcp://a:4840","username":"op","password":"x"})");
  EXPECT_EQ(ConnectionConfigParser::DeriveCacheKey(anonymous),
            "opcua|opc.tcp://a:4840|anonymous");
  EXPECT_EQ(ConnectionConfigParser::DeriveCacheKey(operator_user),
            "opcua|opc.tcp://a:4840|op");

  auto mqtt = ParseOk(ProtocolType::MQTT, R"({"broker":"b","port":1883})");
  EXPECT_EQ(ConnectionConfigParser::DeriveCacheKey(mqtt), "mqtt|b|1883|default");

  auto modbus = ParseOk(ProtocolType::MODBUS,
                        R"({"host":"10.0.0.5","port":502,"unitId":3})");
  EXPECT_EQ(ConnectionConfigParser::DeriveCacheKey(modbus),
            "modbus|10.0.0.5|502|3");

  auto rtu = ParseOk(ProtocolType::MODBUS,
                     R"({"type":"RTU","serialPort":"/dev/ttyS0"})");
  EXPECT_EQ(ConnectionConfigParser::DeriveCacheKey(rtu),
            "modbus|/dev/ttyS0|502|1");
}

TEST_F(ConnectionConfigParserTest, TimeoutDoesNotChangeCacheKey) {
  auto fast = ParseOk(ProtocolType::MODBUS,
                      R"({"host":"h","port":502,"timeout":100})");
  auto slow = ParseOk(ProtocolType::MODBUS,
                      R"({"host":"h","port":502,"timeout":9000})");
  EXPECT_EQ(ConnectionConfigParser::DeriveCacheKey(fast),
            ConnectionConfigParser::DeriveCacheKey(slow));
}

TEST_F(ConnectionConfigParserTest, NonDriverProtocolsKeepProperties) {
  auto historian = ParseOk(
      ProtocolType::DATA_HISTORIAN,
      R"({"server":"hist01","database":"plant","port":5450,"secure":true})");
  EXPECT_EQ(historian.properties["server"], "hist01");
  EXPECT_EQ(historian.properties["database"], "plant");
  EXPECT_EQ(historian.properties["port"], "5450");
  EXPECT_EQ(historian.properties["secure"], "true");
}
