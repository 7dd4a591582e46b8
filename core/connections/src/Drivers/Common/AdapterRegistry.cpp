// =============================================================================
// connections/src/Drivers/Common/AdapterRegistry.cpp
// =============================================================================

#include "Drivers/Common/AdapterRegistry.h"
#include "Drivers/Common/UnavailableAdapter.h"
#include "Drivers/Modbus/ModbusAdapter.h"
#include "Drivers/Mqtt/MqttAdapter.h"
#include "Drivers/OPCUA/OpcUaAdapter.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

namespace OtLink {
namespace Drivers {

bool AdapterRegistry::RegisterAdapter(AdapterPtr adapter) {
  if (!adapter) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  ProtocolType protocol = adapter->GetProtocolType();
  std::string name = Enums::ProtocolDisplayName(protocol);

  if (adapters_.find(protocol) != adapters_.end()) {
    LogManager::getInstance().Warn("[AdapterRegistry] Adapter '" + name +
                                   "' is already registered.");
    return false;
  }
  adapters_[protocol] = std::move(adapter);
  LogManager::getInstance().Info(
      "[AdapterRegistry] Registered adapter: '{}' ({})", name,
      adapters_[protocol]->IsAvailable() ? "available" : "unavailable");
  return true;
}

bool AdapterRegistry::UnregisterAdapter(ProtocolType protocol) {
  std::lock_guard<std::mutex> lock(mutex_);
  return adapters_.erase(protocol) > 0;
}

AdapterPtr AdapterRegistry::GetAdapter(ProtocolType protocol) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = adapters_.find(protocol);
  if (it == adapters_.end()) {
    return nullptr;
  }
  return it->second;
}

bool AdapterRegistry::IsProtocolSupported(ProtocolType protocol) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = adapters_.find(protocol);
  return it != adapters_.end() && it->second->IsAvailable();
}

std::vector<ProtocolType> AdapterRegistry::GetAvailableProtocols() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProtocolType> protocols;
  for (const auto &pair : adapters_) {
    if (pair.second->IsAvailable()) {
      protocols.push_back(pair.first);
    }
  }
  return protocols;
}

size_t AdapterRegistry::GetAdapterCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return adapters_.size();
}

AdapterRegistry::DriverOptions AdapterRegistry::LoadDriverOptions() {
  auto &config = ConfigManager::getInstance();
  DriverOptions options;
  options.opcua_enabled = config.getBool("DRIVER_OPCUA_ENABLED", true);
  options.mqtt_enabled = config.getBool("DRIVER_MQTT_ENABLED", true);
  options.modbus_enabled = config.getBool("DRIVER_MODBUS_ENABLED", true);
  return options;
}

std::shared_ptr<AdapterRegistry>
AdapterRegistry::CreateDefault(const DriverOptions &options) {
  auto registry = std::make_shared<AdapterRegistry>();
  const std::string disabled = "disabled by configuration";

  if (options.opcua_enabled) {
    registry->RegisterAdapter(std::make_shared<OpcUaAdapter>());
  } else {
    registry->RegisterAdapter(
        std::make_shared<UnavailableAdapter>(ProtocolType::OPCUA, disabled));
  }

  if (options.mqtt_enabled) {
    registry->RegisterAdapter(std::make_shared<MqttAdapter>());
  } else {
    registry->RegisterAdapter(
        std::make_shared<UnavailableAdapter>(ProtocolType::MQTT, disabled));
  }

  if (options.modbus_enabled) {
    registry->RegisterAdapter(std::make_shared<ModbusAdapter>());
  } else {
    registry->RegisterAdapter(
        std::make_shared<UnavailableAdapter>(ProtocolType::MODBUS, disabled));
  }

  return registry;
}

} // namespace Drivers
} // namespace OtLink
