// =============================================================================
// connections/src/Pool/ConnectionPool.cpp
// =============================================================================

#include "Pool/ConnectionPool.h"
#include "Config/ConnectionConfigParser.h"
#include "Logging/LogManager.h"

namespace OtLink {
namespace Pool {

using ErrorCode = OtLink::Enums::ErrorCode;
using ErrorInfo = OtLink::Structs::ErrorInfo;

ConnectionPool::ConnectionPool(
    std::shared_ptr<Drivers::AdapterRegistry> registry)
    : registry_(std::move(registry)) {}

ConnectionPool::~ConnectionPool() { CloseAll(); }

// =============================================================================
// 내부 헬퍼
// =============================================================================

std::shared_ptr<ConnectionPool::KeyLock>
ConnectionPool::AcquireKeyLock(const CacheKey &key) {
  std::lock_guard<std::mutex> lock(key_locks_mutex_);
  auto &slot = key_locks_[key];
  if (!slot) {
    slot = std::make_shared<KeyLock>();
  }
  slot->users++;
  return slot;
}

void ConnectionPool::ReleaseKeyLock(const CacheKey &key) {
  std::lock_guard<std::mutex> lock(key_locks_mutex_);
  auto it = key_locks_.find(key);
  if (it == key_locks_.end()) {
    return;
  }
  if (--it->second->users == 0) {
    key_locks_.erase(it);
  }
}

ConnectionPool::KeyLockGuard::KeyLockGuard(ConnectionPool &pool,
                                           const CacheKey &key)
    : pool_(pool), key_(key), entry_(pool.AcquireKeyLock(key)),
      lock_(entry_->mutex) {}

ConnectionPool::KeyLockGuard::~KeyLockGuard() {
  lock_.unlock();
  pool_.ReleaseKeyLock(key_);
}

HandlePtr ConnectionPool::FindHandle(const CacheKey &key) const {
  std::shared_lock<std::shared_mutex> lock(handles_mutex_);
  auto it = handles_.find(key);
  return it == handles_.end() ? nullptr : it->second;
}

HandlePtr ConnectionPool::RemoveHandle(const CacheKey &key,
                                       const SessionPtr &expected) {
  std::unique_lock<std::shared_mutex> lock(handles_mutex_);
  auto it = handles_.find(key);
  if (it == handles_.end()) {
    return nullptr;
  }
  if (expected && it->second->session != expected) {
    return nullptr;
  }
  HandlePtr handle = it->second;
  handles_.erase(it);
  return handle;
}

void ConnectionPool::Dispose(const HandlePtr &handle, const char *reason) {
  if (!handle || !handle->adapter) {
    return;
  }
  try {
    handle->adapter->Disconnect(handle->session);
  } catch (const std::exception &e) {
    LogManager::getInstance().Warn("[ConnectionPool] Disconnect failed for {}: {}",
                                   handle->key, e.what());
  } catch (...) {
    LogManager::getInstance().Warn(
        "[ConnectionPool] Disconnect failed for {}: non-standard exception",
        handle->key);
  }
  LogManager::getInstance().Debug("[ConnectionPool] Disposed {} ({})",
                                  handle->key, reason);
}

// =============================================================================
// GetHandle
// =============================================================================

HandlePtr ConnectionPool::GetHandle(const ConnectionConfig &config,
                                    ErrorInfo &error) {
  AdapterPtr adapter =
      registry_ ? registry_->GetAdapter(config.protocol) : nullptr;
  if (!adapter) {
    error = ErrorInfo(ErrorCode::DRIVER_UNAVAILABLE,
                      "No adapter registered for " +
                          Enums::ProtocolDisplayName(config.protocol));
    return nullptr;
  }

  const CacheKey key = Config::ConnectionConfigParser::DeriveCacheKey(config);
  KeyLockGuard key_lock(*this, key);

  // 1. 캐시 확인
  if (HandlePtr cached = FindHandle(key)) {
    if (cached->adapter->VerifyLive(cached->session)) {
      pool_hits_++;
      cached->last_used = BasicTypes::GetCurrentTimestamp();
      cached->use_count++;
      return cached;
    }

    LogManager::getInstance().Info("[ConnectionPool] Stale handle evicted: {}",
                                   key);
    evictions_++;
    Dispose(RemoveHandle(key, cached->session), "liveness check failed");
  }

  // 2. 새 연결
  pool_misses_++;
  SessionPtr session = adapter->Connect(config, error);
  if (!session) {
    failed_connects_++;
    if (!error.IsError()) {
      error = ErrorInfo(ErrorCode::CONNECTION_FAILED,
                        Enums::ProtocolDisplayName(config.protocol) +
                            " connection failed");
    }
    LogManager::getInstance().Warn("[ConnectionPool] Connect failed for {}: {}",
                                   key, error.message);
    return nullptr;
  }
  total_connects_++;

  auto handle = std::make_shared<PooledHandle>();
  handle->key = key;
  handle->protocol = config.protocol;
  handle->session = session;
  handle->adapter = adapter;
  handle->created_at = BasicTypes::GetCurrentTimestamp();
  handle->last_used = handle->created_at;
  handle->use_count = 1;

  {
    std::unique_lock<std::shared_mutex> lock(handles_mutex_);
    handles_[key] = handle;
  }
  LogManager::getInstance().Debug("[ConnectionPool] Cached new handle: {}",
                                  key);
  return handle;
}

// =============================================================================
// 무효화 / 해제
// =============================================================================

HandlePtr ConnectionPool::Evict(const CacheKey &key,
                                const SessionPtr &expected) {
  HandlePtr handle = RemoveHandle(key, expected);
  if (!handle) {
    return nullptr;
  }
  evictions_++;
  LogManager::getInstance().Info("[ConnectionPool] Invalidated: {}", key);
  return handle;
}

bool ConnectionPool::Invalidate(const CacheKey &key,
                                const SessionPtr &expected) {
  HandlePtr handle = Evict(key, expected);
  if (!handle) {
    return false;
  }
  Dispose(handle, "invalidated");
  return true;
}

void ConnectionPool::CloseAll() {
  std::map<CacheKey, HandlePtr> drained;
  {
    std::unique_lock<std::shared_mutex> lock(handles_mutex_);
    drained.swap(handles_);
  }
  if (drained.empty()) {
    return;
  }

  LogManager::getInstance().Info("[ConnectionPool] Closing {} handles",
                                 drained.size());
  for (auto &pair : drained) {
    Dispose(pair.second, "close all");
  }
}

bool ConnectionPool::Contains(const CacheKey &key) const {
  std::shared_lock<std::shared_mutex> lock(handles_mutex_);
  return handles_.find(key) != handles_.end();
}

size_t ConnectionPool::Size() const {
  std::shared_lock<std::shared_mutex> lock(handles_mutex_);
  return handles_.size();
}

size_t ConnectionPool::GetKeyLockCount() const {
  std::lock_guard<std::mutex> lock(key_locks_mutex_);
  return key_locks_.size();
}

PoolStatistics ConnectionPool::GetStatistics() const {
  PoolStatistics stats;
  stats.total_connects = total_connects_.load();
  stats.failed_connects = failed_connects_.load();
  stats.pool_hits = pool_hits_.load();
  stats.pool_misses = pool_misses_.load();
  stats.evictions = evictions_.load();
  stats.active_handles = Size();
  return stats;
}

} // namespace Pool
} // namespace OtLink
