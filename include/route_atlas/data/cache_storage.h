// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace route_atlas {

/// Outcome class of a storage read
enum class StorageReadStatus {
    FOUND,         ///< Payload holds the stored value
    MISSING,       ///< Nothing stored under the key
    TYPE_MISMATCH  ///< Something is stored but it is not a readable value
};

/// Result of a storage read
struct StorageReadResult {
    StorageReadStatus status;  ///< Read outcome
    std::string payload;       ///< Stored value (FOUND only)

    StorageReadResult() : status(StorageReadStatus::MISSING) {}

    StorageReadResult(StorageReadStatus read_status, std::string value)
        : status(read_status), payload(std::move(value)) {}
};

/// Persistent key-value storage port used by GeoCache.
/// Values are opaque strings; decoding and shape validation belong to the
/// caller. Implementations report failures through return values and never
/// throw.
class CacheStorage {
public:
    virtual ~CacheStorage() = default;

    /// Read the value stored under key
    [[nodiscard]] virtual StorageReadResult Get(const std::string& key) const = 0;

    /// Overwrite the value stored under key
    /// @return True on success
    virtual bool Set(const std::string& key, const std::string& payload) = 0;

    /// Remove the value stored under key
    /// @return True if a value was removed
    virtual bool Remove(const std::string& key) = 0;

    /// Volatile storage, mainly for tests and one-shot runs
    [[nodiscard]] static std::unique_ptr<CacheStorage> CreateInMemory();

    /// Directory-backed storage, one file per key
    /// @param directory Storage directory (created if missing)
    /// @return Storage instance, or nullptr if the directory cannot be created
    [[nodiscard]] static std::unique_ptr<CacheStorage> CreateFileBacked(const std::string& directory);
};

/// Thread-safe in-memory storage
class InMemoryCacheStorage : public CacheStorage {
public:
    InMemoryCacheStorage() = default;

    [[nodiscard]] StorageReadResult Get(const std::string& key) const override;
    bool Set(const std::string& key, const std::string& payload) override;
    bool Remove(const std::string& key) override;

    /// Number of keys currently stored
    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

/// Storage that keeps every key in "<directory>/<key>.json".
/// Writes go to a temporary file that is renamed over the target, so a
/// crash leaves either the old or the new value.
class FileCacheStorage : public CacheStorage {
public:
    explicit FileCacheStorage(std::string directory);

    /// Create the storage directory
    /// @return True on success
    bool Initialize();

    [[nodiscard]] StorageReadResult Get(const std::string& key) const override;
    bool Set(const std::string& key, const std::string& payload) override;
    bool Remove(const std::string& key) override;

    [[nodiscard]] const std::string& GetDirectory() const noexcept {
        return directory_;
    }

    /// Path of the file holding key
    [[nodiscard]] std::string PathFor(const std::string& key) const;

private:
    std::string directory_;
    mutable std::mutex mutex_;
};

} // namespace route_atlas
