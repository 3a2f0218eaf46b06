// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/data/cache_storage.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace route_atlas {

std::unique_ptr<CacheStorage> CacheStorage::CreateInMemory() {
    return std::make_unique<InMemoryCacheStorage>();
}

std::unique_ptr<CacheStorage> CacheStorage::CreateFileBacked(const std::string& directory) {
    auto storage = std::make_unique<FileCacheStorage>(directory);
    if (!storage->Initialize()) {
        return nullptr;
    }
    return storage;
}

// InMemoryCacheStorage

StorageReadResult InMemoryCacheStorage::Get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) {
        return StorageReadResult();
    }
    return StorageReadResult(StorageReadStatus::FOUND, it->second);
}

bool InMemoryCacheStorage::Set(const std::string& key, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = payload;
    return true;
}

bool InMemoryCacheStorage::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.erase(key) > 0;
}

std::size_t InMemoryCacheStorage::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

// FileCacheStorage

FileCacheStorage::FileCacheStorage(std::string directory)
    : directory_(std::move(directory)) {}

bool FileCacheStorage::Initialize() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("FileCacheStorage: cannot create directory {}: {}",
                      directory_, ec.message());
        return false;
    }
    spdlog::debug("FileCacheStorage: using directory {}", directory_);
    return true;
}

std::string FileCacheStorage::PathFor(const std::string& key) const {
    return (std::filesystem::path(directory_) / (key + ".json")).string();
}

StorageReadResult FileCacheStorage::Get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string path = PathFor(key);

    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || status.type() == std::filesystem::file_type::not_found) {
        return StorageReadResult();
    }
    if (status.type() != std::filesystem::file_type::regular) {
        spdlog::warn("FileCacheStorage: {} is not a regular file", path);
        return StorageReadResult(StorageReadStatus::TYPE_MISMATCH, std::string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("FileCacheStorage: cannot open {}", path);
        return StorageReadResult(StorageReadStatus::TYPE_MISMATCH, std::string());
    }

    std::string payload((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        spdlog::warn("FileCacheStorage: read error on {}", path);
        return StorageReadResult(StorageReadStatus::TYPE_MISMATCH, std::string());
    }

    return StorageReadResult(StorageReadStatus::FOUND, std::move(payload));
}

bool FileCacheStorage::Set(const std::string& key, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string path = PathFor(key);
    const std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("FileCacheStorage: cannot open {} for writing", temp_path);
            return false;
        }
        file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        file.flush();
        if (!file.good()) {
            spdlog::error("FileCacheStorage: write failed for {}", temp_path);
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        spdlog::error("FileCacheStorage: cannot replace {}: {}", path, ec.message());
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }

    return true;
}

bool FileCacheStorage::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const bool removed = std::filesystem::remove(PathFor(key), ec);
    if (ec) {
        spdlog::warn("FileCacheStorage: cannot remove {}: {}", key, ec.message());
        return false;
    }
    return removed;
}

} // namespace route_atlas
