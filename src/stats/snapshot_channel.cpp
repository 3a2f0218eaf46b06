// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

/**
 * @file snapshot_channel.cpp
 * @brief Implementation of the snapshot queue
 */

#include <route_atlas/stats/snapshot_channel.h>

#include <utility>

namespace route_atlas {

void SnapshotChannel::Push(Snapshot snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(snapshot));
    }
    available_.notify_one();
}

std::optional<Snapshot> SnapshotChannel::TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        return std::nullopt;
    }

    Snapshot snapshot = std::move(queue_.front());
    queue_.pop_front();
    return snapshot;
}

std::optional<Snapshot> SnapshotChannel::WaitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    available_.wait_for(lock, timeout, [this] {
        return closed_ || !queue_.empty();
    });

    if (queue_.empty()) {
        return std::nullopt;
    }

    Snapshot snapshot = std::move(queue_.front());
    queue_.pop_front();
    return snapshot;
}

std::optional<Snapshot> SnapshotChannel::PopLatest() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        return std::nullopt;
    }

    Snapshot snapshot = std::move(queue_.back());
    queue_.clear();
    return snapshot;
}

void SnapshotChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool SnapshotChannel::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t SnapshotChannel::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

SnapshotCallback SnapshotChannel::MakeCallback() {
    return [this](const Snapshot& snapshot) {
        Push(snapshot);
    };
}

} // namespace route_atlas
