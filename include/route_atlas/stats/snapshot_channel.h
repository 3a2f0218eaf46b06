// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file snapshot_channel.h
 * @brief Thread-safe queue carrying snapshots from the aggregator to a consumer
 *
 * The aggregator worker pushes snapshots through the callback returned by
 * MakeCallback(); the presentation thread drains them with TryPop() or
 * WaitPop(). Snapshots are delivered in publish order.
 */

#include "snapshot.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace route_atlas {

/**
 * @brief Multi-producer, single-consumer snapshot queue
 *
 * Thread Safety:
 * - Push() is safe from any number of producers
 * - TryPop() and WaitPop() are safe, one consumer expected
 * - Size() is approximate under concurrent access
 */
class SnapshotChannel {
public:
    SnapshotChannel() = default;
    ~SnapshotChannel() = default;

    // Non-copyable
    SnapshotChannel(const SnapshotChannel&) = delete;
    SnapshotChannel& operator=(const SnapshotChannel&) = delete;

    /**
     * @brief Append a snapshot
     *
     * Ignored after Close().
     */
    void Push(Snapshot snapshot);

    /**
     * @brief Pop the oldest snapshot without blocking
     *
     * @return Snapshot, or nullopt if the channel is empty
     */
    std::optional<Snapshot> TryPop();

    /**
     * @brief Pop the oldest snapshot, waiting up to timeout for one
     *
     * @return Snapshot, or nullopt on timeout or if the channel is closed
     *         and empty
     */
    std::optional<Snapshot> WaitPop(std::chrono::milliseconds timeout);

    /**
     * @brief Drop everything but the most recent snapshot
     *
     * @return Latest snapshot, or nullopt if the channel is empty
     */
    std::optional<Snapshot> PopLatest();

    /// Stop accepting snapshots and wake waiting consumers
    void Close();

    [[nodiscard]] bool IsClosed() const;

    [[nodiscard]] std::size_t Size() const;

    [[nodiscard]] bool Empty() const {
        return Size() == 0;
    }

    /// Callback that pushes into this channel. The channel must outlive
    /// every run the callback is given to.
    [[nodiscard]] SnapshotCallback MakeCallback();

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<Snapshot> queue_;
    bool closed_ = false;
};

} // namespace route_atlas
