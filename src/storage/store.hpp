#pragma once

#include "command/command.hpp"

#include <deque>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace polykv {

// ── Guarded ───────────────────────────────────────────────────────────────────
//
// A value owned together with the reader/writer lock that protects it.
// The only way to reach the value is through a guard; the lock is held for
// the guard's lifetime and released on every exit path.
//
//   auto hashes = store.hashes().read();   // shared lock
//   auto it = hashes->find(key);
//
//   auto hashes = store.hashes().write();  // exclusive lock
//   (*hashes)[key][field] = value;

template <typename T>
class Guarded {
public:
    class ReadGuard {
    public:
        ReadGuard(std::shared_mutex& mutex, const T& value)
            : lock_(mutex), value_(value) {}

        const T& operator*() const noexcept { return value_; }
        const T* operator->() const noexcept { return &value_; }

    private:
        std::shared_lock<std::shared_mutex> lock_;
        const T& value_;
    };

    class WriteGuard {
    public:
        WriteGuard(std::shared_mutex& mutex, T& value)
            : lock_(mutex), value_(value) {}

        T& operator*() const noexcept { return value_; }
        T* operator->() const noexcept { return &value_; }

    private:
        std::unique_lock<std::shared_mutex> lock_;
        T& value_;
    };

    Guarded() = default;

    Guarded(const Guarded&)            = delete;
    Guarded& operator=(const Guarded&) = delete;

    // Acquires a shared (read) lock.  Concurrent readers proceed together.
    [[nodiscard]] ReadGuard read() const { return ReadGuard{mutex_, value_}; }

    // Acquires an exclusive (write) lock.
    [[nodiscard]] WriteGuard write() { return WriteGuard{mutex_, value_}; }

private:
    mutable std::shared_mutex mutex_;
    T value_;
};

// ── Containers ────────────────────────────────────────────────────────────────

using StringMap = std::unordered_map<Key, Value>;

using Hash    = std::unordered_map<Key, Value>;
using HashMap = std::unordered_map<Key, Hash>;

using MemberSet = std::unordered_set<Value>;
using SetMap    = std::unordered_map<Key, MemberSet>;

using List    = std::deque<Value>;
using ListMap = std::unordered_map<Key, List>;

// ── Store ─────────────────────────────────────────────────────────────────────
//
// Shared state of the server: one independently locked container per data
// type.  Passed by reference to every command execution.
//
// Concurrency model:
//   - Each container has its own std::shared_mutex; reads share it, writes
//     hold it exclusively.  Locking is per container, not per key.
//   - No command holds two container locks at the same time.  keys() visits
//     the containers one after another in the fixed order
//     strings → hashes → sets → lists.
//   - Containers are created lazily on first write and are never removed
//     when they become empty.
class Store {
public:
    Store() = default;

    // Not copyable or movable – sessions hold references to the live store.
    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;

    [[nodiscard]] Guarded<StringMap>& strings() noexcept { return strings_; }
    [[nodiscard]] Guarded<HashMap>& hashes() noexcept { return hashes_; }
    [[nodiscard]] Guarded<SetMap>& sets() noexcept { return sets_; }
    [[nodiscard]] Guarded<ListMap>& lists() noexcept { return lists_; }

    [[nodiscard]] const Guarded<StringMap>& strings() const noexcept { return strings_; }
    [[nodiscard]] const Guarded<HashMap>& hashes() const noexcept { return hashes_; }
    [[nodiscard]] const Guarded<SetMap>& sets() const noexcept { return sets_; }
    [[nodiscard]] const Guarded<ListMap>& lists() const noexcept { return lists_; }

    // Returns every top-level key across all containers, each reported once
    // (order is unspecified).
    [[nodiscard]] std::vector<Key> keys() const;

private:
    Guarded<StringMap> strings_;
    Guarded<HashMap> hashes_;
    Guarded<SetMap> sets_;
    Guarded<ListMap> lists_;
};

} // namespace polykv
