/**
 * @file threading.hpp
 * @brief Synchronization primitives used by the DynRec registry layer
 *
 * The compiler and the record adapter hold no shared state; only
 * the schema cache and the in-memory schema store share mutable state.
 */

#pragma once

#include <mutex>
#include <shared_mutex>

namespace dynrec {

/**
 * @brief Mutex wrapper
 */
class Mutex {
public:
    Mutex() = default;
    ~Mutex() = default;

    // Non-copyable, non-movable
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock() { mutex_.lock(); }
    bool try_lock() { return mutex_.try_lock(); }
    void unlock() { mutex_.unlock(); }

private:
    std::mutex mutex_;
};

/**
 * @brief Shared mutex wrapper (reader-writer lock)
 *
 * Schema lookups are frequent, registrations are rare.
 */
class SharedMutex {
public:
    SharedMutex() = default;
    ~SharedMutex() = default;

    // Non-copyable, non-movable
    SharedMutex(const SharedMutex&) = delete;
    SharedMutex& operator=(const SharedMutex&) = delete;

    void lock() { mutex_.lock(); }
    void lock_shared() { mutex_.lock_shared(); }
    bool try_lock() { return mutex_.try_lock(); }
    bool try_lock_shared() { return mutex_.try_lock_shared(); }
    void unlock() { mutex_.unlock(); }
    void unlock_shared() { mutex_.unlock_shared(); }

private:
    std::shared_mutex mutex_;
};

using Lock = std::lock_guard<Mutex>;
using UniqueLock = std::unique_lock<Mutex>;

/// Scoped shared lock - for readers
using SharedLock = std::shared_lock<SharedMutex>;

/// Scoped unique lock - for writers
using UniqueLockShared = std::unique_lock<SharedMutex>;

} // namespace dynrec
