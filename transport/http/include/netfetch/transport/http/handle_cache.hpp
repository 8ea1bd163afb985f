#pragma once

/**
 * @file handle_cache.hpp
 * @brief Per-thread cache of expensive transport handles
 *
 * Each thread owns at most one cached handle. acquire() leases it for the
 * duration of one transfer and resets it first, so no per-call
 * configuration from the previous transfer survives. A nested acquire() on
 * a thread whose handle is already leased gets a fresh temporary handle
 * that is destroyed with its lease. A handle is never used by two transfers
 * at once.
 *
 * A thread's cached handle is destroyed when that thread exits.
 *
 * The cache must outlive every lease it hands out.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace netfetch::transport::http {

template<class T, class Deleter = std::default_delete<T>>
class HandleCache {
public:
    using pointer = std::unique_ptr<T, Deleter>;
    using Factory = std::function<pointer()>;
    using Reset   = std::function<void(T*)>;

    /**
     * @brief Leased handle; returns a cached handle to the cache on destruction
     */
    class Lease {
    public:
        Lease() = default;

        Lease(Lease&& other) noexcept
            : cache_(std::exchange(other.cache_, nullptr))
            , owner_(other.owner_)
            , handle_(std::move(other.handle_)) {}

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                cache_  = std::exchange(other.cache_, nullptr);
                owner_  = other.owner_;
                handle_ = std::move(other.handle_);
            }
            return *this;
        }

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() { release(); }

        T* get() const noexcept { return handle_.get(); }
        explicit operator bool() const noexcept { return handle_ != nullptr; }

        /// True when the handle belongs to the cache rather than this lease
        bool is_cached() const noexcept { return cache_ != nullptr; }

    private:
        friend class HandleCache;

        Lease(HandleCache* cache, std::thread::id owner, pointer handle)
            : cache_(cache), owner_(owner), handle_(std::move(handle)) {}

        void release() noexcept {
            if (cache_) {
                cache_->give_back(owner_, std::move(handle_));
            }
            cache_ = nullptr;
            handle_.reset();
        }

        HandleCache* cache_ = nullptr;
        std::thread::id owner_;
        pointer handle_;
    };

    explicit HandleCache(Factory factory, Reset reset = {})
        : factory_(std::move(factory))
        , reset_(std::move(reset))
        , table_(std::make_shared<SlotTable>()) {}

    HandleCache(const HandleCache&)            = delete;
    HandleCache& operator=(const HandleCache&) = delete;

    /**
     * @brief Lease the calling thread's handle, creating it on first use
     *
     * The lease is empty when the factory fails.
     */
    Lease acquire() {
        const auto id = std::this_thread::get_id();
        pointer handle;
        bool cached = false;
        bool inserted = false;
        {
            std::lock_guard<std::mutex> lock(table_->mutex);
            auto [it, fresh] = table_->slots.try_emplace(id);
            inserted         = fresh;
            if (!it->second.leased) {
                it->second.leased = true;
                handle            = std::move(it->second.handle);
                cached            = true;
            }
        }
        if (inserted) {
            register_thread_exit(table_);
        }

        if (!handle) {
            handle = factory_();
            if (!handle) {
                if (cached) {
                    std::lock_guard<std::mutex> lock(table_->mutex);
                    table_->slots[id].leased = false;
                }
                return Lease();
            }
        } else if (reset_) {
            reset_(handle.get());
        }

        return Lease(cached ? this : nullptr, id, std::move(handle));
    }

    /**
     * @brief Number of threads holding a cached handle (leased or idle)
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(table_->mutex);
        size_t count = 0;
        for (const auto& [id, slot] : table_->slots) {
            if (slot.handle || slot.leased) {
                ++count;
            }
        }
        return count;
    }

    /**
     * @brief Destroy every idle handle
     */
    void clear() {
        std::lock_guard<std::mutex> lock(table_->mutex);
        for (auto it = table_->slots.begin(); it != table_->slots.end();) {
            if (!it->second.leased) {
                it = table_->slots.erase(it);
            } else {
                ++it;
            }
        }
    }

private:
    struct Slot {
        pointer handle;
        bool leased = false;
    };

    /// Shared with the exit hooks of every thread that holds a slot
    struct SlotTable {
        std::mutex mutex;
        std::unordered_map<std::thread::id, Slot> slots;
    };

    /**
     * @brief Drops the exiting thread's slot from every live cache it used
     */
    struct ThreadExitHooks {
        std::vector<std::weak_ptr<SlotTable>> tables;

        ~ThreadExitHooks() {
            const auto id = std::this_thread::get_id();
            for (auto& weak : tables) {
                auto table = weak.lock();
                if (!table) {
                    continue;
                }
                pointer dropped;
                {
                    std::lock_guard<std::mutex> lock(table->mutex);
                    auto it = table->slots.find(id);
                    if (it == table->slots.end()) {
                        continue;
                    }
                    dropped = std::move(it->second.handle);
                    table->slots.erase(it);
                }
                // dropped is destroyed here, outside the lock
            }
        }
    };

    static void register_thread_exit(const std::shared_ptr<SlotTable>& table) {
        thread_local ThreadExitHooks hooks;
        auto& tables = hooks.tables;
        for (auto it = tables.begin(); it != tables.end();) {
            if (it->expired()) {
                it = tables.erase(it);
            } else if (it->lock() == table) {
                return;
            } else {
                ++it;
            }
        }
        tables.push_back(table);
    }

    void give_back(std::thread::id owner, pointer handle) noexcept {
        std::lock_guard<std::mutex> lock(table_->mutex);
        auto it = table_->slots.find(owner);
        if (it != table_->slots.end()) {
            it->second.handle = std::move(handle);
            it->second.leased = false;
        }
    }

    Factory factory_;
    Reset reset_;
    std::shared_ptr<SlotTable> table_;
};

}  // namespace netfetch::transport::http
