#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>

// One mutex per key, created on first use and dropped once nobody holds or
// waits on it. Holding the returned lock serializes work on that key without
// blocking other keys.
class KeyedMutex {
public:
    class Lock {
    public:
        Lock(KeyedMutex& owner, std::string key, std::shared_ptr<std::mutex> m)
            : owner_(owner), key_(std::move(key)), mutex_(std::move(m)), lock_(*mutex_) {}

        ~Lock() {
            lock_.unlock();
            mutex_.reset();
            owner_.release(key_);
        }

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        KeyedMutex& owner_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    Lock acquire(const std::string& key) {
        std::shared_ptr<std::mutex> m;
        {
            std::lock_guard<std::mutex> lock(map_mutex_);
            auto& slot = mutexes_[key];
            if (!slot) slot = std::make_shared<std::mutex>();
            m = slot;
        }
        return Lock(*this, key, std::move(m));
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(map_mutex_);
        return mutexes_.size();
    }

private:
    mutable std::mutex map_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> mutexes_;

    // Copies are only taken under map_mutex_, so a count of one means idle
    void release(const std::string& key) {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = mutexes_.find(key);
        if (it != mutexes_.end() && it->second.use_count() == 1) {
            mutexes_.erase(it);
        }
    }
};
