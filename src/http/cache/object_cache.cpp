#include "object_cache.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../../utils/logging.hpp"
#include "../decoding/decoders.hpp"

namespace tether::http::cache {
    ObjectCache::ObjectCache(std::unique_ptr<IDiskStore> disk_store) : disk_store_(std::move(disk_store)) {}

    std::string ObjectCache::disk_key(const std::string& cache_name, model::ResponseType type) {
        return std::string(model::to_string(type)) + ":" + cache_name;
    }

    std::optional<decoding::Object> ObjectCache::get(const std::string& cache_name, model::ResponseType type, model::CachingLevel level) {
        if (level == model::CachingLevel::NONE) {
            return std::nullopt;
        }

        {
            std::lock_guard<std::mutex> lock(memory_mutex_);
            auto it = memory_.find(Key{type, cache_name});
            if (it != memory_.end()) {
                return it->second;
            }
        }

        if (level != model::CachingLevel::MEMORY_AND_FILE) {
            return std::nullopt;
        }

        auto object = get_from_disk(cache_name, type);
        if (!object) {
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(memory_mutex_);
        // a concurrent put may have landed first; keep the newer object
        return memory_.try_emplace(Key{type, cache_name}, *object).first->second;
    }

    std::optional<decoding::Object> ObjectCache::get_from_disk(const std::string& cache_name, model::ResponseType type) {
        if (disk_store_ == nullptr) {
            return std::nullopt;
        }

        const auto key = disk_key(cache_name, type);
        std::optional<std::string> bytes;

        try {
            std::lock_guard<std::mutex> lock(disk_mutex_);
            bytes = disk_store_->get(key);
        } catch (const std::exception& e) {
            logging::logger()->warn("Disk cache read failed for '{}', treating as miss: {}", key, e.what());
            return std::nullopt;
        }

        if (!bytes) {
            return std::nullopt;
        }

        try {
            return decoding::decode(type, std::move(*bytes));
        } catch (const std::exception& e) {
            logging::logger()->warn("Dropping undecodable disk cache entry '{}': {}", key, e.what());
        }

        try {
            std::lock_guard<std::mutex> lock(disk_mutex_);
            disk_store_->remove(key);
        } catch (const std::exception& e) {
            logging::logger()->warn("Disk cache remove failed for '{}': {}", key, e.what());
        }
        return std::nullopt;
    }

    void ObjectCache::put(const std::string& cache_name, const decoding::Object& object, model::CachingLevel level) {
        if (level == model::CachingLevel::NONE) {
            return;
        }

        const auto type = decoding::response_type_of(object);

        {
            std::lock_guard<std::mutex> lock(memory_mutex_);
            memory_.insert_or_assign(Key{type, cache_name}, object);
        }

        if (level != model::CachingLevel::MEMORY_AND_FILE || disk_store_ == nullptr) {
            return;
        }

        const auto key = disk_key(cache_name, type);
        try {
            std::lock_guard<std::mutex> lock(disk_mutex_);
            disk_store_->put(key, decoding::encode_for_disk(object));
        } catch (const std::exception& e) {
            logging::logger()->warn("Disk cache write failed for '{}', keeping memory copy only: {}", key, e.what());
        }
    }

    void ObjectCache::invalidate(const std::string& cache_name) {
        static constexpr model::ResponseType ALL_TYPES[] = {model::ResponseType::JSON, model::ResponseType::IMAGE, model::ResponseType::DATA};

        {
            std::lock_guard<std::mutex> lock(memory_mutex_);
            for (const auto type : ALL_TYPES) {
                memory_.erase(Key{type, cache_name});
            }
        }

        if (disk_store_ == nullptr) {
            return;
        }

        for (const auto type : ALL_TYPES) {
            const auto key = disk_key(cache_name, type);
            try {
                std::lock_guard<std::mutex> lock(disk_mutex_);
                disk_store_->remove(key);
            } catch (const std::exception& e) {
                logging::logger()->warn("Disk cache remove failed for '{}': {}", key, e.what());
            }
        }
    }

    void ObjectCache::clear_memory() {
        std::lock_guard<std::mutex> lock(memory_mutex_);
        memory_.clear();
    }

    void ObjectCache::clear() {
        clear_memory();

        if (disk_store_ == nullptr) {
            return;
        }

        try {
            std::lock_guard<std::mutex> lock(disk_mutex_);
            disk_store_->clear();
        } catch (const std::exception& e) {
            logging::logger()->warn("Disk cache clear failed: {}", e.what());
        }
    }

    size_t ObjectCache::memory_size() const {
        std::lock_guard<std::mutex> lock(memory_mutex_);
        return memory_.size();
    }
}  // namespace tether::http::cache
