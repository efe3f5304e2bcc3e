#ifndef TETHER_OBJECT_CACHE_HPP
#define TETHER_OBJECT_CACHE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "../decoding/objects.hpp"
#include "../model/model.hpp"
#include "disk_store.hpp"

namespace tether::http::cache {
    // Two-tier store of decoded response objects. Memory is tier 1, the disk store tier 2.
    // Entries are keyed by (response type, cache name) so an image and a JSON document never alias.
    // Disk failures are logged and read as misses; they never reach the caller.
    class ObjectCache {
       public:
        explicit ObjectCache(std::unique_ptr<IDiskStore> disk_store);

        ~ObjectCache() = default;
        ObjectCache(const ObjectCache&) = delete;
        ObjectCache& operator=(const ObjectCache&) = delete;
        ObjectCache(ObjectCache&&) = delete;
        ObjectCache& operator=(ObjectCache&&) = delete;

        // MEMORY checks tier 1 only; MEMORY_AND_FILE falls back to tier 2 and promotes the hit into tier 1.
        [[nodiscard]] std::optional<decoding::Object> get(const std::string& cache_name, model::ResponseType type,
                                                          model::CachingLevel level = model::CachingLevel::MEMORY_AND_FILE);
        void put(const std::string& cache_name, const decoding::Object& object, model::CachingLevel level);
        void invalidate(const std::string& cache_name);

        void clear_memory();
        void clear();

        [[nodiscard]] size_t memory_size() const;

        static std::string disk_key(const std::string& cache_name, model::ResponseType type);

       private:
        using Key = std::pair<model::ResponseType, std::string>;

        mutable std::mutex memory_mutex_;
        std::map<Key, decoding::Object> memory_;

        // serializes tier-2 access; never held together with memory_mutex_
        std::mutex disk_mutex_;
        std::unique_ptr<IDiskStore> disk_store_;

        std::optional<decoding::Object> get_from_disk(const std::string& cache_name, model::ResponseType type);
    };
}  // namespace tether::http::cache

#endif
