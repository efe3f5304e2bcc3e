#ifndef TETHER_DISK_STORE_HPP
#define TETHER_DISK_STORE_HPP

#include <optional>
#include <string>

namespace tether::http::cache {
    // Backing store for the second cache tier. Implementations may throw on I/O failure.
    class IDiskStore {
       public:
        IDiskStore() = default;
        virtual ~IDiskStore() = default;
        IDiskStore(const IDiskStore&) = delete;
        IDiskStore& operator=(const IDiskStore&) = delete;
        IDiskStore(IDiskStore&&) = delete;
        IDiskStore& operator=(IDiskStore&&) = delete;

        [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
        virtual void put(const std::string& key, const std::string& bytes) = 0;
        virtual void remove(const std::string& key) = 0;
        virtual void clear() = 0;
    };
}  // namespace tether::http::cache

#endif
