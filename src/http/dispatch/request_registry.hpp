#ifndef TETHER_REQUEST_REGISTRY_HPP
#define TETHER_REQUEST_REGISTRY_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../model/model.hpp"

namespace tether::http::dispatch {
    // Live handle of one transport call. The cancel flag is polled by the transport while the call runs.
    class InFlightRequest {
       public:
        explicit InFlightRequest(std::string identifier) : identifier_(std::move(identifier)) {}

        [[nodiscard]] const std::string& identifier() const { return identifier_; }
        [[nodiscard]] const std::atomic<bool>& cancel_flag() const { return cancelled_; }
        [[nodiscard]] bool is_cancelled() const { return cancelled_.load(); }
        void cancel() { cancelled_.store(true); }

        // True for the first caller only.
        [[nodiscard]] bool claim_delivery() { return !delivered_.exchange(true); }

       private:
        std::string identifier_;
        std::atomic<bool> cancelled_ = false;
        std::atomic<bool> delivered_ = false;
    };

    // Tracks at most one live request per identifier. A later insert for the same identifier replaces the
    // entry; the replaced request keeps running but can no longer be reached through cancel().
    class RequestRegistry {
       public:
        RequestRegistry() = default;

        ~RequestRegistry() = default;
        RequestRegistry(const RequestRegistry&) = delete;
        RequestRegistry& operator=(const RequestRegistry&) = delete;
        RequestRegistry(RequestRegistry&&) = delete;
        RequestRegistry& operator=(RequestRegistry&&) = delete;

        static std::string identifier_for(model::RequestType type, const std::string& url);

        // Returns true when a live entry was superseded.
        bool insert(const std::shared_ptr<InFlightRequest>& request);

        // Returns false (and does nothing) when no live entry exists.
        bool cancel(const std::string& identifier);

        size_t cancel_all();

        // Deregisters `request` if it is still the live entry. Returns false when it was cancelled, in which
        // case its transport result must be discarded. The check and the removal are atomic with cancel().
        bool complete(const std::shared_ptr<InFlightRequest>& request);

        [[nodiscard]] bool contains(const std::string& identifier) const;
        [[nodiscard]] size_t size() const;

       private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<InFlightRequest>> requests_;
    };
}  // namespace tether::http::dispatch

#endif
