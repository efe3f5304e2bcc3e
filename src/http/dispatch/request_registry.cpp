#include "request_registry.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace tether::http::dispatch {
    std::string RequestRegistry::identifier_for(model::RequestType type, const std::string& url) { return std::string(model::to_string(type)) + " " + url; }

    bool RequestRegistry::insert(const std::shared_ptr<InFlightRequest>& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        return !requests_.insert_or_assign(request->identifier(), request).second;
    }

    bool RequestRegistry::cancel(const std::string& identifier) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = requests_.find(identifier);
        if (it == requests_.end()) {
            return false;
        }

        it->second->cancel();
        requests_.erase(it);
        return true;
    }

    size_t RequestRegistry::cancel_all() {
        std::lock_guard<std::mutex> lock(mutex_);

        const size_t count = requests_.size();
        for (auto& [identifier, request] : requests_) {
            request->cancel();
        }
        requests_.clear();
        return count;
    }

    bool RequestRegistry::complete(const std::shared_ptr<InFlightRequest>& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = requests_.find(request->identifier());
        if (it != requests_.end() && it->second == request) {
            requests_.erase(it);
        }

        return !request->is_cancelled();
    }

    bool RequestRegistry::contains(const std::string& identifier) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.find(identifier) != requests_.end();
    }

    size_t RequestRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }
}  // namespace tether::http::dispatch
