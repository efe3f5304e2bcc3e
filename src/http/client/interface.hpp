#ifndef TETHER_CLIENT_INTERFACE_HPP
#define TETHER_CLIENT_INTERFACE_HPP

#include <atomic>
#include <functional>
#include <memory>

#include "../model/model.hpp"

namespace tether::http::client {
    // One request at a time; callers obtain a fresh client per request from an HttpClientFactory.
    // perform() returns any HTTP status as a Response and throws HttpError for transport failures.
    // Raising `cancelled` aborts the transfer with HttpError(CANCELLED).
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response perform(const http::model::Request& req, const std::atomic<bool>& cancelled) = 0;
    };

    using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;
}  // namespace tether::http::client

#endif
