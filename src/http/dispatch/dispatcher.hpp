#ifndef TETHER_DISPATCHER_HPP
#define TETHER_DISPATCHER_HPP

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../utils/thread_pool.hpp"
#include "../cache/object_cache.hpp"
#include "../client/interface.hpp"
#include "../decoding/objects.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "../model/value.hpp"
#include "request_registry.hpp"

namespace tether::http::dispatch {
    struct DispatcherOptions {
        std::string base_url_;
        std::vector<std::string> header_fields_;
        size_t io_threads_ = 4;
    };

    struct DispatchRequest {
        model::RequestType type_ = model::RequestType::GET;
        std::string path_;
        std::optional<std::string> cache_name_;
        model::ParameterType parameter_type_ = model::ParameterType::NONE;
        std::string custom_content_type_;
        std::optional<model::Value> parameters_;
        std::vector<model::FormDataPart> parts_;
        model::ResponseType response_type_ = model::ResponseType::JSON;
        model::CachingLevel caching_level_ = model::CachingLevel::NONE;
    };

    // Exactly one of object_ and error_ is set.
    struct DispatchResult {
        std::optional<decoding::Object> object_;
        std::optional<http_error::HttpError> error_;
        model::Response response_;
        bool from_cache_ = false;
    };

    using Completion = std::function<void(DispatchResult)>;

    class Dispatcher {
       public:
        Dispatcher(DispatcherOptions options, client::HttpClientFactory http_client_factory, std::unique_ptr<cache::ObjectCache> cache);

        ~Dispatcher();
        Dispatcher(const Dispatcher&) = delete;
        Dispatcher& operator=(const Dispatcher&) = delete;
        Dispatcher(Dispatcher&&) = delete;
        Dispatcher& operator=(Dispatcher&&) = delete;

        // Serves from cache or starts a transport call. `completion` runs exactly once, on the callback thread.
        std::string dispatch(DispatchRequest request, Completion completion);

        bool cancel(model::RequestType type, const std::string& path);
        size_t cancel_all();

        [[nodiscard]] std::optional<decoding::Object> object_from_cache(const std::string& path, const std::optional<std::string>& cache_name,
                                                                        model::ResponseType response_type, model::CachingLevel level);

        // Blocks until every dispatched request has delivered its completion. Must not be called from a completion.
        void wait_all();

        [[nodiscard]] cache::ObjectCache& cache() { return *cache_; }
        [[nodiscard]] const RequestRegistry& registry() const { return registry_; }
        [[nodiscard]] const DispatcherOptions& options() const { return options_; }

        static model::ParameterType effective_parameter_type(const DispatchRequest& request);

       private:
        struct Execution {
            std::shared_ptr<InFlightRequest> in_flight_;
            model::Request request_;
            std::string cache_name_;
            model::ResponseType response_type_;
            model::CachingLevel caching_level_;
        };

        void execute(const Execution& execution, Completion& completion);
        void deliver(Completion completion, DispatchResult result);
        void deliver_failure(Completion completion, const http_error::HttpError& error);
        [[nodiscard]] std::vector<std::string> headers_for(const std::string& content_type, model::ResponseType response_type) const;

        DispatcherOptions options_;
        client::HttpClientFactory http_client_factory_;
        std::unique_ptr<cache::ObjectCache> cache_;
        RequestRegistry registry_;

        // io_pool_ is destroyed first: its tasks post into callback_queue_.
        concurrency::ThreadPool callback_queue_;
        concurrency::ThreadPool io_pool_;
    };
}  // namespace tether::http::dispatch

#endif
