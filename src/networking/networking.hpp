#ifndef TETHER_NETWORKING_HPP
#define TETHER_NETWORKING_HPP

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../http/cache/disk_store.hpp"
#include "../http/client/interface.hpp"
#include "../http/decoding/objects.hpp"
#include "../http/dispatch/dispatcher.hpp"
#include "../http/error/http_error.hpp"
#include "../http/model/model.hpp"
#include "../http/model/value.hpp"

namespace tether::networking {
    using http::model::CachingLevel;
    using http::model::FormDataPart;
    using http::model::ParameterType;
    using http::model::Value;

    template <typename T>
    struct Result {
        std::shared_ptr<const T> value_;
        std::optional<http::http_error::HttpError> error_;
        http::model::Response response_;
        bool from_cache_ = false;

        [[nodiscard]] bool ok() const { return !error_.has_value(); }
        [[nodiscard]] bool cancelled() const { return error_.has_value() && error_->is_cancelled(); }
    };

    using JsonResult = Result<http::decoding::JsonDocument>;
    using ImageResult = Result<http::decoding::Image>;
    using DataResult = Result<http::decoding::Data>;

    using JsonCompletion = std::function<void(JsonResult)>;
    using ImageCompletion = std::function<void(ImageResult)>;
    using DataCompletion = std::function<void(DataResult)>;

    struct NetworkingOptions {
        std::string base_url_;
        std::filesystem::path cache_directory_;
        size_t io_threads_ = 4;
        std::vector<std::string> header_fields_;
        std::string log_level_ = "info";
    };

    // Client instance. Owns its cache tiers, request registry and worker threads; destroying it cancels
    // whatever is still in flight and waits for those completions to be delivered.
    // Every method that returns a request identifier also delivers exactly one result to its completion,
    // asynchronously, on a single callback thread shared by all requests of this instance.
    class Networking {
       public:
        Networking(NetworkingOptions options, http::client::HttpClientFactory http_client_factory, std::unique_ptr<http::cache::IDiskStore> disk_store);

        ~Networking() = default;
        Networking(const Networking&) = delete;
        Networking& operator=(const Networking&) = delete;
        Networking(Networking&&) = delete;
        Networking& operator=(Networking&&) = delete;

        // GET and DELETE send their parameters percent-encoded in the query string.
        std::string get(const std::string& path, std::optional<Value> parameters, CachingLevel caching_level, JsonCompletion completion);
        std::string get(const std::string& path, JsonCompletion completion);
        bool cancel_get(const std::string& path);

        std::string post(const std::string& path, ParameterType parameter_type, std::optional<Value> parameters, JsonCompletion completion);
        // Always multipart/form-data.
        std::string post(const std::string& path, std::optional<Value> parameters, std::vector<FormDataPart> parts, JsonCompletion completion);
        bool cancel_post(const std::string& path);

        std::string put(const std::string& path, ParameterType parameter_type, std::optional<Value> parameters, JsonCompletion completion);
        bool cancel_put(const std::string& path);

        std::string patch(const std::string& path, ParameterType parameter_type, std::optional<Value> parameters, JsonCompletion completion);
        bool cancel_patch(const std::string& path);

        std::string del(const std::string& path, std::optional<Value> parameters, JsonCompletion completion);
        bool cancel_delete(const std::string& path);

        // Sends `body` verbatim with the given content type.
        std::string send(http::model::RequestType type, const std::string& path, const std::string& content_type, std::string body, JsonCompletion completion);

        std::string download_image(const std::string& path, std::optional<std::string> cache_name, CachingLevel caching_level, ImageCompletion completion);
        std::string download_image(const std::string& path, ImageCompletion completion);
        bool cancel_image_download(const std::string& path);

        std::string download_data(const std::string& path, std::optional<std::string> cache_name, CachingLevel caching_level, DataCompletion completion);
        std::string download_data(const std::string& path, DataCompletion completion);
        bool cancel_data_download(const std::string& path);

        // Cache-only lookups; they never touch the network.
        [[nodiscard]] http::decoding::ImagePtr image_from_cache(const std::string& path, const std::optional<std::string>& cache_name = std::nullopt);
        [[nodiscard]] http::decoding::DataPtr data_from_cache(const std::string& path, const std::optional<std::string>& cache_name = std::nullopt);
        [[nodiscard]] http::decoding::JsonPtr json_from_cache(const std::string& path, const std::optional<std::string>& cache_name = std::nullopt);

        size_t cancel_all_requests();
        void destroy_cache();
        void wait_all();

        [[nodiscard]] const NetworkingOptions& options() const { return options_; }
        [[nodiscard]] http::dispatch::Dispatcher& dispatcher() { return *dispatcher_; }

       private:
        NetworkingOptions options_;
        std::unique_ptr<http::dispatch::Dispatcher> dispatcher_;

        std::string request_json(http::dispatch::DispatchRequest request, JsonCompletion completion);
    };

    class NetworkingBuilder {
       public:
        NetworkingBuilder();

        NetworkingBuilder& with_base_url(std::string base_url);
        NetworkingBuilder& with_cache_directory(std::filesystem::path cache_directory);
        NetworkingBuilder& with_io_threads(size_t io_threads);
        NetworkingBuilder& with_header_fields(std::vector<std::string> header_fields);
        NetworkingBuilder& with_log_level(std::string log_level);
        NetworkingBuilder& with_http_client_factory(http::client::HttpClientFactory http_client_factory);
        NetworkingBuilder& with_disk_store(std::unique_ptr<http::cache::IDiskStore> disk_store);
        NetworkingBuilder& validate();
        std::unique_ptr<Networking> build();

       private:
        NetworkingOptions options_;
        http::client::HttpClientFactory http_client_factory_;
        std::unique_ptr<http::cache::IDiskStore> disk_store_;
    };
}  // namespace tether::networking

#endif
