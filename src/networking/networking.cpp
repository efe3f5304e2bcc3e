#include "networking.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../http/cache/file_disk_store.hpp"
#include "../http/cache/object_cache.hpp"
#include "../http/client/curl_easy.hpp"
#include "../http/client/curl_global.hpp"
#include "../http/url/url.hpp"
#include "../utils/logging.hpp"

namespace tether::networking {
    namespace {
        constexpr const char* DEFAULT_CACHE_DIRECTORY_NAME = "tether";

        template <typename T>
        Result<T> to_result(http::dispatch::DispatchResult&& dispatched) {
            Result<T> result;
            result.response_ = std::move(dispatched.response_);
            result.from_cache_ = dispatched.from_cache_;
            result.error_ = std::move(dispatched.error_);

            if (dispatched.object_) {
                if (const auto* value = std::get_if<std::shared_ptr<const T>>(&*dispatched.object_)) {
                    result.value_ = *value;
                } else {
                    result.error_ = http::http_error::HttpError(http::http_error::ErrorKind::DECODING, result.response_.effective_url_,
                                                                "Decoded object does not match the requested response type");
                }
            }

            return result;
        }

        template <typename T>
        http::dispatch::Completion adapt(std::function<void(Result<T>)> completion) {
            return [completion = std::move(completion)](http::dispatch::DispatchResult dispatched) { completion(to_result<T>(std::move(dispatched))); };
        }

        template <typename T>
        std::shared_ptr<const T> object_as(const std::optional<http::decoding::Object>& object) {
            if (!object) {
                return nullptr;
            }
            const auto* value = std::get_if<std::shared_ptr<const T>>(&*object);
            return value != nullptr ? *value : nullptr;
        }
    }  // namespace

    //
    // Networking implementation
    //

    Networking::Networking(NetworkingOptions options, http::client::HttpClientFactory http_client_factory,
                           std::unique_ptr<http::cache::IDiskStore> disk_store)
        : options_(std::move(options)) {
        auto object_cache = std::make_unique<http::cache::ObjectCache>(std::move(disk_store));

        dispatcher_ = std::make_unique<http::dispatch::Dispatcher>(
            http::dispatch::DispatcherOptions{
                .base_url_ = options_.base_url_,
                .header_fields_ = options_.header_fields_,
                .io_threads_ = options_.io_threads_,
            },
            std::move(http_client_factory), std::move(object_cache));
    }

    std::string Networking::request_json(http::dispatch::DispatchRequest request, JsonCompletion completion) {
        request.response_type_ = http::model::ResponseType::JSON;
        return dispatcher_->dispatch(std::move(request), adapt<http::decoding::JsonDocument>(std::move(completion)));
    }

    std::string Networking::get(const std::string& path, std::optional<Value> parameters, CachingLevel caching_level, JsonCompletion completion) {
        const ParameterType parameter_type = parameters ? ParameterType::FORM_URL_ENCODED : ParameterType::NONE;

        return request_json(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::GET,
                .path_ = path,
                .parameter_type_ = parameter_type,
                .parameters_ = std::move(parameters),
                .caching_level_ = caching_level,
            },
            std::move(completion));
    }

    std::string Networking::get(const std::string& path, JsonCompletion completion) { return get(path, std::nullopt, CachingLevel::NONE, std::move(completion)); }

    bool Networking::cancel_get(const std::string& path) { return dispatcher_->cancel(http::model::RequestType::GET, path); }

    std::string Networking::post(const std::string& path, ParameterType parameter_type, std::optional<Value> parameters, JsonCompletion completion) {
        return request_json(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::POST,
                .path_ = path,
                .parameter_type_ = parameter_type,
                .parameters_ = std::move(parameters),
            },
            std::move(completion));
    }

    std::string Networking::post(const std::string& path, std::optional<Value> parameters, std::vector<FormDataPart> parts, JsonCompletion completion) {
        return request_json(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::POST,
                .path_ = path,
                .parameter_type_ = ParameterType::MULTIPART_FORM_DATA,
                .parameters_ = std::move(parameters),
                .parts_ = std::move(parts),
            },
            std::move(completion));
    }

    bool Networking::cancel_post(const std::string& path) { return dispatcher_->cancel(http::model::RequestType::POST, path); }

    std::string Networking::put(const std::string& path, ParameterType parameter_type, std::optional<Value> parameters, JsonCompletion completion) {
        return request_json(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::PUT,
                .path_ = path,
                .parameter_type_ = parameter_type,
                .parameters_ = std::move(parameters),
            },
            std::move(completion));
    }

    bool Networking::cancel_put(const std::string& path) { return dispatcher_->cancel(http::model::RequestType::PUT, path); }

    std::string Networking::patch(const std::string& path, ParameterType parameter_type, std::optional<Value> parameters, JsonCompletion completion) {
        return request_json(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::PATCH,
                .path_ = path,
                .parameter_type_ = parameter_type,
                .parameters_ = std::move(parameters),
            },
            std::move(completion));
    }

    bool Networking::cancel_patch(const std::string& path) { return dispatcher_->cancel(http::model::RequestType::PATCH, path); }

    std::string Networking::del(const std::string& path, std::optional<Value> parameters, JsonCompletion completion) {
        const ParameterType parameter_type = parameters ? ParameterType::FORM_URL_ENCODED : ParameterType::NONE;

        return request_json(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::DELETE,
                .path_ = path,
                .parameter_type_ = parameter_type,
                .parameters_ = std::move(parameters),
            },
            std::move(completion));
    }

    bool Networking::cancel_delete(const std::string& path) { return dispatcher_->cancel(http::model::RequestType::DELETE, path); }

    std::string Networking::send(http::model::RequestType type, const std::string& path, const std::string& content_type, std::string body,
                                 JsonCompletion completion) {
        return request_json(
            http::dispatch::DispatchRequest{
                .type_ = type,
                .path_ = path,
                .parameter_type_ = ParameterType::CUSTOM,
                .custom_content_type_ = content_type,
                .parameters_ = Value(std::move(body)),
            },
            std::move(completion));
    }

    std::string Networking::download_image(const std::string& path, std::optional<std::string> cache_name, CachingLevel caching_level,
                                           ImageCompletion completion) {
        return dispatcher_->dispatch(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::GET,
                .path_ = path,
                .cache_name_ = std::move(cache_name),
                .response_type_ = http::model::ResponseType::IMAGE,
                .caching_level_ = caching_level,
            },
            adapt<http::decoding::Image>(std::move(completion)));
    }

    std::string Networking::download_image(const std::string& path, ImageCompletion completion) {
        return download_image(path, std::nullopt, CachingLevel::MEMORY_AND_FILE, std::move(completion));
    }

    bool Networking::cancel_image_download(const std::string& path) { return dispatcher_->cancel(http::model::RequestType::GET, path); }

    std::string Networking::download_data(const std::string& path, std::optional<std::string> cache_name, CachingLevel caching_level,
                                          DataCompletion completion) {
        return dispatcher_->dispatch(
            http::dispatch::DispatchRequest{
                .type_ = http::model::RequestType::GET,
                .path_ = path,
                .cache_name_ = std::move(cache_name),
                .response_type_ = http::model::ResponseType::DATA,
                .caching_level_ = caching_level,
            },
            adapt<http::decoding::Data>(std::move(completion)));
    }

    std::string Networking::download_data(const std::string& path, DataCompletion completion) {
        return download_data(path, std::nullopt, CachingLevel::MEMORY_AND_FILE, std::move(completion));
    }

    bool Networking::cancel_data_download(const std::string& path) { return dispatcher_->cancel(http::model::RequestType::GET, path); }

    http::decoding::ImagePtr Networking::image_from_cache(const std::string& path, const std::optional<std::string>& cache_name) {
        return object_as<http::decoding::Image>(
            dispatcher_->object_from_cache(path, cache_name, http::model::ResponseType::IMAGE, CachingLevel::MEMORY_AND_FILE));
    }

    http::decoding::DataPtr Networking::data_from_cache(const std::string& path, const std::optional<std::string>& cache_name) {
        return object_as<http::decoding::Data>(dispatcher_->object_from_cache(path, cache_name, http::model::ResponseType::DATA, CachingLevel::MEMORY_AND_FILE));
    }

    http::decoding::JsonPtr Networking::json_from_cache(const std::string& path, const std::optional<std::string>& cache_name) {
        return object_as<http::decoding::JsonDocument>(
            dispatcher_->object_from_cache(path, cache_name, http::model::ResponseType::JSON, CachingLevel::MEMORY_AND_FILE));
    }

    size_t Networking::cancel_all_requests() { return dispatcher_->cancel_all(); }

    void Networking::destroy_cache() { dispatcher_->cache().clear(); }

    void Networking::wait_all() { dispatcher_->wait_all(); }

    //
    // NetworkingBuilder implementation
    //

    NetworkingBuilder::NetworkingBuilder() { options_.cache_directory_ = std::filesystem::temp_directory_path() / DEFAULT_CACHE_DIRECTORY_NAME; }

    NetworkingBuilder& NetworkingBuilder::with_base_url(std::string base_url) {
        options_.base_url_ = std::move(base_url);
        return *this;
    }

    NetworkingBuilder& NetworkingBuilder::with_cache_directory(std::filesystem::path cache_directory) {
        options_.cache_directory_ = std::move(cache_directory);
        return *this;
    }

    NetworkingBuilder& NetworkingBuilder::with_io_threads(size_t io_threads) {
        options_.io_threads_ = io_threads;
        return *this;
    }

    NetworkingBuilder& NetworkingBuilder::with_header_fields(std::vector<std::string> header_fields) {
        options_.header_fields_ = std::move(header_fields);
        return *this;
    }

    NetworkingBuilder& NetworkingBuilder::with_log_level(std::string log_level) {
        options_.log_level_ = std::move(log_level);
        return *this;
    }

    NetworkingBuilder& NetworkingBuilder::with_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        http_client_factory_ = std::move(http_client_factory);
        return *this;
    }

    NetworkingBuilder& NetworkingBuilder::with_disk_store(std::unique_ptr<http::cache::IDiskStore> disk_store) {
        disk_store_ = std::move(disk_store);
        return *this;
    }

    NetworkingBuilder& NetworkingBuilder::validate() {
        if (options_.base_url_.empty()) {
            throw std::runtime_error("Base URL is required");
        }
        if (!http::url::is_valid(options_.base_url_)) {
            throw std::runtime_error("Base URL is not a valid http(s) URL: " + options_.base_url_);
        }
        if (options_.io_threads_ == 0) {
            throw std::runtime_error("IO threads are required");
        }
        if (disk_store_ == nullptr && options_.cache_directory_.empty()) {
            throw std::runtime_error("Cache directory or disk store is required");
        }
        if (!logging::is_known_level(options_.log_level_)) {
            throw std::runtime_error("Unknown log level: " + options_.log_level_);
        }
        return *this;
    }

    std::unique_ptr<Networking> NetworkingBuilder::build() {
        logging::set_level(options_.log_level_);

        if (http_client_factory_ == nullptr) {
            // libcurl stays initialised while the factory exists.
            auto curl_global = std::make_shared<http::client::CurlGlobal>();
            http_client_factory_ = [curl_global]() { return std::make_unique<http::client::CurlEasy>(); };
        }
        if (disk_store_ == nullptr) {
            disk_store_ = std::make_unique<http::cache::FileDiskStore>(options_.cache_directory_);
        }

        logging::logger()->debug("Networking for {} with {} IO thread(s), disk cache at {}", options_.base_url_, options_.io_threads_,
                                 options_.cache_directory_.string());
        return std::make_unique<Networking>(options_, std::move(http_client_factory_), std::move(disk_store_));
    }
}  // namespace tether::networking
