#include "dispatcher.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../decoding/decoders.hpp"
#include "../encoding/parameter_encoder.hpp"
#include "../url/url.hpp"

namespace tether::http::dispatch {
    namespace {
        constexpr size_t CALLBACK_THREADS = 1;

        struct HeaderLines {
            static constexpr const char* CONTENT_TYPE = "Content-Type: ";
            static constexpr const char* ACCEPT_JSON = "Accept: application/json";
        };

        bool is_success(long status) { return status >= constants::HTTP_SUCCESS_LOWER_BOUNDARY && status < constants::HTTP_SUCCESS_UPPER_BOUNDARY; }
    }  // namespace

    Dispatcher::Dispatcher(DispatcherOptions options, client::HttpClientFactory http_client_factory, std::unique_ptr<cache::ObjectCache> cache)
        : options_(std::move(options)),
          http_client_factory_(std::move(http_client_factory)),
          cache_(std::move(cache)),
          callback_queue_(CALLBACK_THREADS),
          io_pool_(options_.io_threads_) {
        if (http_client_factory_ == nullptr) {
            throw std::invalid_argument("Dispatcher requires an HTTP client factory");
        }
        if (cache_ == nullptr) {
            throw std::invalid_argument("Dispatcher requires an object cache");
        }
        if (options_.io_threads_ == 0) {
            throw std::invalid_argument("Dispatcher requires at least one IO thread");
        }
    }

    Dispatcher::~Dispatcher() {
        const size_t cancelled = registry_.cancel_all();
        if (cancelled > 0) {
            logging::logger()->debug("Cancelled {} in-flight request(s) on shutdown", cancelled);
        }
    }

    model::ParameterType Dispatcher::effective_parameter_type(const DispatchRequest& request) {
        if (!request.parts_.empty()) {
            return model::ParameterType::MULTIPART_FORM_DATA;
        }

        const bool is_query_verb = request.type_ == model::RequestType::GET || request.type_ == model::RequestType::DELETE;
        if (is_query_verb && !request.parameters_) {
            return model::ParameterType::NONE;
        }

        return request.parameter_type_;
    }

    std::string Dispatcher::dispatch(DispatchRequest request, Completion completion) {
        const std::string cache_name = request.cache_name_.value_or(request.path_);

        std::string composed;
        try {
            composed = url::compose(options_.base_url_, request.path_);
        } catch (const http_error::HttpError& e) {
            logging::logger()->warn("{} {}: {}", model::to_string(request.type_), request.path_, e.what());
            deliver_failure(std::move(completion), e);
            return RequestRegistry::identifier_for(request.type_, request.path_);
        }

        std::string identifier = RequestRegistry::identifier_for(request.type_, composed);

        if (request.caching_level_ != model::CachingLevel::NONE) {
            auto cached = cache_->get(cache_name, request.response_type_, request.caching_level_);
            if (cached) {
                logging::logger()->debug("Cache hit for '{}' ({})", cache_name, model::to_string(request.response_type_));
                DispatchResult result;
                result.object_ = std::move(cached);
                result.response_.effective_url_ = composed;
                result.from_cache_ = true;
                deliver(std::move(completion), std::move(result));
                return identifier;
            }
        }

        encoding::EncodedPayload payload;
        try {
            const encoding::EncodeOptions encode_options{
                .parameter_type_ = effective_parameter_type(request),
                .custom_content_type_ = request.custom_content_type_,
                .boundary_ = {},
            };
            payload = encoding::encode(encode_options, request.parameters_, request.parts_);
        } catch (const http_error::HttpError& e) {
            logging::logger()->warn("{}: {}", identifier, e.what());
            http_error::HttpError error(e.kind_, e.status_, composed, e.body_preview_, e.what());
            deliver_failure(std::move(completion), error);
            return identifier;
        }

        Execution execution{
            .in_flight_ = std::make_shared<InFlightRequest>(identifier),
            .request_ =
                model::Request{
                    .url_ = url::append_query(composed, payload.query_),
                    .method_ = request.type_,
                    .body_ = std::move(payload.body_),
                    .headers_ = headers_for(payload.content_type_, request.response_type_),
                },
            .cache_name_ = cache_name,
            .response_type_ = request.response_type_,
            .caching_level_ = request.caching_level_,
        };

        if (registry_.insert(execution.in_flight_)) {
            logging::logger()->debug("{} superseded a live request with the same identifier", identifier);
        }
        logging::logger()->debug("Dispatching {}", identifier);

        io_pool_.enqueue([this, execution = std::move(execution), completion = std::move(completion)]() mutable { execute(execution, completion); });

        return identifier;
    }

    void Dispatcher::execute(const Execution& execution, Completion& completion) {
        const auto& in_flight = execution.in_flight_;
        const auto& req = execution.request_;
        DispatchResult result;

        try {
            if (in_flight->is_cancelled()) {
                throw http_error::HttpError(http_error::ErrorKind::CANCELLED, req.url_, "Request cancelled before it started");
            }

            auto http_client = http_client_factory_();
            result.response_ = http_client->perform(req, in_flight->cancel_flag());

            if (!is_success(result.response_.status_)) {
                throw http_error::HttpError(http_error::ErrorKind::TRANSPORT, result.response_.status_, req.url_,
                                            result.response_.body_.substr(0, constants::ERROR_MESSAGE_LENGTH),
                                            "HTTP request failed with status " + std::to_string(result.response_.status_));
            }

            result.object_ = decoding::decode(execution.response_type_, result.response_.body_);
        } catch (const http_error::HttpError& e) {
            result.object_.reset();
            result.error_ = e;
        } catch (const std::exception& e) {
            result.object_.reset();
            result.error_ = http_error::HttpError(http_error::ErrorKind::TRANSPORT, req.url_, e.what());
        }

        if (!registry_.complete(in_flight)) {
            result.object_.reset();
            if (!result.error_ || !result.error_->is_cancelled()) {
                result.error_ = http_error::HttpError(http_error::ErrorKind::CANCELLED, req.url_, "Request cancelled");
            }
        } else if (result.object_) {
            cache_->put(execution.cache_name_, *result.object_, execution.caching_level_);
        }

        if (result.error_) {
            if (result.error_->is_cancelled()) {
                logging::logger()->debug("{} cancelled", in_flight->identifier());
            } else {
                logging::logger()->info("{} failed ({}): {}", in_flight->identifier(), http_error::to_string(result.error_->kind_), result.error_->what());
            }
        }

        if (!in_flight->claim_delivery()) {
            return;
        }
        deliver(std::move(completion), std::move(result));
    }

    void Dispatcher::deliver(Completion completion, DispatchResult result) {
        callback_queue_.enqueue([completion = std::move(completion), result = std::move(result)]() mutable {
            try {
                completion(std::move(result));
            } catch (const std::exception& e) {
                logging::logger()->error("Request completion threw: {}", e.what());
            } catch (...) {
                logging::logger()->error("Request completion threw a non-standard exception");
            }
        });
    }

    void Dispatcher::deliver_failure(Completion completion, const http_error::HttpError& error) {
        DispatchResult result;
        result.error_ = error;
        result.response_.effective_url_ = error.url_;
        deliver(std::move(completion), std::move(result));
    }

    bool Dispatcher::cancel(model::RequestType type, const std::string& path) {
        std::string composed;
        try {
            composed = url::compose(options_.base_url_, path);
        } catch (const http_error::HttpError& e) {
            logging::logger()->warn("Cannot cancel {} {}: {}", model::to_string(type), path, e.what());
            return false;
        }

        const auto identifier = RequestRegistry::identifier_for(type, composed);
        const bool cancelled = registry_.cancel(identifier);
        logging::logger()->debug("Cancel {}: {}", identifier, cancelled ? "cancelled" : "no live request");
        return cancelled;
    }

    size_t Dispatcher::cancel_all() { return registry_.cancel_all(); }

    std::optional<decoding::Object> Dispatcher::object_from_cache(const std::string& path, const std::optional<std::string>& cache_name,
                                                                  model::ResponseType response_type, model::CachingLevel level) {
        return cache_->get(cache_name.value_or(path), response_type, level);
    }

    void Dispatcher::wait_all() {
        if (callback_queue_.runs_on_current_thread() || io_pool_.runs_on_current_thread()) {
            throw std::logic_error("wait_all() called from a dispatcher thread would deadlock");
        }

        io_pool_.wait_all();
        callback_queue_.wait_all();
    }

    std::vector<std::string> Dispatcher::headers_for(const std::string& content_type, model::ResponseType response_type) const {
        std::vector<std::string> headers = options_.header_fields_;

        if (!content_type.empty()) {
            headers.emplace_back(HeaderLines::CONTENT_TYPE + content_type);
        }
        if (response_type == model::ResponseType::JSON) {
            headers.emplace_back(HeaderLines::ACCEPT_JSON);
        }

        return headers;
    }
}  // namespace tether::http::dispatch
