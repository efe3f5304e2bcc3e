#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/networking/networking.hpp"

namespace {
    std::string env_or(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return value != nullptr && value[0] != '\0' ? std::string(value) : fallback;
    }

    const char* format_name(tether::http::decoding::ImageFormat format) {
        switch (format) {
            case tether::http::decoding::ImageFormat::PNG:
                return "png";
            case tether::http::decoding::ImageFormat::JPEG:
                return "jpeg";
            case tether::http::decoding::ImageFormat::GIF:
                return "gif";
            case tether::http::decoding::ImageFormat::BMP:
                return "bmp";
        }
        return "unknown";
    }
}  // namespace

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        const std::string base_url = env_or("TETHER_BASE_URL", "");
        const std::string cache_directory = env_or("TETHER_CACHE_DIR", "");
        const std::string log_level = env_or("TETHER_LOG_LEVEL", "info");
        const unsigned int max_threads = std::thread::hardware_concurrency();

        if (argc < 2) {
            std::cerr << "usage: " << argv[0] << " <path> [json|image|data]" << std::endl;
            return 1;
        }

        const std::string path = argv[1];
        const std::string response_type = argc > 2 ? argv[2] : "json";

        if (base_url.empty()) {
            std::cout << "TETHER_BASE_URL not set" << std::endl;
            return 1;
        }

        tether::http::client::CurlGlobal curl_global;

        tether::networking::NetworkingBuilder builder;
        builder.with_base_url(base_url)
            .with_io_threads(max_threads > 1 ? max_threads / 2 : 1)
            .with_header_fields({"Accept-Language: en"})
            .with_log_level(log_level)
            .with_http_client_factory([]() {
                auto curl = std::make_unique<tether::http::client::CurlEasy>();
                curl->enable_compression();
                curl->enable_keepalive();
                return curl;
            });
        if (!cache_directory.empty()) {
            builder.with_cache_directory(cache_directory);
        }
        auto networking = builder.validate().build();

        //
        // Fetch
        //

        int exit_code = 0;

        if (response_type == "image") {
            networking->download_image(path, [&exit_code](const tether::networking::ImageResult& result) {
                if (!result.ok()) {
                    std::cerr << "HTTP Error: " << result.error_->what() << " (URL: " << result.error_->url_ << ")\n";
                    exit_code = 2;
                    return;
                }
                std::cout << format_name(result.value_->format_) << " " << result.value_->width_ << "x" << result.value_->height_ << " ("
                          << result.value_->bytes_.size() << " bytes" << (result.from_cache_ ? ", cached" : "") << ")" << std::endl;
            });
        } else if (response_type == "data") {
            networking->download_data(path, [&exit_code](const tether::networking::DataResult& result) {
                if (!result.ok()) {
                    std::cerr << "HTTP Error: " << result.error_->what() << " (URL: " << result.error_->url_ << ")\n";
                    exit_code = 2;
                    return;
                }
                std::cout << result.value_->size() << " bytes" << (result.from_cache_ ? " (cached)" : "") << std::endl;
            });
        } else {
            networking->get(path, std::nullopt, tether::networking::CachingLevel::MEMORY, [&exit_code](const tether::networking::JsonResult& result) {
                if (!result.ok()) {
                    std::cerr << "HTTP Error: " << result.error_->what() << " (URL: " << result.error_->url_ << ")\n";
                    exit_code = 2;
                    return;
                }
                std::cout << result.value_->minified() << std::endl;
            });
        }

        networking->wait_all();
        return exit_code;
    } catch (const tether::http::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
};
