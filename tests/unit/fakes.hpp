#ifndef TETHER_TESTS_FAKES_HPP
#define TETHER_TESTS_FAKES_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/http/cache/disk_store.hpp"
#include "src/http/client/interface.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/model/model.hpp"

namespace tether::testing {
    inline std::string without_query(const std::string& url) { return url.substr(0, url.find('?')); }

    // In-process stand-in for a web server. Routes are keyed by URL without its query string.
    // A held URL keeps its requests in flight until release() or until the caller cancels them.
    class FakeServer {
       public:
        struct Route {
            long status_ = 200;
            std::string body_;
            std::string content_type_ = "application/json";
        };

        void route(const std::string& url, Route r) {
            std::lock_guard<std::mutex> lock(mutex_);
            routes_[url] = std::move(r);
        }

        void fail(const std::string& url, std::string message) {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_[url] = std::move(message);
        }

        void hold(const std::string& url) {
            std::lock_guard<std::mutex> lock(mutex_);
            held_.insert(url);
        }

        void release(const std::string& url) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                held_.erase(url);
            }
            cv_.notify_all();
        }

        bool wait_for_in_flight(const std::string& url, size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [&]() { return in_flight_[url] >= count; });
        }

        [[nodiscard]] size_t calls(const std::string& url) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = calls_.find(url);
            return it == calls_.end() ? 0 : it->second;
        }

        [[nodiscard]] size_t total_calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_.size();
        }

        [[nodiscard]] std::vector<http::model::Request> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

        http::model::Response handle(const http::model::Request& req, const std::atomic<bool>& cancelled) {
            const std::string key = without_query(req.url_);
            std::unique_lock<std::mutex> lock(mutex_);

            requests_.push_back(req);
            ++calls_[key];

            if (held_.count(key) > 0) {
                ++in_flight_[key];
                cv_.notify_all();
                while (held_.count(key) > 0 && !cancelled.load()) {
                    cv_.wait_for(lock, std::chrono::milliseconds(1));
                }
                --in_flight_[key];
            }

            if (cancelled.load()) {
                throw http::http_error::HttpError(http::http_error::ErrorKind::CANCELLED, req.url_, "Request cancelled");
            }

            auto failure = failures_.find(key);
            if (failure != failures_.end()) {
                throw http::http_error::HttpError(http::http_error::ErrorKind::TRANSPORT, req.url_, failure->second);
            }

            http::model::Response response;
            response.effective_url_ = req.url_;

            auto it = routes_.find(key);
            if (it == routes_.end()) {
                response.status_ = 404;
                response.body_ = R"({"error":"not found"})";
                response.content_type_ = "application/json";
                return response;
            }

            response.status_ = it->second.status_;
            response.body_ = it->second.body_;
            response.content_type_ = it->second.content_type_;
            response.content_length_ = static_cast<long>(response.body_.size());
            return response;
        }

       private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::map<std::string, Route> routes_;
        std::map<std::string, std::string> failures_;
        std::set<std::string> held_;
        std::map<std::string, size_t> in_flight_;
        std::map<std::string, size_t> calls_;
        std::vector<http::model::Request> requests_;
    };

    class FakeHttpClient : public http::client::IHttpClient {
       public:
        explicit FakeHttpClient(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}

        http::model::Response perform(const http::model::Request& req, const std::atomic<bool>& cancelled) override { return server_->handle(req, cancelled); }

       private:
        std::shared_ptr<FakeServer> server_;
    };

    inline http::client::HttpClientFactory fake_client_factory(const std::shared_ptr<FakeServer>& server) {
        return [server]() { return std::make_unique<FakeHttpClient>(server); };
    }

    class MemoryDiskStore : public http::cache::IDiskStore {
       public:
        [[nodiscard]] std::optional<std::string> get(const std::string& key) const override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++gets_;
            if (fail_reads_) {
                throw std::runtime_error("disk read failure");
            }
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        void put(const std::string& key, const std::string& bytes) override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++puts_;
            if (fail_writes_) {
                throw std::runtime_error("disk write failure");
            }
            entries_[key] = bytes;
        }

        void remove(const std::string& key) override {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.erase(key);
        }

        void clear() override {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

        [[nodiscard]] size_t gets() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return gets_;
        }

        [[nodiscard]] size_t puts() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return puts_;
        }

        [[nodiscard]] bool contains(const std::string& key) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.count(key) > 0;
        }

        void set_entry(const std::string& key, std::string bytes) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_[key] = std::move(bytes);
        }

        void fail_reads(bool fail) {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_reads_ = fail;
        }

        void fail_writes(bool fail) {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_writes_ = fail;
        }

       private:
        mutable std::mutex mutex_;
        std::map<std::string, std::string> entries_;
        mutable size_t gets_ = 0;
        size_t puts_ = 0;
        bool fail_reads_ = false;
        bool fail_writes_ = false;
    };

    inline void append_be32(std::string& out, uint32_t v) {
        out.push_back(static_cast<char>((v >> 24U) & 0xFFU));
        out.push_back(static_cast<char>((v >> 16U) & 0xFFU));
        out.push_back(static_cast<char>((v >> 8U) & 0xFFU));
        out.push_back(static_cast<char>(v & 0xFFU));
    }

    // Signature plus IHDR chunk; enough for the header decoder.
    inline std::string png_bytes(uint32_t width, uint32_t height) {
        std::string out("\x89PNG\r\n\x1a\n", 8);
        append_be32(out, 13);
        out += "IHDR";
        append_be32(out, width);
        append_be32(out, height);
        out += std::string("\x08\x06\x00\x00\x00", 5);
        append_be32(out, 0);
        return out;
    }

    inline std::string gif_bytes(uint16_t width, uint16_t height) {
        std::string out = "GIF89a";
        out.push_back(static_cast<char>(width & 0xFFU));
        out.push_back(static_cast<char>((width >> 8U) & 0xFFU));
        out.push_back(static_cast<char>(height & 0xFFU));
        out.push_back(static_cast<char>((height >> 8U) & 0xFFU));
        out += std::string("\x00\x00\x00", 3);
        return out;
    }

    // SOI, an APP0 segment, then a baseline SOF0 frame header.
    inline std::string jpeg_bytes(uint16_t width, uint16_t height) {
        std::string out("\xFF\xD8", 2);
        out += std::string("\xFF\xE0\x00\x10JFIF\x00\x01\x01\x00\x00\x01\x00\x01\x00\x00", 18);
        out += std::string("\xFF\xC0\x00\x11\x08", 5);
        out.push_back(static_cast<char>((height >> 8U) & 0xFFU));
        out.push_back(static_cast<char>(height & 0xFFU));
        out.push_back(static_cast<char>((width >> 8U) & 0xFFU));
        out.push_back(static_cast<char>(width & 0xFFU));
        out += std::string("\x03\x01\x22\x00\x02\x11\x01\x03\x11\x01", 10);
        out += std::string("\xFF\xD9", 2);
        return out;
    }
}  // namespace tether::testing

#endif
