//
// Created by Daniel Griffiths on 11/1/25.
//

#include "file_disk_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../url/url.hpp"

static constexpr const char *BODY_FILE_EXT = ".body";
static constexpr const char *META_FILE_EXT = ".meta";
static constexpr const char *TMP_FILE_EXT = ".tmp";

namespace tether::http::cache {

    FileDiskStore::FileDiskStore(std::filesystem::path root) : root_(std::move(root)) {}

    std::optional<std::string> FileDiskStore::get(const std::string &key) const {
        const auto base_path = create_base_path(key);
        const auto body_path = string_utils::append_to_path(base_path, BODY_FILE_EXT);
        const auto meta_path = string_utils::append_to_path(base_path, META_FILE_EXT);

        Meta meta;
        if (!load_meta(meta_path, meta)) {
            return std::nullopt;
        }

        // a different key hashed to the same file
        if (meta.key_ != url::percent_encode(key)) {
            return std::nullopt;
        }

        std::ifstream body_in(body_path, std::ios::binary);
        if (!body_in) {
            return std::nullopt;
        }

        std::string s;
        body_in.seekg(0, std::ios::end);
        s.resize(static_cast<size_t>(body_in.tellg()));
        body_in.seekg(0, std::ios::beg);
        body_in.read(s.data(), static_cast<std::streamsize>(s.size()));

        if (!body_in || (meta.size_ >= 0 && static_cast<size_t>(meta.size_) != s.size())) {
            throw std::runtime_error("read failed: " + body_path.string());
        }

        return s;
    }

    void FileDiskStore::put(const std::string &key, const std::string &bytes) {
        std::filesystem::create_directories(root_);

        const auto base_path = create_base_path(key);
        const auto body_path = string_utils::append_to_path(base_path, BODY_FILE_EXT);
        const auto meta_path = string_utils::append_to_path(base_path, META_FILE_EXT);

        write_atomic(body_path, bytes);

        Meta m;
        m.key_ = url::percent_encode(key);
        m.size_ = static_cast<long>(bytes.size());
        m.unix_ts_s_ = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

        save_meta_atomic(meta_path, m);
    }

    void FileDiskStore::remove(const std::string &key) {
        const auto base_path = create_base_path(key);
        for (const char *ext : {META_FILE_EXT, BODY_FILE_EXT}) {
            std::error_code ec;
            std::filesystem::remove(string_utils::append_to_path(base_path, ext), ec);
            if (ec) {
                throw std::runtime_error("remove failed: " + base_path.string() + ext + ": " + ec.message());
            }
        }
    }

    void FileDiskStore::clear() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        if (ec) {
            throw std::runtime_error("clear failed: " + root_.string() + ": " + ec.message());
        }
    }

    std::filesystem::path FileDiskStore::create_base_path(const std::string &key) const {
        std::hash<std::string> hash_maker;
        return root_ / string_utils::to_hex(hash_maker(key));
    }

    void FileDiskStore::save_meta_atomic(const std::filesystem::path &p, const Meta &m) {
        std::ostringstream oss;
        oss << "key: " << m.key_ << "\n"
            << "size: " << m.size_ << "\n"
            << "unix_ts_s: " << m.unix_ts_s_ << "\n";
        write_atomic(p, oss.str());
    }

    void FileDiskStore::write_atomic(const std::filesystem::path &p, std::string_view bytes) {
        auto tmp = p;
        tmp += TMP_FILE_EXT;
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }
        std::filesystem::rename(tmp, p);  // atomic on same filesystem
    }

    bool FileDiskStore::load_meta(const std::filesystem::path &p, Meta &out) {
        std::ifstream in(p);
        if (!in) {
            return false;
        }
        std::string line;
        auto as_long = [](const std::string &s, long def = -1L) -> long {
            char *end = nullptr;
            long v = std::strtol(s.c_str(), &end, constants::BASE_10);
            return (end != nullptr && *end == '\0') ? v : def;
        };

        while (std::getline(in, line)) {
            auto pos = line.find(':');
            if (pos == std::string::npos) {
                continue;
            }
            std::string key = string_utils::trim(line.substr(0, pos));
            std::string val = string_utils::trim(line.substr(pos + 1));
            if (key == "key") {
                out.key_ = val;
            } else if (key == "size") {
                out.size_ = as_long(val, -1);
            } else if (key == "unix_ts_s") {
                out.unix_ts_s_ = as_long(val, 0);
            }
        }
        return !out.key_.empty();
    }
}  // namespace tether::http::cache
