//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef TETHER_FILE_DISK_STORE_HPP
#define TETHER_FILE_DISK_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "disk_store.hpp"

namespace tether::http::cache {
    class FileDiskStore : public IDiskStore {
       public:
        struct Meta {
            std::string key_;
            long size_ = -1;
            long unix_ts_s_ = 0;
        };

        explicit FileDiskStore(std::filesystem::path root);

        [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
        void put(const std::string& key, const std::string& bytes) override;
        void remove(const std::string& key) override;
        void clear() override;

        [[nodiscard]] const std::filesystem::path& root() const { return root_; }

       private:
        std::filesystem::path root_;

        [[nodiscard]] std::filesystem::path create_base_path(const std::string& key) const;

        static bool load_meta(const std::filesystem::path& p, Meta& out);
        static void save_meta_atomic(const std::filesystem::path& p, const Meta& m);
        static void write_atomic(const std::filesystem::path& p, std::string_view bytes);
    };
}  // namespace tether::http::cache

#endif
