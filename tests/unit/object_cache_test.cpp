#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "fakes.hpp"
#include "src/http/cache/object_cache.hpp"
#include "src/http/decoding/decoders.hpp"

using namespace tether::http;
using cache::ObjectCache;
using model::CachingLevel;
using model::ResponseType;
using tether::testing::MemoryDiskStore;
using tether::testing::png_bytes;

class ObjectCacheTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto store = std::make_unique<MemoryDiskStore>();
        disk_ = store.get();
        cache_ = std::make_unique<ObjectCache>(std::move(store));
    }

    MemoryDiskStore* disk_ = nullptr;
    std::unique_ptr<ObjectCache> cache_;
};

TEST_F(ObjectCacheTest, NonePolicyNeverStoresOrReads) {
    cache_->put("/a", decoding::decode_data("bytes"), CachingLevel::NONE);

    EXPECT_EQ(cache_->memory_size(), 0U);
    EXPECT_EQ(disk_->puts(), 0U);
    EXPECT_FALSE(cache_->get("/a", ResponseType::DATA, CachingLevel::NONE).has_value());
}

TEST_F(ObjectCacheTest, MemoryPolicyNeverTouchesDisk) {
    cache_->put("/a", decoding::decode_data("bytes"), CachingLevel::MEMORY);

    EXPECT_EQ(disk_->puts(), 0U);
    const auto hit = cache_->get("/a", ResponseType::DATA, CachingLevel::MEMORY);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*std::get<decoding::DataPtr>(*hit), "bytes");

    cache_->clear_memory();
    EXPECT_FALSE(cache_->get("/a", ResponseType::DATA, CachingLevel::MEMORY_AND_FILE).has_value());
}

TEST_F(ObjectCacheTest, DiskCopySurvivesMemoryLossAndIsPromoted) {
    const std::string png = png_bytes(4, 4);
    cache_->put("/logo.png", decoding::decode_image(png), CachingLevel::MEMORY_AND_FILE);
    EXPECT_TRUE(disk_->contains(ObjectCache::disk_key("/logo.png", ResponseType::IMAGE)));

    cache_->clear_memory();
    EXPECT_FALSE(cache_->get("/logo.png", ResponseType::IMAGE, CachingLevel::MEMORY).has_value());

    const auto hit = cache_->get("/logo.png", ResponseType::IMAGE, CachingLevel::MEMORY_AND_FILE);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(std::get<decoding::ImagePtr>(*hit)->bytes_, png);
    EXPECT_EQ(cache_->memory_size(), 1U);

    const size_t gets_before = disk_->gets();
    EXPECT_TRUE(cache_->get("/logo.png", ResponseType::IMAGE, CachingLevel::MEMORY_AND_FILE).has_value());
    EXPECT_EQ(disk_->gets(), gets_before);
}

TEST_F(ObjectCacheTest, ResponseTypesDoNotAlias) {
    cache_->put("/thing", decoding::decode_json(R"({"kind":"json"})"), CachingLevel::MEMORY_AND_FILE);
    cache_->put("/thing", decoding::decode_data("raw"), CachingLevel::MEMORY_AND_FILE);

    const auto json = cache_->get("/thing", ResponseType::JSON);
    const auto data = cache_->get("/thing", ResponseType::DATA);
    ASSERT_TRUE(json.has_value());
    ASSERT_TRUE(data.has_value());
    EXPECT_TRUE(std::holds_alternative<decoding::JsonPtr>(*json));
    EXPECT_EQ(*std::get<decoding::DataPtr>(*data), "raw");
    EXPECT_FALSE(cache_->get("/thing", ResponseType::IMAGE).has_value());
}

TEST_F(ObjectCacheTest, LaterPutReplaces) {
    cache_->put("/a", decoding::decode_data("old"), CachingLevel::MEMORY_AND_FILE);
    cache_->put("/a", decoding::decode_data("new"), CachingLevel::MEMORY_AND_FILE);

    EXPECT_EQ(*std::get<decoding::DataPtr>(*cache_->get("/a", ResponseType::DATA)), "new");
    cache_->clear_memory();
    EXPECT_EQ(*std::get<decoding::DataPtr>(*cache_->get("/a", ResponseType::DATA)), "new");
}

TEST_F(ObjectCacheTest, InvalidateRemovesBothTiers) {
    cache_->put("/a", decoding::decode_data("a"), CachingLevel::MEMORY_AND_FILE);
    cache_->put("/b", decoding::decode_data("b"), CachingLevel::MEMORY_AND_FILE);

    cache_->invalidate("/a");

    EXPECT_FALSE(cache_->get("/a", ResponseType::DATA).has_value());
    EXPECT_FALSE(disk_->contains(ObjectCache::disk_key("/a", ResponseType::DATA)));
    EXPECT_TRUE(cache_->get("/b", ResponseType::DATA).has_value());
}

TEST_F(ObjectCacheTest, ClearEmptiesBothTiers) {
    cache_->put("/a", decoding::decode_data("a"), CachingLevel::MEMORY_AND_FILE);
    cache_->clear();

    EXPECT_EQ(cache_->memory_size(), 0U);
    EXPECT_FALSE(disk_->contains(ObjectCache::disk_key("/a", ResponseType::DATA)));
}

TEST_F(ObjectCacheTest, DiskWriteFailureKeepsMemoryCopy) {
    disk_->fail_writes(true);

    EXPECT_NO_THROW(cache_->put("/a", decoding::decode_data("a"), CachingLevel::MEMORY_AND_FILE));
    EXPECT_TRUE(cache_->get("/a", ResponseType::DATA, CachingLevel::MEMORY).has_value());
}

TEST_F(ObjectCacheTest, DiskReadFailureIsMiss) {
    disk_->set_entry(ObjectCache::disk_key("/a", ResponseType::DATA), "a");
    disk_->fail_reads(true);

    std::optional<decoding::Object> hit;
    EXPECT_NO_THROW(hit = cache_->get("/a", ResponseType::DATA));
    EXPECT_FALSE(hit.has_value());
}

TEST_F(ObjectCacheTest, UndecodableDiskEntryIsDropped) {
    const auto key = ObjectCache::disk_key("/broken.png", ResponseType::IMAGE);
    disk_->set_entry(key, "definitely not an image");

    EXPECT_FALSE(cache_->get("/broken.png", ResponseType::IMAGE).has_value());
    EXPECT_FALSE(disk_->contains(key));
}

TEST(ObjectCacheWithoutDiskTest, WorksMemoryOnly) {
    ObjectCache cache(nullptr);
    cache.put("/a", decoding::decode_data("a"), CachingLevel::MEMORY_AND_FILE);

    EXPECT_TRUE(cache.get("/a", ResponseType::DATA).has_value());
    cache.clear();
    EXPECT_FALSE(cache.get("/a", ResponseType::DATA).has_value());
}
