#include "storage/memory_store.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace orderkv::test {

    class MemoryStoreTest : public ::testing::Test {
      protected:
        void SetUp() override {
            for (int b : {0x00, 0x10, 0x20, 0x7F, 0x80, 0xFF}) {
                ASSERT_TRUE(store_.insert(raw({b}), fmt::format("v{:02x}", b)).ok());
            }
        }

        auto keys_in(const scan::ByteRange &range) -> std::vector<core::Bytes> {
            std::unique_ptr<storage::StoreCursor> cursor;
            EXPECT_TRUE(store_.range(range, cursor).ok());

            std::vector<core::Bytes> keys;
            for (; cursor && cursor->valid(); cursor->next()) {
                EXPECT_TRUE(cursor->status().ok());
                keys.emplace_back(cursor->key());
            }
            return keys;
        }

        storage::MemoryStore store_;
    };

    // ============================================================================
    // POINT OPERATIONS
    // ============================================================================

    TEST_F(MemoryStoreTest, FetchExistingKey) {
        std::optional<core::Bytes> value;
        ASSERT_TRUE(store_.fetch(raw({0x10}), value).ok());
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, "v10");
    }

    TEST_F(MemoryStoreTest, FetchAbsentResetsValue) {
        std::optional<core::Bytes> value = "stale";
        ASSERT_TRUE(store_.fetch(raw({0x11}), value).ok());
        EXPECT_FALSE(value.has_value());
    }

    TEST_F(MemoryStoreTest, InsertIsUpsert) {
        ASSERT_TRUE(store_.insert(raw({0x10}), "new").ok());

        std::optional<core::Bytes> value;
        ASSERT_TRUE(store_.fetch(raw({0x10}), value).ok());
        EXPECT_EQ(value, "new");
        EXPECT_EQ(store_.size(), 6u);
    }

    TEST_F(MemoryStoreTest, RemoveAbsentIsNotAnError) {
        EXPECT_TRUE(store_.remove(raw({0x42})).ok());
        EXPECT_TRUE(store_.remove(raw({0x10})).ok());
        EXPECT_TRUE(store_.remove(raw({0x10})).ok());
        EXPECT_EQ(store_.size(), 5u);
    }

    TEST_F(MemoryStoreTest, EmptyKeyAndValue) {
        ASSERT_TRUE(store_.insert("", "").ok());

        std::optional<core::Bytes> value;
        ASSERT_TRUE(store_.fetch("", value).ok());
        EXPECT_EQ(value, "");
        EXPECT_EQ(keys_in(scan::ByteRange::all()).front(), "");
    }

    TEST_F(MemoryStoreTest, ClearEmptiesStore) {
        store_.clear();
        EXPECT_EQ(store_.size(), 0u);
        EXPECT_TRUE(keys_in(scan::ByteRange::all()).empty());
    }

    // ============================================================================
    // RANGES
    // ============================================================================

    TEST_F(MemoryStoreTest, FullRangeIsUnsignedByteOrder) {
        std::vector<core::Bytes> expected{raw({0x00}), raw({0x10}), raw({0x20}),
                                          raw({0x7F}), raw({0x80}), raw({0xFF})};
        EXPECT_EQ(keys_in(scan::ByteRange::all()), expected);
    }

    TEST_F(MemoryStoreTest, RangeBoundKinds) {
        using scan::ByteBound;

        EXPECT_EQ(keys_in({ByteBound::included(raw({0x10})), ByteBound::included(raw({0x7F}))}),
                  (std::vector<core::Bytes>{raw({0x10}), raw({0x20}), raw({0x7F})}));
        EXPECT_EQ(keys_in({ByteBound::excluded(raw({0x10})), ByteBound::excluded(raw({0x7F}))}),
                  (std::vector<core::Bytes>{raw({0x20})}));
        EXPECT_EQ(keys_in({ByteBound::excluded(raw({0x7F})), ByteBound::unbounded()}),
                  (std::vector<core::Bytes>{raw({0x80}), raw({0xFF})}));
        EXPECT_EQ(keys_in({ByteBound::unbounded(), ByteBound::excluded(raw({0x10}))}),
                  (std::vector<core::Bytes>{raw({0x00})}));
    }

    TEST_F(MemoryStoreTest, BoundsBetweenStoredKeys) {
        using scan::ByteBound;
        EXPECT_EQ(keys_in({ByteBound::included(raw({0x11})), ByteBound::included(raw({0x7F, 0x00}))}),
                  (std::vector<core::Bytes>{raw({0x20}), raw({0x7F})}));
    }

    TEST_F(MemoryStoreTest, InvertedRangeIsEmpty) {
        using scan::ByteBound;
        EXPECT_TRUE(
            keys_in({ByteBound::included(raw({0x80})), ByteBound::included(raw({0x10}))}).empty());
        EXPECT_TRUE(
            keys_in({ByteBound::excluded(raw({0x10})), ByteBound::excluded(raw({0x10}))}).empty());
    }

    TEST_F(MemoryStoreTest, PrefixRangeOverStore) {
        ASSERT_TRUE(store_.insert(raw({0x7F, 0x01}), "child").ok());
        ASSERT_TRUE(store_.insert(raw({0x7F, 0xFF, 0xFF}), "deep").ok());

        EXPECT_EQ(keys_in(scan::prefix_range(raw({0x7F}))),
                  (std::vector<core::Bytes>{raw({0x7F}), raw({0x7F, 0x01}), raw({0x7F, 0xFF, 0xFF})}));
    }

    TEST_F(MemoryStoreTest, CursorIsSnapshotOfCallTime) {
        std::unique_ptr<storage::StoreCursor> cursor;
        ASSERT_TRUE(store_.range(scan::ByteRange::all(), cursor).ok());

        ASSERT_TRUE(store_.insert(raw({0x01}), "late").ok());
        ASSERT_TRUE(store_.remove(raw({0x10})).ok());
        ASSERT_TRUE(store_.insert(raw({0x20}), "changed").ok());

        std::vector<std::pair<core::Bytes, core::Bytes>> seen;
        for (; cursor->valid(); cursor->next()) {
            seen.emplace_back(cursor->key(), cursor->value());
        }
        ASSERT_EQ(seen.size(), 6u);
        EXPECT_EQ(seen[1].first, raw({0x10}));
        EXPECT_EQ(seen[2].second, "v20");
    }

    // ============================================================================
    // CONCURRENCY
    // ============================================================================

    TEST_F(MemoryStoreTest, ConcurrentWritersAndReaders) {
        store_.clear();
        const int writers = 4;
        const int per_writer = 500;

        std::vector<std::thread> threads;
        for (int w = 0; w < writers; ++w) {
            threads.emplace_back([this, w] {
                for (int i = 0; i < per_writer; ++i) {
                    auto key = codec::encode_key(std::tuple<uint8_t, uint32_t>(
                        static_cast<uint8_t>(w), static_cast<uint32_t>(i)));
                    EXPECT_TRUE(store_.insert(key, "x").ok());
                }
            });
        }
        threads.emplace_back([this] {
            for (int i = 0; i < 50; ++i) {
                std::unique_ptr<storage::StoreCursor> cursor;
                EXPECT_TRUE(store_.range(scan::ByteRange::all(), cursor).ok());
                core::Bytes previous;
                bool first = true;
                for (; cursor->valid(); cursor->next()) {
                    EXPECT_TRUE(first || previous < cursor->key());
                    previous.assign(cursor->key());
                    first = false;
                }
            }
        });
        for (auto &t : threads) {
            t.join();
        }

        EXPECT_EQ(store_.size(), static_cast<size_t>(writers * per_writer));
        EXPECT_EQ(keys_in(scan::prefix_range(codec::encode_key<uint8_t>(2))).size(),
                  static_cast<size_t>(per_writer));
    }

} // namespace orderkv::test
