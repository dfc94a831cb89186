#include "storage/write_batch.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

namespace orderkv::test {

    class WriteBatchTest : public ::testing::Test {
      protected:
        void SetUp() override {
            ASSERT_TRUE(base_.insert("a", "1").ok());
            ASSERT_TRUE(base_.insert("b", "2").ok());
        }

        auto base_value(core::BytesView key) -> std::optional<core::Bytes> {
            std::optional<core::Bytes> value;
            EXPECT_TRUE(base_.fetch(key, value).ok());
            return value;
        }

        storage::MemoryStore base_;
        storage::WriteBatch batch_{base_};
    };

    TEST_F(WriteBatchTest, ReadsFallThroughToBase) {
        std::optional<core::Bytes> value;
        ASSERT_TRUE(batch_.fetch("a", value).ok());
        EXPECT_EQ(value, "1");
        ASSERT_TRUE(batch_.fetch("zz", value).ok());
        EXPECT_FALSE(value.has_value());
    }

    TEST_F(WriteBatchTest, PendingWritesShadowBase) {
        ASSERT_TRUE(batch_.insert("a", "10").ok());
        ASSERT_TRUE(batch_.remove("b").ok());
        ASSERT_TRUE(batch_.insert("c", "3").ok());

        std::optional<core::Bytes> value;
        ASSERT_TRUE(batch_.fetch("a", value).ok());
        EXPECT_EQ(value, "10");
        ASSERT_TRUE(batch_.fetch("b", value).ok());
        EXPECT_FALSE(value.has_value());
        ASSERT_TRUE(batch_.fetch("c", value).ok());
        EXPECT_EQ(value, "3");

        // Base is untouched until commit
        EXPECT_EQ(base_value("a"), "1");
        EXPECT_EQ(base_value("b"), "2");
        EXPECT_FALSE(base_value("c").has_value());
        EXPECT_EQ(batch_.pending(), 3u);
    }

    TEST_F(WriteBatchTest, LastOperationOnAKeyWins) {
        ASSERT_TRUE(batch_.insert("k", "first").ok());
        ASSERT_TRUE(batch_.remove("k").ok());
        ASSERT_TRUE(batch_.insert("k", "second").ok());
        EXPECT_EQ(batch_.pending(), 1u);

        ASSERT_TRUE(batch_.commit().ok());
        EXPECT_EQ(base_value("k"), "second");
    }

    TEST_F(WriteBatchTest, CommitAppliesAndClears) {
        ASSERT_TRUE(batch_.insert("a", "10").ok());
        ASSERT_TRUE(batch_.remove("b").ok());

        ASSERT_TRUE(batch_.commit().ok());
        EXPECT_EQ(batch_.pending(), 0u);
        EXPECT_EQ(base_value("a"), "10");
        EXPECT_FALSE(base_value("b").has_value());
        EXPECT_EQ(base_.size(), 1u);
    }

    TEST_F(WriteBatchTest, EmptyCommitIsNoop) {
        EXPECT_TRUE(batch_.commit().ok());
        EXPECT_EQ(base_.size(), 2u);
    }

    TEST_F(WriteBatchTest, DiscardDropsPendingOperations) {
        ASSERT_TRUE(batch_.insert("a", "10").ok());
        batch_.discard();

        EXPECT_EQ(batch_.pending(), 0u);
        ASSERT_TRUE(batch_.commit().ok());
        EXPECT_EQ(base_value("a"), "1");
    }

    TEST_F(WriteBatchTest, RangeIsNotSupported) {
        std::unique_ptr<storage::StoreCursor> cursor = std::make_unique<storage::VectorCursor>(
            std::vector<storage::Entry>{});

        auto status = batch_.range(scan::ByteRange::all(), cursor);
        EXPECT_TRUE(status.is_not_supported());
        EXPECT_FALSE(cursor);
    }

} // namespace orderkv::test
