#include "core/transfer/TransferProgress.hpp"

#include <gtest/gtest.h>

using namespace courier::core::transfer;

TEST(TransferProgressTest, RunningComputesRatioAndEta) {
    auto progress = TransferProgress::running(250, 1000, 100.0);

    EXPECT_EQ(progress.status, TransferStatus::Running);
    EXPECT_DOUBLE_EQ(progress.ratio(), 0.25);
    EXPECT_DOUBLE_EQ(progress.percent(), 25.0);
    ASSERT_TRUE(progress.estimatedTimeRemaining.has_value());
    EXPECT_EQ(progress.estimatedTimeRemaining->count(), 7500);
    EXPECT_FALSE(progress.errorMessage.has_value());
}

TEST(TransferProgressTest, UnknownSizeHasZeroRatio) {
    auto progress = TransferProgress::running(4096, TransferProgress::kUnknownSize);

    EXPECT_FALSE(progress.hasTotalBytes());
    EXPECT_DOUBLE_EQ(progress.ratio(), 0.0);
    EXPECT_FALSE(progress.estimatedTimeRemaining.has_value());
}

TEST(TransferProgressTest, CompletedIsFullEvenWithoutSize) {
    EXPECT_DOUBLE_EQ(TransferProgress::completed(TransferProgress::kUnknownSize).ratio(), 1.0);

    auto sized = TransferProgress::completed(512);
    EXPECT_EQ(sized.bytesTransferred, 512);
    EXPECT_TRUE(sized.isCompleted());
    EXPECT_TRUE(sized.isTerminal());
}

TEST(TransferProgressTest, BytesAreClampedToTotal) {
    auto progress = TransferProgress::running(5000, 1000);
    EXPECT_EQ(progress.bytesTransferred, 1000);

    auto negative = TransferProgress::running(-10, 1000);
    EXPECT_EQ(negative.bytesTransferred, 0);
}

TEST(TransferProgressTest, ErrorMessageOnlyOnFailure) {
    auto failed = TransferProgress::failed("disk full", 10, 100);
    ASSERT_TRUE(failed.errorMessage.has_value());
    EXPECT_EQ(*failed.errorMessage, "disk full");
    EXPECT_TRUE(failed.isFailed());

    TransferProgress bare;
    bare.status = TransferStatus::Failed;
    EXPECT_EQ(bare.normalized().errorMessage.value_or(""), "Unknown error");

    TransferProgress stray = TransferProgress::running(1, 2);
    stray.errorMessage = "leftover";
    EXPECT_FALSE(stray.normalized().errorMessage.has_value());
}

TEST(TransferProgressTest, TerminalClassification) {
    EXPECT_FALSE(TransferProgress::initial().isTerminal());
    EXPECT_FALSE(TransferProgress::running(0, 1).isTerminal());
    EXPECT_FALSE(TransferProgress::paused(0, 1).isTerminal());
    EXPECT_TRUE(TransferProgress::failed("x").isTerminal());
    EXPECT_TRUE(TransferProgress::cancelled().isTerminal());
}

TEST(TransferProgressTest, ToStringMentionsStatusAndError) {
    auto text = TransferProgress::failed("unreachable", 0, 100).toString();
    EXPECT_NE(text.find("failed"), std::string::npos);
    EXPECT_NE(text.find("unreachable"), std::string::npos);
}
