#include <gtest/gtest.h>
#include "cancel/cancellation.hpp"
#include "test_support.hpp"

class CancellationTest : public ::testing::Test {
protected:
    TempDir dir_{"cancel"};
    FileCancellationStore store_{dir_.sub("cancel")};
};

TEST_F(CancellationTest, RequestObserveClear) {
    EXPECT_FALSE(store_.isCancelled("job_1"));
    ASSERT_TRUE(store_.requestCancel("job_1")) << store_.getLastError();
    EXPECT_TRUE(store_.isCancelled("job_1"));
    EXPECT_FALSE(store_.isCancelled("job_2"));
    EXPECT_TRUE(std::filesystem::exists(store_.markerPath("job_1")));

    store_.clear("job_1");
    EXPECT_FALSE(store_.isCancelled("job_1"));
    store_.clear("job_1");
}

// Test that hostile job ids stay inside the cancel directory
TEST_F(CancellationTest, JobIdsAreSanitised) {
    EXPECT_EQ(store_.markerPath("../../etc/x"), dir_.sub("cancel") + "/etcx.cancel");
    EXPECT_FALSE(store_.requestCancel("../"));
    EXPECT_FALSE(store_.getLastError().empty());
    EXPECT_FALSE(store_.isCancelled(""));
}

TEST_F(CancellationTest, NeverCancelled) {
    NeverCancelled never;
    EXPECT_FALSE(never.isCancelled("anything"));
}
