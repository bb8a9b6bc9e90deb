#include "progress.hpp"
#include "test_util.hpp"

#include <algorithm>

TEST(Progress, PercentTruncates)
{
    EXPECT_EQ(progress_percent(0, 10), 0);
    EXPECT_EQ(progress_percent(5, 10), 50);
    EXPECT_EQ(progress_percent(10, 10), 100);
    EXPECT_EQ(progress_percent(1, 3), 33);
    EXPECT_EQ(progress_percent(2, 3), 66);
    EXPECT_EQ(progress_percent(-1, 999), 0);
}

TEST(Progress, PercentWithoutTargetIsZero)
{
    EXPECT_EQ(progress_percent(5, 0), 0);
    EXPECT_EQ(progress_percent(5, -1), 0);
}

TEST(Progress, BucketChangeOnTenBoundaries)
{
    EXPECT_FALSE(progress_bucket_changed(0, 9));
    EXPECT_TRUE(progress_bucket_changed(9, 10));
    EXPECT_FALSE(progress_bucket_changed(41, 49));
    EXPECT_TRUE(progress_bucket_changed(99, 100));
    EXPECT_FALSE(progress_bucket_changed(100, 100));
    EXPECT_TRUE(progress_bucket_changed(-20, 0));
}

TEST(Progress, BarText)
{
    EXPECT_EQ(progress_bar(0),   "[----------]   0%");
    EXPECT_EQ(progress_bar(10),  "[#---------]  10%");
    EXPECT_EQ(progress_bar(11),  "[##--------]  11%");
    EXPECT_EQ(progress_bar(50),  "[#####-----]  50%");
    EXPECT_EQ(progress_bar(100), "[##########] 100%");
}

TEST(Progress, ZeroTargetWritesNothing)
{
    FILE* sink = std::tmpfile();
    ASSERT_NE(sink, nullptr);
    update_progress(sink, 0, -1, 0);
    update_progress(sink, 3, 2, 0);
    update_progress(sink, 0, -1, -1);
    EXPECT_TRUE(drain(sink).empty());
    std::fclose(sink);
}

TEST(Progress, NullStreamIsIgnored)
{
    update_progress(nullptr, 5, 4, 10);
    SUCCEED();
}

TEST(Progress, AtMostElevenRedrawsPerPhase)
{
    const long long targets[] = {1, 2, 7, 100, 12345};
    for (long long target : targets) {
        FILE* sink = std::tmpfile();
        ASSERT_NE(sink, nullptr);
        for (long long i = 0; i <= target; ++i)
            update_progress(sink, i, i - 1, target);
        const std::string text = drain(sink);
        std::fclose(sink);

        const long long redraws = std::count(text.begin(), text.end(), '\r');
        EXPECT_GE(redraws, 1) << "target=" << target;
        EXPECT_LE(redraws, 11) << "target=" << target;
        EXPECT_NE(text.find("100%\r"), std::string::npos) << "target=" << target;
    }
}

TEST(Progress, RedrawsOnlyWhenBucketChanges)
{
    FILE* sink = std::tmpfile();
    ASSERT_NE(sink, nullptr);
    update_progress(sink, 31, 30, 100);  // 31% vs 30%, same bucket
    EXPECT_TRUE(drain(sink).empty());
    update_progress(sink, 40, 39, 100);
    EXPECT_EQ(drain(sink), "[####------]  40%\r");
    std::fclose(sink);
}
