#include "app.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace
{
std::size_t CountOccurrences(const std::string& text, const std::string& needle)
{
    std::size_t n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1))
        ++n;
    return n;
}
}

TEST(AppTest, DefaultOptions)
{
    AppOptions opt;
    std::string err;
    ASSERT_TRUE(parseArgs({}, opt, err));
    EXPECT_EQ(opt.width, 16u);
    EXPECT_EQ(opt.height, 16u);
    EXPECT_FALSE(opt.seed);
    EXPECT_FALSE(opt.limit);
    EXPECT_EQ(opt.updateEvery, 0u);
    EXPECT_FALSE(opt.interactive);
}

TEST(AppTest, ParsesAllFlags)
{
    AppOptions opt;
    std::string err;
    ASSERT_TRUE(parseArgs({"--width", "30", "--height", "20", "--seed", "18446744073709551615",
                           "--limit", "100", "--update-every", "7", "-i"}, opt, err)) << err;
    EXPECT_EQ(opt.width, 30u);
    EXPECT_EQ(opt.height, 20u);
    ASSERT_TRUE(opt.seed);
    EXPECT_EQ(*opt.seed, 18446744073709551615ull);
    ASSERT_TRUE(opt.limit);
    EXPECT_EQ(*opt.limit, 100u);
    EXPECT_EQ(opt.updateEvery, 7u);
    EXPECT_TRUE(opt.interactive);
}

TEST(AppTest, RejectsBadInput)
{
    std::string err;
    {
        AppOptions opt;
        EXPECT_FALSE(parseArgs({"--bogus"}, opt, err));
        EXPECT_NE(err.find("unknown option"), std::string::npos);
    }
    {
        AppOptions opt;
        EXPECT_FALSE(parseArgs({"--width"}, opt, err));
        EXPECT_NE(err.find("missing value"), std::string::npos);
    }
    {
        AppOptions opt;
        EXPECT_FALSE(parseArgs({"--width", "-3"}, opt, err));
        EXPECT_FALSE(parseArgs({"--width", "12abc"}, opt, err));
        EXPECT_FALSE(parseArgs({"--width", " 5"}, opt, err));
        EXPECT_FALSE(parseArgs({"--seed", "\t7"}, opt, err));
        EXPECT_FALSE(parseArgs({"--delay-ms", "99999999999"}, opt, err));
    }
    {
        AppOptions opt;
        EXPECT_FALSE(parseArgs({"--height", "0"}, opt, err));
        EXPECT_NE(err.find("must be > 0"), std::string::npos);
    }
}

TEST(AppTest, BatchRunPrintsSummary)
{
    AppOptions opt;
    opt.width = 5;
    opt.height = 5;
    opt.seed = 9;

    std::istringstream in;
    std::ostringstream out, err;
    EXPECT_EQ(runApp(opt, in, out, err), 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("maze 5x5  seed=9"), std::string::npos);
    EXPECT_NE(text.find("steps:      49"), std::string::npos);
    EXPECT_NE(text.find("open walls: 24"), std::string::npos);
    EXPECT_NE(text.find("perfect:    yes"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}

TEST(AppTest, BatchRunWithLimitStaysIncomplete)
{
    AppOptions opt;
    opt.width = 5;
    opt.height = 5;
    opt.seed = 9;
    opt.limit = 10;
    opt.updateEvery = 5;

    std::istringstream in;
    std::ostringstream out, err;
    EXPECT_EQ(runApp(opt, in, out, err), 0);

    const std::string text = out.str();
    EXPECT_EQ(CountOccurrences(text, "step="), 2u);
    EXPECT_EQ(CountOccurrences(text, "step=5 "), 1u);
    EXPECT_EQ(CountOccurrences(text, "step=10 "), 1u);
    EXPECT_NE(text.find("complete:   no"), std::string::npos);
}

TEST(AppTest, BatchRunWithDelay)
{
    AppOptions opt;
    std::string err;
    ASSERT_TRUE(parseArgs({"--width", "3", "--height", "2", "--seed", "1", "--delay-ms", "1"}, opt, err)) << err;
    EXPECT_EQ(opt.delayMs, 1u);

    std::istringstream in;
    std::ostringstream out, errs;
    EXPECT_EQ(runApp(opt, in, out, errs), 0);
    EXPECT_NE(out.str().find("perfect:    yes"), std::string::npos);
}

TEST(AppTest, InteractiveSession)
{
    AppOptions opt;
    opt.interactive = true;

    std::istringstream in("b 2 1 4\ns\ng 1\ng\ni\nb 0 3\nxyz\nq\ns\n");
    std::ostringstream out, err;
    EXPECT_EQ(runApp(opt, in, out, err), 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("built 2x1"), std::string::npos);
    EXPECT_NE(text.find("step=1 cursor=(1,0) depth=2"), std::string::npos);
    EXPECT_NE(text.find("paused after 2 steps"), std::string::npos);
    EXPECT_NE(text.find("complete after 3 steps"), std::string::npos);
    EXPECT_NE(text.find("perfect:    yes"), std::string::npos);

    EXPECT_NE(err.str().find("must be > 0"), std::string::npos);
    EXPECT_NE(err.str().find("unknown command: xyz"), std::string::npos);
}
