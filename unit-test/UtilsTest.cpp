#include <filesystem>
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace atst;
namespace fs = std::filesystem;

TEST(UtilsTest, MakeCommandTest) {
    vector<string> cflags = {"-std=c99", "-Wall"};
    fs::path source = "/tmp/proj.c";
    EXPECT_EQ(make_command("gcc", cflags, "-c", source, "-o", 3),
              (vector<string>{"gcc", "-std=c99", "-Wall", "-c", "/tmp/proj.c", "-o", "3"}));

    const char *cc = "cc";
    EXPECT_EQ(make_command(cc, vector<string>{}, string("-lm")), (vector<string>{"cc", "-lm"}));
    EXPECT_EQ(make_command("gcc", vector<fs::path>{"a.o", "b.o"}), (vector<string>{"gcc", "a.o", "b.o"}));
}

TEST(UtilsTest, SplitWhitespaceTest) {
    EXPECT_EQ(split_whitespace("  -std=c99 \t-Wall\n-O2 "), (vector<string>{"-std=c99", "-Wall", "-O2"}));
    EXPECT_TRUE(split_whitespace("   ").empty());
}

TEST(UtilsTest, FindExecutableTest) {
    auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(sh->is_absolute());
    EXPECT_FALSE(find_executable("atst-nonexistent-command").has_value());
}
