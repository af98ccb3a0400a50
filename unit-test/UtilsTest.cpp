#include <filesystem>
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;

TEST(UtilsTest, MakeCommandMixedArgumentsTest) {
    filesystem::path dir("/tmp/run");
    vector<string> extra = {"--rm", "-i"};
    string image = "golang:1.21";
    auto argv = make_command("docker", "run", extra, "-v", dir, "--cpus", 2, image);
    EXPECT_EQ(argv, vector<string>({"docker", "run", "--rm", "-i", "-v", "/tmp/run", "--cpus", "2", "golang:1.21"}));
}

TEST(UtilsTest, MakeCommandSingleArgumentTest) {
    EXPECT_EQ(make_command("true"), vector<string>({"true"}));
}
