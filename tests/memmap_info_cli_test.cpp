#include <cstdio>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#ifdef __unix__
#include <sys/wait.h>
#endif

#include <tensordict/lazy_stack.hpp>
#include <tensordict/tensordict.hpp>

using namespace tensordict;

namespace fs = std::filesystem;

namespace {

struct CliResult {
    int status{-1};
    std::string out{};
};

CliResult run_cli(const std::string& args) {
    CliResult res;
    const std::string cmd = "./memmap_info_cli " + args + " 2>/dev/null";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe)
        return res;
    char buf[256];
    while (fgets(buf, sizeof(buf), pipe))
        res.out += buf;
    res.status = pclose(pipe);
    return res;
}

} // namespace

#ifdef __unix__
TEST(MemmapInfoCli, PrintsStructure) {
    const fs::path dir = fs::temp_directory_path() / "tensordict_memmap_info_cli_td";
    fs::remove_all(dir);
    {
        auto td = TensorDict::make({}, {4}, std::nullopt, Names{"x"});
        td->set("a", Tensor::zeros({4, 3}));
        td->set(NestedKey{"n", "c"}, Tensor::zeros({4}, DType::Int64));
        td->memmap_(dir.string());
    }

    auto res = run_cli(dir.string());
    ASSERT_TRUE(WIFEXITED(res.status));
    ASSERT_EQ(WEXITSTATUS(res.status), 0);
    EXPECT_NE(res.out.find("type TensorDict"), std::string::npos);
    EXPECT_NE(res.out.find("batch_size [4]"), std::string::npos);
    EXPECT_NE(res.out.find("device None"), std::string::npos);
    EXPECT_NE(res.out.find("names [x]"), std::string::npos);
    EXPECT_NE(res.out.find("leaf a float32 [4, 3]"), std::string::npos);
    EXPECT_NE(res.out.find("nested n [4]"), std::string::npos);
    EXPECT_NE(res.out.find("leaf n.c int64 [4]"), std::string::npos);
    fs::remove_all(dir);
}

TEST(MemmapInfoCli, PrintsStackedSiblings) {
    const fs::path dir = fs::temp_directory_path() / "tensordict_memmap_info_cli_stack";
    fs::remove_all(dir);
    {
        auto c0 = TensorDict::make({{"a", Tensor::zeros({2})}}, {2});
        auto c1 = TensorDict::make({{"a", Tensor::ones({2})}}, {2});
        stack({c0, c1}, 1)->memmap_(dir.string());
    }

    auto res = run_cli(dir.string());
    ASSERT_TRUE(WIFEXITED(res.status));
    ASSERT_EQ(WEXITSTATUS(res.status), 0);
    EXPECT_NE(res.out.find("type LazyStackedTensorDict"), std::string::npos);
    EXPECT_NE(res.out.find("batch_size [2, 2]"), std::string::npos);
    EXPECT_NE(res.out.find("stack_dim 1"), std::string::npos);
    EXPECT_NE(res.out.find("sibling 0"), std::string::npos);
    EXPECT_NE(res.out.find("sibling 1"), std::string::npos);
    EXPECT_NE(res.out.find("  leaf a float32 [2]"), std::string::npos);
    fs::remove_all(dir);
}

TEST(MemmapInfoCli, FailsOnBadInput) {
    auto missing = run_cli((fs::temp_directory_path() / "tensordict_memmap_info_cli_missing").string());
    ASSERT_TRUE(WIFEXITED(missing.status));
    EXPECT_EQ(WEXITSTATUS(missing.status), 1);
    EXPECT_TRUE(missing.out.empty());

    auto usage = run_cli("");
    ASSERT_TRUE(WIFEXITED(usage.status));
    EXPECT_EQ(WEXITSTATUS(usage.status), 1);
}
#endif

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
