#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <tensordict/errors.hpp>
#include <tensordict/keys.hpp>

using namespace tensordict;

TEST(NestedKeyTest, SingleAndNested) {
    NestedKey a = "a";
    EXPECT_FALSE(a.is_nested());
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(a.to_string(), "'a'");

    NestedKey abc{"a", "b", "c"};
    EXPECT_TRUE(abc.is_nested());
    EXPECT_EQ(abc.front(), "a");
    EXPECT_EQ(abc.back(), "c");
    EXPECT_EQ(abc.tail(), (NestedKey{"b", "c"}));
    EXPECT_EQ(abc.parent(), (NestedKey{"a", "b"}));
    EXPECT_EQ(abc.to_string(), "('a', 'b', 'c')");
    EXPECT_EQ(abc.join("."), "a.b.c");
    EXPECT_EQ(a.append("x").prepend("r"), (NestedKey{"r", "a", "x"}));
}

TEST(NestedKeyTest, RejectsEmptyAtoms) {
    EXPECT_THROW(NestedKey(""), ValueError);
    EXPECT_THROW((NestedKey{"a", ""}), ValueError);
    EXPECT_THROW(NestedKey(std::vector<std::string>{}), ValueError);
}

TEST(NestedKeyTest, SplitKey) {
    EXPECT_EQ(split_key("a.b.c", "."), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(split_key("a__b", "__"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_key("plain", "."), (std::vector<std::string>{"plain"}));
    EXPECT_EQ(split_key("a..b", "."), (std::vector<std::string>{"a", "", "b"}));
}

TEST(NestedKeyTest, UnravelKey) {
    auto k = unravel_key({NestedKey{"a"}, NestedKey{"b", "c"}, NestedKey{"d"}});
    EXPECT_EQ(k, (NestedKey{"a", "b", "c", "d"}));
    EXPECT_EQ(keys_to_string({NestedKey{"a"}, NestedKey{"b", "c"}}), "['a', ('b', 'c')]");
}

TEST(NestedKeyTest, Ordering) {
    EXPECT_TRUE(NestedKey{"a"} < (NestedKey{"a", "b"}));
    EXPECT_TRUE(NestedKey{"a"} != NestedKey{"b"});
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
