#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <tensordict/errors.hpp>
#include <tensordict/lazy_stack.hpp>
#include <tensordict/memmap.hpp>
#include <tensordict/persistent.hpp>
#include <tensordict/tensordict.hpp>

using namespace tensordict;

namespace fs = std::filesystem;

namespace {

class PersistentTest : public ::testing::Test {
  protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / (std::string{"tensordict_persistent_test_"} + info->name());
        fs::remove_all(root_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string path() const { return root_.string(); }

    fs::path root_;
};

} // namespace

TEST_F(PersistentTest, EntriesLiveInFiles) {
    auto td = PersistentTensorDict::create(path(), {4});
    EXPECT_EQ(td->type_name(), "PersistentTensorDict");
    EXPECT_TRUE(td->is_memmap());
    EXPECT_TRUE(td->keys().empty());

    td->set("a", Tensor::ones({4, 3}));
    td->set(NestedKey{"n", "c"}, Tensor::arange(4));
    EXPECT_TRUE(fs::exists(root_ / "a.memmap"));
    EXPECT_TRUE(fs::exists(root_ / "n" / "c.memmap"));
    EXPECT_EQ(td->keys(), (std::vector<NestedKey>{"a", "n"}));
    EXPECT_EQ(td->get_tensordict("n")->type_name(), "PersistentTensorDict");
    EXPECT_EQ(td->get_tensor(NestedKey{"n", "c"}).at<std::int64_t>({2}), 2);
    EXPECT_THROW(td->set("bad", Tensor::zeros({3})), ShapeMismatchError);
    EXPECT_THROW(td->get("missing"), KeyMissingError);

    auto reopened = PersistentTensorDict::open(path());
    EXPECT_EQ(reopened->batch_size(), (Shape{4}));
    EXPECT_EQ(reopened->keys(true, true), (std::vector<NestedKey>{NestedKey{"a"}, NestedKey{"n", "c"}}));
    EXPECT_EQ(reopened->get_tensor("a").at<float>({3, 2}), 1.0f);
}

TEST_F(PersistentTest, InPlaceAndReplacingWrites) {
    auto td = PersistentTensorDict::create(path(), {4});
    td->set("a", Tensor::zeros({4, 3}));
    td->set_("a", Tensor::full({4, 3}, 3.0));
    EXPECT_EQ(PersistentTensorDict::open(path())->get_tensor("a").at<float>({0, 1}), 3.0f);

    td->set("a", Tensor::ones({4, 2}, DType::Int64));
    Tensor a = td->get_tensor("a");
    EXPECT_EQ(a.shape(), (Shape{4, 2}));
    EXPECT_EQ(a.dtype(), DType::Int64);

    td->del_("a");
    EXPECT_FALSE(td->has_key("a"));
    EXPECT_FALSE(fs::exists(root_ / "a.memmap"));
    EXPECT_THROW(td->del_("a"), KeyMissingError);
}

TEST_F(PersistentTest, DirectoryStaysLoadable) {
    auto td = PersistentTensorDict::create(path(), {4});
    td->set("a", Tensor::full({4, 3}, 2.0));
    td->set(NestedKey{"n", "c"}, Tensor::zeros({4}));
    td->set_names(Names{"x"});

    auto loaded = load_memmap(path());
    EXPECT_EQ(loaded->type_name(), "TensorDict");
    EXPECT_TRUE(loaded->names() == (Names{"x"}));
    EXPECT_EQ(loaded->get_tensor("a").at<float>({1, 1}), 2.0f);
    EXPECT_TRUE(loaded->has_key(NestedKey{"n", "c"}));

    auto plain = td->to_tensordict();
    EXPECT_EQ(plain->type_name(), "TensorDict");
    plain->fill_("a", 0.0);
    EXPECT_EQ(td->get_tensor("a").at<float>({1, 1}), 2.0f);
}

TEST_F(PersistentTest, RejectsInMemoryOperations) {
    auto td = PersistentTensorDict::create(path(), {4});
    td->set("a", Tensor::zeros({4}));
    EXPECT_THROW(td->select({NestedKey{"a"}}), UnsupportedOperationError);
    EXPECT_THROW(td->exclude({NestedKey{"a"}}), UnsupportedOperationError);
    EXPECT_THROW(td->lock_(), UnsupportedOperationError);
    EXPECT_THROW(td->unlock_(), UnsupportedOperationError);
    EXPECT_THROW(td->memmap_(), UnsupportedOperationError);
    EXPECT_THROW(td->share_memory_(), UnsupportedOperationError);
    EXPECT_THROW(td->set_batch_size({2, 2}), UnsupportedOperationError);
    EXPECT_THROW(td->set_names(Names{"x", "y"}), ValueError);
    EXPECT_FALSE(td->is_locked());
}

TEST_F(PersistentTest, CreateAndOpenChecks) {
    PersistentTensorDict::create(path(), {2});
    EXPECT_THROW(PersistentTensorDict::create(path(), {2}), ValueError);

    auto c0 = TensorDict::make({{"a", Tensor::zeros({2})}}, {2});
    auto c1 = TensorDict::make({{"a", Tensor::ones({2})}}, {2});
    const auto stacked = (root_ / "stacked").string();
    stack({c0, c1})->memmap_(stacked);
    EXPECT_THROW(PersistentTensorDict::open(stacked), ValueError);
    EXPECT_THROW(PersistentTensorDict::open((root_ / "nowhere").string()), std::runtime_error);
}

TEST_F(PersistentTest, KeysStayInsideTheDirectory) {
    auto td = PersistentTensorDict::create(path(), {4});
    EXPECT_THROW(td->set("../outside", Tensor::zeros({4})), ValueError);
    TensorDictPtr nested = TensorDict::make({}, {4});
    EXPECT_THROW(td->set("meta", nested), ValueError);
    EXPECT_TRUE(td->keys().empty());
    EXPECT_FALSE(fs::exists(root_.parent_path() / "outside.memmap"));
    td->set("meta", Tensor::zeros({4}));
    EXPECT_TRUE(fs::exists(root_ / "meta.memmap"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
