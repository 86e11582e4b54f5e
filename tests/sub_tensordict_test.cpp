#include <gtest/gtest.h>
#include <memory>

#include <tensordict/errors.hpp>
#include <tensordict/sub_tensordict.hpp>
#include <tensordict/tensordict.hpp>

using namespace tensordict;

namespace {

std::shared_ptr<TensorDict> make_td() {
    auto td = TensorDict::make({}, {4, 5}, std::nullopt, Names{"x", "y"});
    td->set("key1", Tensor::zeros({4, 5, 3}));
    td->set(NestedKey{"n", "c"}, Tensor::zeros({4, 5}));
    return td;
}

} // namespace

TEST(SubTensorDictTest, SetInPlaceWritesParent) {
    auto td = make_td();
    auto sub = td->get_sub_tensordict({2});
    EXPECT_EQ(sub->type_name(), "SubTensorDict");
    EXPECT_EQ(sub->batch_size(), (Shape{5}));

    auto x = Tensor::rand({5, 3});
    sub->set_("key1", x);
    EXPECT_TRUE(td->get_tensor("key1").select(0, 2).equal(x));
    EXPECT_TRUE(td->get_tensor("key1").select(0, 1).eq(Tensor::zeros({5, 3})).all());
    EXPECT_TRUE(sub->get_tensor("key1").equal(x));
}

TEST(SubTensorDictTest, SetOnExistingKeyIsRejected) {
    auto td = make_td();
    auto sub = td->get_sub_tensordict({2});
    EXPECT_THROW(sub->set("key1", Tensor::ones({5, 3})), UnsupportedOperationError);
    EXPECT_THROW(sub->set("key1", Tensor::ones({4, 3})), ShapeMismatchError);

    sub->assign("key1", Tensor::ones({5, 3}));
    EXPECT_EQ(td->get_tensor("key1").at<float>({2, 4, 2}), 1.0f);
}

TEST(SubTensorDictTest, NewKeyIsCreatedInParent) {
    auto td = make_td();
    auto sub = td->get_sub_tensordict({Slice{1, 3}});
    sub->set("fresh", Tensor::ones({2, 5, 2}, DType::Int64));
    ASSERT_TRUE(td->has_key("fresh"));
    Tensor fresh = td->get_tensor("fresh");
    EXPECT_EQ(fresh.shape(), (Shape{4, 5, 2}));
    EXPECT_EQ(fresh.dtype(), DType::Int64);
    EXPECT_EQ(fresh.at<std::int64_t>({0, 0, 0}), 0);
    EXPECT_EQ(fresh.at<std::int64_t>({1, 0, 0}), 1);
    EXPECT_EQ(fresh.at<std::int64_t>({2, 4, 1}), 1);
    EXPECT_EQ(fresh.at<std::int64_t>({3, 0, 0}), 0);
}

TEST(SubTensorDictTest, NestedEntriesAreSubViews) {
    auto td = make_td();
    auto sub = td->get_sub_tensordict({0});
    auto nested = sub->get_tensordict("n");
    EXPECT_EQ(nested->type_name(), "SubTensorDict");
    EXPECT_EQ(nested->batch_size(), (Shape{5}));

    sub->set_(NestedKey{"n", "c"}, Tensor::ones({5}));
    EXPECT_EQ(td->get_tensor(NestedKey{"n", "c"}).at<float>({0, 3}), 1.0f);
    EXPECT_EQ(td->get_tensor(NestedKey{"n", "c"}).at<float>({1, 3}), 0.0f);

    sub->set(NestedKey{"m", "d"}, Tensor::ones({5}));
    ASSERT_TRUE(td->has_key(NestedKey{"m", "d"}));
    EXPECT_EQ(td->get_tensordict("m")->batch_size(), (Shape{4, 5}));
    EXPECT_EQ(td->get_tensor(NestedKey{"m", "d"}).at<float>({0, 1}), 1.0f);
}

TEST(SubTensorDictTest, MaskedSubView) {
    auto td = make_td();
    auto mask = Tensor::from_vector<bool>({true, false, false, true});
    auto sub = td->get_sub_tensordict({mask});
    EXPECT_EQ(sub->batch_size(), (Shape{2, 5}));
    sub->set_("key1", Tensor::ones({2, 5, 3}));
    EXPECT_EQ(td->get_tensor("key1").at<float>({0, 0, 0}), 1.0f);
    EXPECT_EQ(td->get_tensor("key1").at<float>({1, 0, 0}), 0.0f);
    EXPECT_EQ(td->get_tensor("key1").at<float>({3, 4, 2}), 1.0f);
}

TEST(SubTensorDictTest, ChainedSubViewsKeepRoot) {
    auto td = make_td();
    auto sub = std::dynamic_pointer_cast<SubTensorDict>(td->get_sub_tensordict({2}));
    ASSERT_TRUE(sub);
    auto inner = std::dynamic_pointer_cast<SubTensorDict>(sub->get_sub_tensordict({Slice{1, 3}}));
    ASSERT_TRUE(inner);
    EXPECT_EQ(inner->batch_size(), (Shape{2}));
    EXPECT_EQ(inner->get_parent_tensordict(), sub);
    EXPECT_EQ(inner->get_root_tensordict(), td);
    EXPECT_EQ(sub->get_root_tensordict(), td);

    inner->set_("key1", Tensor::ones({2, 3}));
    Tensor leaf = td->get_tensor("key1");
    EXPECT_EQ(leaf.at<float>({2, 1, 0}), 1.0f);
    EXPECT_EQ(leaf.at<float>({2, 2, 2}), 1.0f);
    EXPECT_EQ(leaf.at<float>({2, 3, 0}), 0.0f);
    EXPECT_EQ(leaf.at<float>({1, 1, 0}), 0.0f);
}

TEST(SubTensorDictTest, NamesAndBatchSizeAreReadOnly) {
    auto td = make_td();
    auto sub = td->get_sub_tensordict({1});
    EXPECT_TRUE(sub->names() == (Names{"y"}));
    EXPECT_THROW(sub->set_batch_size({5}), UnsupportedOperationError);
    EXPECT_THROW(sub->set_names(Names{"z"}), UnsupportedOperationError);
}

TEST(SubTensorDictTest, LockingGoesThroughParent) {
    auto td = make_td();
    auto sub = td->get_sub_tensordict({1});
    EXPECT_THROW(sub->lock_(), UnsupportedOperationError);
    EXPECT_NO_THROW(sub->unlock_());

    td->lock_();
    EXPECT_TRUE(sub->is_locked());
    EXPECT_THROW(sub->unlock_(), UnsupportedOperationError);
    EXPECT_THROW(sub->set("brand_new", Tensor::zeros({5})), LockedMutationError);
    sub->set_("key1", Tensor::ones({5, 3}));
    EXPECT_EQ(td->get_tensor("key1").at<float>({1, 0, 0}), 1.0f);
    td->unlock_();
    EXPECT_FALSE(sub->is_locked());
}

TEST(SubTensorDictTest, CloneAndPersistence) {
    auto td = make_td();
    auto sub = td->get_sub_tensordict({3});
    auto shallow = sub->clone(false);
    EXPECT_EQ(shallow->type_name(), "SubTensorDict");

    auto dense = sub->clone();
    EXPECT_EQ(dense->type_name(), "TensorDict");
    EXPECT_EQ(dense->batch_size(), (Shape{5}));
    dense->fill_("key1", 7.0);
    EXPECT_EQ(td->get_tensor("key1").at<float>({3, 0, 0}), 0.0f);

    EXPECT_THROW(sub->memmap_(), UnsupportedOperationError);
    EXPECT_THROW(sub->share_memory_(), UnsupportedOperationError);
    EXPECT_THROW(SubTensorDict(nullptr, {0}), ValueError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
