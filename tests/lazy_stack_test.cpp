#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include <tensordict/errors.hpp>
#include <tensordict/lazy_stack.hpp>
#include <tensordict/tensordict.hpp>

using namespace tensordict;

namespace {

std::shared_ptr<TensorDict> make_child(float value) {
    auto td = TensorDict::make({}, {4});
    td->set("a", Tensor::full({4, 3}, value));
    td->set(NestedKey{"n", "c"}, Tensor::full({4}, value));
    return td;
}

} // namespace

TEST(LazyStackTest, InsertGrowsStackDim) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1}, 1);
    EXPECT_EQ(st->type_name(), "LazyStackedTensorDict");
    EXPECT_EQ(st->stack_dim(), 1);
    EXPECT_EQ(st->batch_size(), (Shape{4, 2}));

    auto c2 = make_child(2);
    st->insert(0, c2);
    EXPECT_EQ(st->batch_size()[1], 3);
    EXPECT_EQ(st->tensordicts().front(), c2);
    EXPECT_TRUE(st->contains(c2));

    auto wrong = TensorDict::make({{"a", Tensor::zeros({5, 3})}}, {5});
    EXPECT_THROW(st->insert(0, wrong), BatchSizeMismatchError);
    EXPECT_THROW(st->append(wrong), ValueError);
    EXPECT_EQ(st->size(), 3u);

    st->append(make_child(3));
    EXPECT_EQ(st->batch_size(), (Shape{4, 4}));
    st->insert(-100, make_child(4));
    EXPECT_EQ(st->size(), 5u);
}

TEST(LazyStackTest, ConstructionChecks) {
    EXPECT_THROW(stack({}), ValueError);
    auto a = std::make_shared<TensorDict>(Shape{2}, Device{"cpu"});
    auto b = std::make_shared<TensorDict>(Shape{2}, Device{"cuda:0"});
    EXPECT_THROW(stack({a, b}), DeviceMismatchError);
    EXPECT_THROW(stack({a, std::make_shared<TensorDict>(Shape{3}, Device{"cpu"})}), BatchSizeMismatchError);
    EXPECT_THROW(stack({a, nullptr}), TypeMismatchError);
    EXPECT_THROW(stack({a, a}, 3), IndexError);

    auto st = stack({a, a});
    EXPECT_THROW(st->insert(0, Tensor::zeros({2})), TypeMismatchError);
}

TEST(LazyStackTest, ReadsStackLeaves) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1}, 1);
    Tensor a = st->get_tensor("a");
    EXPECT_EQ(a.shape(), (Shape{4, 2, 3}));
    EXPECT_EQ(a.at<float>({3, 0, 2}), 0.0f);
    EXPECT_EQ(a.at<float>({3, 1, 2}), 1.0f);

    auto nested = st->get_tensordict("n");
    EXPECT_EQ(nested->type_name(), "LazyStackedTensorDict");
    EXPECT_EQ(nested->batch_size(), (Shape{4, 2}));
    EXPECT_EQ(st->get_tensor(NestedKey{"n", "c"}).shape(), (Shape{4, 2}));

    a.fill_(9.0);
    EXPECT_EQ(c0->get_tensor("a").at<float>({0, 0}), 0.0f);
}

TEST(LazyStackTest, WritesAreSplitAcrossSiblings) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1}, 1);

    auto fresh = Tensor::zeros({4, 2, 7});
    fresh.index_put_({Slice{}, 1}, Tensor::ones({}));
    st->set("fresh", fresh);
    ASSERT_TRUE(c0->has_key("fresh"));
    EXPECT_EQ(c0->get_tensor("fresh").shape(), (Shape{4, 7}));
    EXPECT_EQ(c0->get_tensor("fresh").at<float>({0, 0}), 0.0f);
    EXPECT_EQ(c1->get_tensor("fresh").at<float>({0, 0}), 1.0f);

    st->set_("a", Tensor::full({4, 2, 3}, 5.0));
    EXPECT_EQ(c0->get_tensor("a").at<float>({1, 1}), 5.0f);
    EXPECT_EQ(c1->get_tensor("a").at<float>({1, 1}), 5.0f);

    EXPECT_THROW(st->set("bad", Tensor::zeros({4, 3})), ShapeMismatchError);

    st->del_("fresh");
    EXPECT_FALSE(c0->has_key("fresh"));
    EXPECT_FALSE(st->has_key("fresh"));
}

TEST(LazyStackTest, HeterogeneousKeys) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    c0->set("only0", Tensor::zeros({4}));
    auto st = stack({c0, c1});
    std::vector<NestedKey> keys{"a", "n"};
    EXPECT_EQ(st->keys(), keys);
    EXPECT_FALSE(st->has_key("only0"));
    EXPECT_THROW(st->get("only0"), UnsupportedOperationError);
    EXPECT_THROW(st->get("nowhere"), KeyMissingError);

    c1->set("only0", Tensor::ones({4}));
    EXPECT_TRUE(st->has_key("only0"));
    std::vector<NestedKey> grown{"a", "n", "only0"};
    EXPECT_EQ(st->keys(), grown);
    EXPECT_EQ(st->get_tensor("only0").shape(), (Shape{2, 4}));
}

TEST(LazyStackTest, MismatchedLeafShapes) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    c0->set("x", Tensor::zeros({4, 5}));
    c1->set("x", Tensor::zeros({4, 2}));
    auto st = stack({c0, c1});
    EXPECT_THROW(st->get("x"), ShapeMismatchError);
    EXPECT_THROW(st->contiguous(), ShapeMismatchError);

    auto parts = st->get_nestedtensor("x");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].shape(), (Shape{4, 5}));
    EXPECT_EQ(parts[1].shape(), (Shape{4, 2}));
    EXPECT_THROW(stack({c0, c1}, 1)->get_nestedtensor("x"), UnsupportedOperationError);

    auto copy = st->clone();
    EXPECT_EQ(copy->type_name(), "LazyStackedTensorDict");
}

TEST(LazyStackTest, IndexingPicksSiblings) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1});
    EXPECT_EQ(st->batch_size(), (Shape{2, 4}));
    EXPECT_EQ(st->index({1}), c1);
    EXPECT_EQ(st->index({-2}), c0);
    EXPECT_THROW(st->index({2}), IndexError);

    auto row = st->index({0, Slice{1, 3}});
    EXPECT_EQ(row->batch_size(), (Shape{2}));
    EXPECT_EQ(row->get_tensor("a").at<float>({0, 0}), 0.0f);

    auto column = st->index({Slice{}, 2});
    EXPECT_EQ(column->type_name(), "LazyStackedTensorDict");
    EXPECT_EQ(column->batch_size(), (Shape{2}));
    EXPECT_EQ(column->get_tensor("a").at<float>({1, 0}), 1.0f);

    auto head = st->index({Slice{0, 1}});
    EXPECT_EQ(head->batch_size(), (Shape{1, 4}));

    auto mask = Tensor::from_vector<bool>({false, true});
    auto masked = st->index({mask});
    EXPECT_EQ(masked->batch_size(), (Shape{1, 4}));
    EXPECT_EQ(masked->get_tensor("a").at<float>({0, 0, 0}), 1.0f);

    auto transposed = stack({c0, c1}, 1);
    auto picked = transposed->index({2});
    EXPECT_EQ(picked->batch_size(), (Shape{2}));
    auto sibling = transposed->index({Slice{}, 0});
    EXPECT_EQ(sibling, c0);
}

TEST(LazyStackTest, UnbindReturnsSiblings) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1}, 1);
    auto parts = st->unbind(1);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], c0);
    EXPECT_EQ(parts[1], c1);

    auto rows = st->unbind(0);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0]->batch_size(), (Shape{2}));
}

TEST(LazyStackTest, NamesSplitAcrossStackDim) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1});
    EXPECT_FALSE(st->has_names());
    st->set_names(Names{"s", "x"});
    EXPECT_TRUE(st->names() == (Names{"s", "x"}));
    EXPECT_TRUE(c0->names() == (Names{"x"}));
    EXPECT_THROW(st->set_names(Names{"x", "x"}), ValueError);
    EXPECT_THROW(st->set_names(Names{"x"}), ValueError);
    EXPECT_THROW(st->set_batch_size({2, 4}), UnsupportedOperationError);
    EXPECT_TRUE(st->index({Slice{}, 0})->names() == (Names{"s"}));
}

TEST(LazyStackTest, StructureOperations) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1});

    auto picked = st->select({NestedKey{"a"}});
    EXPECT_EQ(picked->type_name(), "LazyStackedTensorDict");
    EXPECT_EQ(picked->keys(), (std::vector<NestedKey>{NestedKey{"a"}}));
    EXPECT_TRUE(c0->has_key("n"));

    auto rest = st->exclude({NestedKey{"a"}});
    EXPECT_EQ(rest->keys(), (std::vector<NestedKey>{NestedKey{"n"}}));

    st->exclude({NestedKey{"n"}}, true);
    EXPECT_FALSE(c0->has_key("n"));
    EXPECT_EQ(st->keys(), (std::vector<NestedKey>{NestedKey{"a"}}));

    st->set(NestedKey{"m", "d"}, Tensor::zeros({2, 4}));
    EXPECT_TRUE(c1->has_key(NestedKey{"m", "d"}));

    auto dense = dense_stack({c0, c1});
    EXPECT_EQ(dense->type_name(), "TensorDict");
    EXPECT_EQ(dense->batch_size(), (Shape{2, 4}));
    EXPECT_EQ(dense->get_tensor("a").at<float>({1, 3, 2}), 1.0f);

    auto moved = st->to(Device{"cuda:0"});
    EXPECT_EQ(moved->device(), std::optional<Device>{"cuda:0"});
    EXPECT_EQ(st->empty()->keys().size(), 0u);
}

TEST(LazyStackTest, ExplicitLockRejectsNewKeys) {
    auto c0 = make_child(0);
    auto c1 = make_child(1);
    auto st = stack({c0, c1});
    st->lock_();
    EXPECT_TRUE(st->is_locked());
    EXPECT_TRUE(c0->is_locked());
    EXPECT_THROW(st->set("zz", Tensor::zeros({2, 4})), LockedMutationError);
    EXPECT_THROW(st->insert(0, make_child(2)), LockedMutationError);
    st->set_("a", Tensor::zeros({2, 4, 3}));
    st->unlock_();
    EXPECT_FALSE(c0->is_locked());
    st->set("zz", Tensor::zeros({2, 4}));
}

TEST(LazyStackTest, RefusedWriteLeavesSiblingsUntouched) {
    auto c0 = make_child(0);
    auto c1 = make_child(0);
    auto st = stack({c0, c1});
    c1->lock_();
    EXPECT_FALSE(st->is_locked());

    EXPECT_THROW(st->set("zz", Tensor::ones({2, 4})), LockedMutationError);
    EXPECT_FALSE(c0->has_key("zz"));
    EXPECT_FALSE(st->has_key("zz"));
    EXPECT_THROW(st->set("a", Tensor::ones({2, 4, 3})), LockedMutationError);
    EXPECT_EQ(c0->get_tensor("a").at<float>({0, 0}), 0.0f);

    st->set_("a", Tensor::ones({2, 4, 3}));
    EXPECT_EQ(c0->get_tensor("a").at<float>({3, 2}), 1.0f);
    EXPECT_EQ(c1->get_tensor("a").at<float>({3, 2}), 1.0f);

    c1->unlock_();
    c1->set("a", Tensor::zeros({4, 2}));
    EXPECT_THROW(st->set_("a", Tensor::full({2, 4, 3}, 2.0)), ValueError);
    EXPECT_EQ(c0->get_tensor("a").at<float>({0, 0}), 1.0f);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
