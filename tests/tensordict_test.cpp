#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

#include <tensordict/errors.hpp>
#include <tensordict/lazy_stack.hpp>
#include <tensordict/tensordict.hpp>

using namespace tensordict;

namespace {

/// Container with batch (4, 5), a leaf "a" and a two level nested entry.
std::shared_ptr<TensorDict> make_nested() {
    auto td = TensorDict::make({}, {4, 5});
    td->set("a", Tensor::zeros({4, 5, 2}));
    td->set(NestedKey{"n", "c"}, Tensor::ones({4, 5}));
    td->set(NestedKey{"n", "m", "d"}, Tensor::zeros({4, 5, 3}, DType::Int64));
    return td;
}

} // namespace

TEST(TensorDictTest, BatchPrefixOnSet) {
    auto td = TensorDict::make({{"key1", Tensor::zeros({4, 5, 1})}}, {4, 5});
    EXPECT_THROW(td->set("key1", Tensor::rand({5, 5})), ShapeMismatchError);
    EXPECT_THROW(td->set("other", Tensor::zeros({4})), ShapeMismatchError);

    td->set_("key1", Tensor::ones({4, 5}, DType::Int64));
    Tensor leaf = td->get_tensor("key1");
    EXPECT_EQ(leaf.shape(), (Shape{4, 5, 1}));
    EXPECT_EQ(leaf.dtype(), DType::Float32);
    EXPECT_EQ(leaf.at<float>({3, 4, 0}), 1.0f);
    EXPECT_TRUE(leaf.eq(Tensor::ones({4, 5, 1})).all());
}

TEST(TensorDictTest, SetInPlaceRejectsIncompatibleShapes) {
    auto td = TensorDict::make({{"x", Tensor::zeros({4, 3})}}, {4});
    EXPECT_THROW(td->set_("x", Tensor::zeros({4, 2})), ValueError);
    EXPECT_THROW(td->set_("missing", Tensor::zeros({4})), KeyMissingError);
    td->set_("x", Tensor::ones({4, 1}));
    EXPECT_TRUE(td->get_tensor("x").eq(Tensor::ones({4, 3})).all());
}

TEST(TensorDictTest, NegativeBatchSizeRejected) {
    EXPECT_THROW(TensorDict(Shape{-1, 2}), ValueError);
}

TEST(TensorDictTest, FromDictInfersBatchSize) {
    auto inner = TensorDict::make({{"c", Tensor::zeros({3, 4})}});
    auto td = TensorDict::from_dict({{"a", Tensor::zeros({3, 4, 5})}, {"b", inner}});
    EXPECT_EQ(td->batch_size(), (Shape{3, 4}));
    EXPECT_EQ(td->get_tensordict("b")->batch_size(), (Shape{3, 4}));

    auto shallow = TensorDict::from_dict({{"a", Tensor::zeros({3, 4, 5})}}, std::nullopt, 1);
    EXPECT_EQ(shallow->batch_size(), (Shape{3}));

    auto tuple_keys = TensorDict::from_dict({{NestedKey{"x", "y"}, Tensor::zeros({2, 3})}});
    EXPECT_EQ(tuple_keys->batch_size(), (Shape{2, 3}));
    EXPECT_TRUE(tuple_keys->has_key(NestedKey{"x", "y"}));

    EXPECT_THROW(TensorDict::from_dict({{"a", Tensor::zeros({3})}}, Shape{3}, 1), ValueError);
    EXPECT_EQ(make_tensordict({{"a", Tensor::zeros({7, 2})}})->batch_size(), (Shape{7, 2}));
}

TEST(TensorDictTest, DeviceCastOnInsert) {
    auto td = std::make_shared<TensorDict>(Shape{2}, Device{"cuda:0"});
    td->set("a", Tensor::zeros({2}));
    EXPECT_EQ(td->get_tensor("a").device(), "cuda:0");

    auto cpu = td->to(Device{"cpu"});
    EXPECT_EQ(cpu->device(), std::optional<Device>{"cpu"});
    EXPECT_EQ(cpu->get_tensor("a").device(), "cpu");
    EXPECT_EQ(td->to(Device{"cuda:0"}), td);
}

TEST(TensorDictTest, NestedKeyAccess) {
    auto td = make_nested();
    EXPECT_TRUE(td->has_key(NestedKey{"n", "m", "d"}));
    EXPECT_FALSE(td->has_key(NestedKey{"n", "zz"}));
    EXPECT_FALSE(td->has_key(NestedKey{"a", "x"}));
    EXPECT_EQ(td->get_tensordict(NestedKey{"n", "m"})->batch_size(), (Shape{4, 5}));
    EXPECT_THROW(td->get(NestedKey{"n", "zz"}), KeyMissingError);
    EXPECT_THROW(td->get(NestedKey{"a", "x"}), ValueError);
    EXPECT_THROW(td->get_tensor("n"), TypeMismatchError);

    Value fallback = Tensor::ones({4, 5});
    EXPECT_TRUE(is_tensor(td->get_or("missing", fallback)));
    td->setdefault("fresh", Tensor::zeros({4, 5}));
    EXPECT_TRUE(td->has_key("fresh"));
}

TEST(TensorDictTest, KeysEnumeration) {
    auto td = make_nested();
    std::vector<NestedKey> top{"a", "n"};
    EXPECT_EQ(td->keys(), top);

    std::vector<NestedKey> all{NestedKey{"a"}, NestedKey{"n"}, NestedKey{"n", "c"},
                               NestedKey{"n", "m"}, NestedKey{"n", "m", "d"}};
    EXPECT_EQ(td->keys(true), all);

    std::vector<NestedKey> leaves{NestedKey{"a"}, NestedKey{"n", "c"}, NestedKey{"n", "m", "d"}};
    EXPECT_EQ(td->keys(true, true), leaves);
    EXPECT_EQ(td->values(true, true).size(), 3u);
    EXPECT_EQ(td->sorted_keys(), (std::vector<std::string>{"a", "n"}));
}

TEST(TensorDictTest, SelectAndExclude) {
    auto td = make_nested();
    auto picked = td->select({NestedKey{"a"}, NestedKey{"n", "c"}});
    std::vector<NestedKey> expected{NestedKey{"a"}, NestedKey{"n", "c"}};
    EXPECT_EQ(picked->keys(true, true), expected);
    EXPECT_TRUE(picked->get_tensor("a").is_same(td->get_tensor("a")));

    EXPECT_THROW(td->select({NestedKey{"zz"}}), KeyMissingError);
    EXPECT_TRUE(td->select({NestedKey{"zz"}}, false, false)->is_empty());

    auto rest = td->exclude({NestedKey{"a"}, NestedKey{"n", "m"}});
    std::vector<NestedKey> remaining{NestedKey{"n", "c"}};
    EXPECT_EQ(rest->keys(true, true), remaining);
    EXPECT_TRUE(td->has_key("a"));

    td->exclude({NestedKey{"a"}}, true);
    EXPECT_FALSE(td->has_key("a"));
    td->select({NestedKey{"n", "c"}}, true);
    EXPECT_EQ(td->keys(true, true), remaining);
}

TEST(TensorDictTest, FlattenUnflattenRoundTrip) {
    auto td = make_nested();
    auto flat = td->flatten_keys(".");
    std::vector<std::string> flat_keys{"a", "n.c", "n.m.d"};
    EXPECT_EQ(flat->atom_keys(), flat_keys);
    EXPECT_TRUE(flat->get_tensor("n.c").is_same(td->get_tensor(NestedKey{"n", "c"})));

    auto back = flat->unflatten_keys(".");
    EXPECT_EQ(back->keys(true), td->keys(true));
    EXPECT_TRUE(back->all_equal(*td));

    auto slashes = td->flatten_keys("/");
    EXPECT_TRUE(slashes->has_key("n/m/d"));
}

TEST(TensorDictTest, FlattenCollisions) {
    auto td = make_nested();
    td->set("n.c", Tensor::zeros({4, 5}));
    EXPECT_THROW(td->flatten_keys("."), KeyCollisionError);

    auto flat = TensorDict::make({{"x", Tensor::zeros({2})}, {"x.y", Tensor::zeros({2})}}, {2});
    EXPECT_THROW(flat->unflatten_keys("."), KeyCollisionError);
}

TEST(TensorDictTest, FlattenInPlace) {
    auto td = make_nested();
    td->flatten_keys(".", true);
    EXPECT_TRUE(td->has_key("n.m.d"));
    EXPECT_FALSE(td->has_key("n"));
    td->unflatten_keys(".", true);
    EXPECT_TRUE(td->has_key(NestedKey{"n", "m", "d"}));
}

TEST(TensorDictTest, RenameKeyAndPop) {
    auto td = make_nested();
    td->rename_key_("a", NestedKey{"n", "z"});
    EXPECT_FALSE(td->has_key("a"));
    EXPECT_TRUE(td->has_key(NestedKey{"n", "z"}));
    EXPECT_THROW(td->rename_key_(NestedKey{"n", "z"}, NestedKey{"n", "c"}, true), KeyCollisionError);

    Value popped = td->pop(NestedKey{"n", "z"});
    EXPECT_EQ(value_shape(popped), (Shape{4, 5, 2}));
    EXPECT_FALSE(td->has_key(NestedKey{"n", "z"}));
    EXPECT_THROW(td->pop("gone"), KeyMissingError);
    Value fallback = Tensor::zeros({4, 5});
    EXPECT_TRUE(is_tensor(td->pop("gone", fallback)));

    td->del_(NestedKey{"n", "m"});
    EXPECT_FALSE(td->has_key(NestedKey{"n", "m"}));
    EXPECT_THROW(td->del_("gone"), KeyMissingError);
}

TEST(TensorDictTest, Names) {
    auto td = TensorDict::make({{"a", Tensor::zeros({3, 4})}}, {3, 4}, std::nullopt, Names{"x", "y"});
    EXPECT_TRUE(td->has_names());
    EXPECT_TRUE(td->names() == (Names{"x", "y"}));
    EXPECT_THROW(td->set_names(Names{"x", "x"}), ValueError);
    EXPECT_THROW(td->set_names(Names{"x"}), ValueError);

    td->set("n", std::make_shared<TensorDict>(Shape{3, 4, 2}));
    EXPECT_TRUE(td->get_tensordict("n")->names() == (Names{"x", "y", std::nullopt}));

    td->rename_(std::map<std::string, std::string>{{"x", "row"}});
    EXPECT_TRUE(td->names() == (Names{"row", "y"}));
    EXPECT_TRUE(td->get_tensordict("n")->names() == (Names{"row", "y", std::nullopt}));
    EXPECT_THROW(td->rename_(std::map<std::string, std::string>{{"nope", "z"}}), ValueError);

    EXPECT_TRUE(td->index({0})->names() == (Names{"y"}));

    auto copy = td->rename(Names{"p", "q"});
    EXPECT_TRUE(copy->names() == (Names{"p", "q"}));
    EXPECT_TRUE(td->names() == (Names{"row", "y"}));
}

TEST(TensorDictTest, RefineNames) {
    auto td = std::make_shared<TensorDict>(Shape{3, 4});
    td->refine_names(Names{"a", "..."});
    EXPECT_TRUE(td->names() == (Names{"a", std::nullopt}));
    td->refine_names(Names{std::nullopt, "b"});
    EXPECT_TRUE(td->names() == (Names{"a", "b"}));
    EXPECT_THROW(td->refine_names(Names{"z", "..."}), ValueError);
}

TEST(TensorDictTest, SetBatchSize) {
    auto td = TensorDict::make({{"key1", Tensor::zeros({4, 5, 1})}}, {4, 5});
    td->set_batch_size({4, 5, 1});
    EXPECT_EQ(td->batch_size(), (Shape{4, 5, 1}));
    EXPECT_EQ(td->names().size(), 3u);
    td->set_batch_size({4});
    EXPECT_EQ(td->batch_dims(), 1);
    EXPECT_THROW(td->set_batch_size({3}), ShapeMismatchError);

    td->lock_();
    EXPECT_THROW(td->set_batch_size({4, 5}), LockedMutationError);
}

TEST(TensorDictTest, SetBatchSizeChecksEveryEntryFirst) {
    auto td = TensorDict::make({{NestedKey{"a", "x"}, Tensor::zeros({4})}, {"b", Tensor::zeros({3})}});
    EXPECT_THROW(td->set_batch_size({4}), ShapeMismatchError);
    EXPECT_EQ(td->batch_size(), (Shape{}));
    EXPECT_EQ(td->get_tensordict("a")->batch_size(), (Shape{}));

    auto deep = TensorDict::make({{NestedKey{"a", "x"}, Tensor::zeros({4})}, {NestedKey{"a", "y"}, Tensor::zeros({3})},
                                  {"b", Tensor::zeros({4})}});
    EXPECT_THROW(deep->set_batch_size({4}), ShapeMismatchError);
    EXPECT_EQ(deep->get_tensordict("a")->batch_size(), (Shape{}));

    td->del_("b");
    td->set_batch_size({4});
    EXPECT_EQ(td->batch_size(), (Shape{4}));
    EXPECT_EQ(td->get_tensordict("a")->batch_size(), (Shape{4}));
}

TEST(TensorDictTest, LockedContainerRejectsStructuralChanges) {
    auto td = make_nested();
    td->lock_();
    EXPECT_THROW(td->set("new", Tensor::zeros({4, 5})), LockedMutationError);
    EXPECT_THROW(td->del_("a"), LockedMutationError);
    EXPECT_THROW(td->set("a", Tensor::zeros({4, 5, 2})), LockedMutationError);
    EXPECT_THROW(td->set(NestedKey{"n", "new"}, Tensor::zeros({4, 5})), LockedMutationError);
    EXPECT_THROW(td->rename_key_("a", "b"), LockedMutationError);

    td->set_("a", Tensor::ones({4, 5, 2}));
    EXPECT_TRUE(td->get_tensor("a").eq(Tensor::ones({4, 5, 2})).all());

    td->unlock_();
    td->set("new", Tensor::zeros({4, 5}));
    EXPECT_TRUE(td->has_key("new"));
}

TEST(TensorDictTest, ApplyAndFill) {
    auto td = make_nested();
    auto wide = td->apply([](const Tensor& t) { return t.to(DType::Float64); });
    for (const auto& key : wide->keys(true, true))
        EXPECT_EQ(wide->get_tensor(key).dtype(), DType::Float64);
    EXPECT_EQ(td->get_tensor("a").dtype(), DType::Float32);

    auto flat = TensorDict::make({{"a", Tensor::zeros({4, 5, 2})}}, {4, 5});
    auto reduced = flat->apply([](const Tensor& t) { return t.select(1, 0); }, Shape{4});
    EXPECT_EQ(reduced->batch_size(), (Shape{4}));
    EXPECT_EQ(reduced->get_tensor("a").shape(), (Shape{4, 2}));

    td->fill_("a", 3.0);
    EXPECT_EQ(td->get_tensor("a").at<float>({1, 1, 1}), 3.0f);
    td->zero_();
    EXPECT_EQ(td->get_tensor(NestedKey{"n", "c"}).at<float>({0, 0}), 0.0f);

    td->apply_([](const Tensor& t) {
        Tensor out = t.clone();
        out.fill_(2.0);
        return out;
    });
    EXPECT_EQ(td->get_tensor(NestedKey{"n", "m", "d"}).at<std::int64_t>({0, 0, 0}), 2);
}

TEST(TensorDictTest, MaskedFill) {
    auto td = TensorDict::make({{"a", Tensor::zeros({3, 2})}}, {3});
    auto mask = Tensor::from_vector<bool>({true, false, true});
    auto filled = td->masked_fill(mask, 1.0);
    EXPECT_EQ(filled->get_tensor("a").to_vector<float>(), (std::vector<float>{1, 1, 0, 0, 1, 1}));
    EXPECT_EQ(td->get_tensor("a").to_vector<float>(), (std::vector<float>{0, 0, 0, 0, 0, 0}));

    td->masked_fill_(mask, -1.0);
    EXPECT_EQ(td->get_tensor("a").at<float>({2, 1}), -1.0f);
    EXPECT_THROW(td->masked_fill_(Tensor::ones({3}), 0.0), TypeMismatchError);
}

TEST(TensorDictTest, IndexingAndUnbind) {
    auto td = make_nested();
    auto row = td->index({1});
    EXPECT_EQ(row->batch_size(), (Shape{5}));
    EXPECT_EQ(row->get_tensor("a").shape(), (Shape{5, 2}));
    EXPECT_EQ(row->get_tensordict("n")->batch_size(), (Shape{5}));

    auto sliced = td->index({Slice{0, 2}, ellipsis});
    EXPECT_EQ(sliced->batch_size(), (Shape{2, 5}));

    auto mask = Tensor::from_vector<bool>({true, false, true, true});
    auto masked = td->index({mask});
    EXPECT_EQ(masked->batch_size(), (Shape{3, 5}));
    EXPECT_EQ(masked->get_tensor(NestedKey{"n", "m", "d"}).shape(), (Shape{3, 5, 3}));

    auto parts = td->unbind(1);
    ASSERT_EQ(parts.size(), 5u);
    EXPECT_EQ(parts[0]->batch_size(), (Shape{4}));
}

TEST(TensorDictTest, SplitAndChunk) {
    auto td = TensorDict::make({{"a", Tensor::arange(5)}}, {5});
    auto pieces = td->split(2);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces[2]->batch_size(), (Shape{1}));
    EXPECT_EQ(pieces[2]->get_tensor("a").item<std::int64_t>(), 4);

    auto sized = td->split(std::vector<std::int64_t>{1, 4});
    EXPECT_EQ(sized[1]->batch_size(), (Shape{4}));
    EXPECT_THROW(td->split(std::vector<std::int64_t>{2, 2}), ValueError);

    auto chunks = td->chunk(2);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0]->batch_size(), (Shape{3}));
    EXPECT_EQ(chunks[1]->batch_size(), (Shape{2}));
}

TEST(TensorDictTest, ExpandAndReshape) {
    auto td = TensorDict::make({{"a", Tensor::zeros({3, 2})}}, {3});
    auto big = td->expand({4, 3});
    EXPECT_EQ(big->batch_size(), (Shape{4, 3}));
    EXPECT_EQ(big->get_tensor("a").shape(), (Shape{4, 3, 2}));
    EXPECT_THROW(td->expand(Shape{}), ShapeMismatchError);

    auto col = td->reshape({3, 1});
    EXPECT_EQ(col->get_tensor("a").shape(), (Shape{3, 1, 2}));
}

TEST(TensorDictTest, UpdateAndClone) {
    auto td = make_nested();
    auto other = TensorDict::make({}, {4, 5});
    other->set(NestedKey{"n", "extra"}, Tensor::ones({4, 5}));
    other->set("b", Tensor::ones({4, 5}));
    td->update(*other);
    EXPECT_TRUE(td->has_key(NestedKey{"n", "extra"}));
    EXPECT_TRUE(td->has_key(NestedKey{"n", "c"}));
    EXPECT_TRUE(td->has_key("b"));

    auto copy = td->clone();
    EXPECT_TRUE(copy->all_equal(*td));
    EXPECT_FALSE(copy->get_tensor("a").is_same(td->get_tensor("a")));
    auto shallow = td->clone(false);
    EXPECT_TRUE(shallow->get_tensor("a").is_same(td->get_tensor("a")));

    copy->fill_("a", 5.0);
    EXPECT_FALSE(copy->all_equal(*td));
    EXPECT_EQ(td->empty()->keys().size(), 0u);
    EXPECT_TRUE(td->empty(true)->has_key(NestedKey{"n", "m"}));
}

TEST(TensorDictTest, AssignAtWritesRows) {
    auto td = TensorDict::make({{"a", Tensor::zeros({3, 2})}}, {3});
    auto row = TensorDict::make({{"a", Tensor::ones({2})}, {"b", Tensor::ones({})}}, {});
    td->assign_at({1}, *row);
    EXPECT_EQ(td->get_tensor("a").to_vector<float>(), (std::vector<float>{0, 0, 1, 1, 0, 0}));
    ASSERT_TRUE(td->has_key("b"));
    EXPECT_EQ(td->get_tensor("b").to_vector<float>(), (std::vector<float>{0, 1, 0}));
}

TEST(TensorDictTest, CatAlongBatchDim) {
    auto a = TensorDict::make({{"x", Tensor::zeros({2, 3})}}, {2});
    auto b = TensorDict::make({{"x", Tensor::ones({3, 3})}}, {3});
    auto both = cat({a, b}, 0);
    EXPECT_EQ(both->batch_size(), (Shape{5}));
    EXPECT_EQ(both->get_tensor("x").at<float>({4, 2}), 1.0f);

    auto wrong = TensorDict::make({{"x", Tensor::zeros({2, 3})}}, {2, 3});
    EXPECT_THROW(cat({a, wrong}, 0), BatchSizeMismatchError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
