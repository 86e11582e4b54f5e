#include "tensordict/custom_op.hpp"

#include <algorithm>
#include <numeric>

#include <fmt/format.h>

#include "tensordict/errors.hpp"
#include "tensordict/tensordict.hpp"

namespace tensordict {

namespace {

std::vector<std::int64_t> argsort(const std::vector<std::int64_t>& dims) {
    std::vector<std::int64_t> out(dims.size());
    for (std::size_t i = 0; i < dims.size(); ++i)
        out[static_cast<std::size_t>(dims[i])] = static_cast<std::int64_t>(i);
    return out;
}

/// @p head followed by the dimensions of @p full past @p skip.
Shape with_trailing(Shape head, const Shape& full, std::size_t skip) {
    head.insert(head.end(), full.begin() + static_cast<std::ptrdiff_t>(skip), full.end());
    return head;
}

} // namespace

// ---------------------------------------------------------------------------
// CustomOpTensorDict
// ---------------------------------------------------------------------------

CustomOpTensorDict::CustomOpTensorDict(TensorDictPtr source) : source_{std::move(source)} {
    if (!source_)
        throw ValueError("a lazy tensordict needs a source tensordict");
}

Shape CustomOpTensorDict::batch_size() const { return forward_shape(source_->batch_size()); }

void CustomOpTensorDict::set_batch_size(const Shape&) {
    throw UnsupportedOperationError(kLazyBatchSizeMessage);
}

void CustomOpTensorDict::set_names(const Names&) {
    throw UnsupportedOperationError(
        "Names of a lazy tensordict cannot be modified. Call to_tensordict() first.");
}

Value CustomOpTensorDict::get_atom(const std::string& key) const {
    Value v = source_->get_atom(key);
    if (is_tensordict(v))
        return forward(std::get<TensorDictPtr>(v));
    return forward(std::get<Tensor>(v));
}

void CustomOpTensorDict::set_atom(const std::string& key, Value value, bool inplace) {
    check_batch_prefix(key, value);
    if (is_tensordict(value))
        source_->set_atom(key, inverse(std::get<TensorDictPtr>(value)), inplace);
    else
        source_->set_atom(key, inverse(std::get<Tensor>(value)), inplace);
}

TensorDictPtr CustomOpTensorDict::create_nested(const std::string& key) {
    return forward(source_->create_nested(key));
}

TensorDictPtr CustomOpTensorDict::clone(bool recurse) const {
    if (!recurse)
        return rebind(source_);
    return to_tensordict();
}

TensorDictPtr CustomOpTensorDict::to(const Device& device) const {
    auto moved = source_->to(device);
    if (moved == source_)
        return self();
    return rebind(moved);
}

TensorDictBase& CustomOpTensorDict::lock_() {
    source_->lock_();
    return *this;
}

TensorDictBase& CustomOpTensorDict::unlock_() {
    source_->unlock_();
    return *this;
}

TensorDictBase& CustomOpTensorDict::memmap_(const std::optional<std::string>& prefix, bool copy_existing) {
    check_memmap(prefix, copy_existing);
    return *this;
}

void CustomOpTensorDict::check_memmap(const std::optional<std::string>&, bool) const {
    throw UnsupportedOperationError(fmt::format(
        "Cannot build a memmap TensorDict in-place from a {}. Use memmap() to get a memmapped copy.",
        type_name()));
}

TensorDictBase& CustomOpTensorDict::share_memory_() {
    source_->share_memory_();
    return *this;
}

// ---------------------------------------------------------------------------
// PermutedTensorDict
// ---------------------------------------------------------------------------

PermutedTensorDict::PermutedTensorDict(TensorDictPtr source, std::vector<std::int64_t> dims)
    : CustomOpTensorDict{std::move(source)}, dims_{std::move(dims)}, inverse_dims_{argsort(dims_)} {}

std::vector<std::int64_t> PermutedTensorDict::leaf_dims(const std::vector<std::int64_t>& dims,
                                                       std::int64_t leaf_ndim) const {
    std::vector<std::int64_t> out = dims;
    for (auto d = static_cast<std::int64_t>(dims.size()); d < leaf_ndim; ++d)
        out.push_back(d);
    return out;
}

TensorDictPtr PermutedTensorDict::permute(const std::vector<std::int64_t>& dims) {
    auto result = TensorDictBase::permute(dims);
    auto* permuted = dynamic_cast<PermutedTensorDict*>(result.get());
    if (permuted && permuted->source().get() == this && permuted->dims() == inverse_dims_)
        return source_;
    return result;
}

Shape PermutedTensorDict::forward_shape(const Shape& source_batch) const {
    Shape out;
    out.reserve(dims_.size());
    for (auto d : dims_)
        out.push_back(source_batch[static_cast<std::size_t>(d)]);
    return out;
}

Names PermutedTensorDict::forward_names(const Names& source_names) const {
    Names out;
    out.reserve(dims_.size());
    for (auto d : dims_)
        out.push_back(source_names[static_cast<std::size_t>(d)]);
    return out;
}

Tensor PermutedTensorDict::forward(const Tensor& leaf) const { return leaf.permute(leaf_dims(dims_, leaf.dim())); }

Tensor PermutedTensorDict::inverse(const Tensor& leaf) const {
    return leaf.permute(leaf_dims(inverse_dims_, leaf.dim()));
}

TensorDictPtr PermutedTensorDict::forward(const TensorDictPtr& nested) const {
    return nested->permute(leaf_dims(dims_, nested->batch_dims()));
}

TensorDictPtr PermutedTensorDict::inverse(const TensorDictPtr& nested) const {
    return nested->permute(leaf_dims(inverse_dims_, nested->batch_dims()));
}

TensorDictPtr PermutedTensorDict::rebind(const TensorDictPtr& source) const {
    return std::make_shared<PermutedTensorDict>(source, dims_);
}

// ---------------------------------------------------------------------------
// TransposedTensorDict
// ---------------------------------------------------------------------------

TransposedTensorDict::TransposedTensorDict(TensorDictPtr source, std::int64_t dim0, std::int64_t dim1)
    : CustomOpTensorDict{std::move(source)}, dim0_{dim0}, dim1_{dim1} {}

TensorDictPtr TransposedTensorDict::transpose(std::int64_t dim0, std::int64_t dim1) {
    const auto a = normalize_dim(dim0, batch_dims());
    const auto b = normalize_dim(dim1, batch_dims());
    if ((a == dim0_ && b == dim1_) || (a == dim1_ && b == dim0_))
        return source_;
    return TensorDictBase::transpose(a, b);
}

Shape TransposedTensorDict::forward_shape(const Shape& source_batch) const {
    Shape out = source_batch;
    std::swap(out[static_cast<std::size_t>(dim0_)], out[static_cast<std::size_t>(dim1_)]);
    return out;
}

Names TransposedTensorDict::forward_names(const Names& source_names) const {
    Names out = source_names;
    std::swap(out[static_cast<std::size_t>(dim0_)], out[static_cast<std::size_t>(dim1_)]);
    return out;
}

TensorDictPtr TransposedTensorDict::rebind(const TensorDictPtr& source) const {
    return std::make_shared<TransposedTensorDict>(source, dim0_, dim1_);
}

// ---------------------------------------------------------------------------
// SqueezedTensorDict / UnsqueezedTensorDict
// ---------------------------------------------------------------------------

SqueezedTensorDict::SqueezedTensorDict(TensorDictPtr source, std::int64_t dim)
    : CustomOpTensorDict{std::move(source)}, dim_{dim} {}

TensorDictPtr SqueezedTensorDict::unsqueeze(std::int64_t dim) {
    if (normalize_dim(dim, batch_dims() + 1) == dim_)
        return source_;
    return TensorDictBase::unsqueeze(dim);
}

Shape SqueezedTensorDict::forward_shape(const Shape& source_batch) const {
    Shape out = source_batch;
    out.erase(out.begin() + dim_);
    return out;
}

Names SqueezedTensorDict::forward_names(const Names& source_names) const {
    Names out = source_names;
    out.erase(out.begin() + dim_);
    return out;
}

TensorDictPtr SqueezedTensorDict::rebind(const TensorDictPtr& source) const {
    return std::make_shared<SqueezedTensorDict>(source, dim_);
}

UnsqueezedTensorDict::UnsqueezedTensorDict(TensorDictPtr source, std::int64_t dim)
    : CustomOpTensorDict{std::move(source)}, dim_{dim} {}

TensorDictPtr UnsqueezedTensorDict::squeeze(std::optional<std::int64_t> dim) {
    if (dim && normalize_dim(*dim, batch_dims()) == dim_)
        return source_;
    return TensorDictBase::squeeze(dim);
}

Shape UnsqueezedTensorDict::forward_shape(const Shape& source_batch) const {
    Shape out = source_batch;
    out.insert(out.begin() + dim_, 1);
    return out;
}

Names UnsqueezedTensorDict::forward_names(const Names& source_names) const {
    Names out = source_names;
    out.insert(out.begin() + dim_, std::nullopt);
    return out;
}

TensorDictPtr UnsqueezedTensorDict::rebind(const TensorDictPtr& source) const {
    return std::make_shared<UnsqueezedTensorDict>(source, dim_);
}

// ---------------------------------------------------------------------------
// ViewedTensorDict
// ---------------------------------------------------------------------------

ViewedTensorDict::ViewedTensorDict(TensorDictPtr source, Shape shape)
    : CustomOpTensorDict{std::move(source)}, shape_{std::move(shape)} {
    if (shape_numel(shape_) != source_->numel())
        throw ShapeMismatchError(fmt::format("shape {} is invalid for a tensordict of batch size {}",
                                             shape_to_string(shape_), shape_to_string(source_->batch_size())));
}

TensorDictPtr ViewedTensorDict::view(const Shape& shape) {
    const Shape target = infer_view_shape(shape, numel());
    if (target == shape_)
        return self();
    return source_->view(target);
}

Shape ViewedTensorDict::forward_shape(const Shape&) const { return shape_; }

Names ViewedTensorDict::forward_names(const Names&) const { return Names(shape_.size()); }

Tensor ViewedTensorDict::forward(const Tensor& leaf) const {
    return leaf.view(with_trailing(shape_, leaf.shape(), source_->batch_size().size()));
}

Tensor ViewedTensorDict::inverse(const Tensor& leaf) const {
    return leaf.view(with_trailing(source_->batch_size(), leaf.shape(), shape_.size()));
}

TensorDictPtr ViewedTensorDict::forward(const TensorDictPtr& nested) const {
    return nested->view(with_trailing(shape_, nested->batch_size(), source_->batch_size().size()));
}

TensorDictPtr ViewedTensorDict::inverse(const TensorDictPtr& nested) const {
    return nested->view(with_trailing(source_->batch_size(), nested->batch_size(), shape_.size()));
}

TensorDictPtr ViewedTensorDict::rebind(const TensorDictPtr& source) const {
    return std::make_shared<ViewedTensorDict>(source, shape_);
}

// ---------------------------------------------------------------------------
// IndexedTensorDict
// ---------------------------------------------------------------------------

IndexedTensorDict::IndexedTensorDict(TensorDictPtr source, Index index)
    : CustomOpTensorDict{std::move(source)}, index_{expand_ellipsis(index, source_->batch_dims())} {}

void IndexedTensorDict::set_atom(const std::string& key, Value value, bool) {
    check_batch_prefix(key, value);
    const std::size_t ndim = batch_size().size();
    if (!source_->has_atom(key)) {
        const Shape full = with_trailing(source_->batch_size(), value_shape(value), ndim);
        if (is_tensor(value)) {
            const auto& t = std::get<Tensor>(value);
            source_->set_atom(key, Tensor{t.dtype(), full, t.device()}, false);
        } else {
            source_->set_atom(key, std::make_shared<TensorDict>(full, source_->device()), false);
        }
    }
    if (is_tensor(value)) {
        source_->set_atom_at(key, value, index_);
        return;
    }
    auto nested = std::get<TensorDictPtr>(source_->get_atom(key));
    nested->lazy_index(index_)->update(*std::get<TensorDictPtr>(value), true);
}

Shape IndexedTensorDict::forward_shape(const Shape& source_batch) const {
    return indexed_shape(source_batch, index_);
}

Names IndexedTensorDict::forward_names(const Names& source_names) const {
    return indexed_names(source_names, index_);
}

Tensor IndexedTensorDict::inverse(const Tensor&) const {
    throw UnsupportedOperationError("an indexed tensordict cannot map leaves back to its source");
}

TensorDictPtr IndexedTensorDict::inverse(const TensorDictPtr&) const {
    throw UnsupportedOperationError("an indexed tensordict cannot map nested tensordicts back to its source");
}

TensorDictPtr IndexedTensorDict::rebind(const TensorDictPtr& source) const {
    return std::make_shared<IndexedTensorDict>(source, index_);
}

} // namespace tensordict
