#include "tensordict/sub_tensordict.hpp"

#include <fmt/format.h>

#include "tensordict/errors.hpp"
#include "tensordict/tensordict.hpp"

namespace tensordict {

SubTensorDict::SubTensorDict(TensorDictPtr source, Index index) : source_{std::move(source)} {
    if (!source_)
        throw ValueError("a sub-tensordict needs a parent tensordict");
    auto* parent_sub = dynamic_cast<SubTensorDict*>(source_.get());
    root_ = parent_sub ? parent_sub->get_root_tensordict() : source_;
    index_ = expand_ellipsis(index, source_->batch_dims());
    batch_size_ = indexed_shape(source_->batch_size(), index_);
}

void SubTensorDict::set_batch_size(const Shape&) {
    throw UnsupportedOperationError(kLazyBatchSizeMessage);
}

Names SubTensorDict::names() const { return indexed_names(source_->names(), index_); }

void SubTensorDict::set_names(const Names&) {
    throw UnsupportedOperationError("Names of a subtensordict cannot be modified. Instantiate it first.");
}

Value SubTensorDict::get_atom(const std::string& key) const {
    Value v = source_->get_atom(key);
    if (is_tensordict(v))
        return std::get<TensorDictPtr>(v)->get_sub_tensordict(index_);
    return std::get<Tensor>(v).index(index_);
}

void SubTensorDict::set_atom(const std::string& key, Value value, bool inplace) {
    check_batch_prefix(key, value);
    const bool exists = source_->has_atom(key);
    if (exists && !inplace)
        throw UnsupportedOperationError(fmt::format(
            "Calling `SubTensorDict.set(key, value, inplace=False)` is prohibited for existing "
            "tensors (key '{}'). Consider calling `SubTensorDict.set_(...)` or cloning your "
            "tensordict first.",
            key));
    if (!exists) {
        Shape full = source_->batch_size();
        const Shape vs = value_shape(value);
        full.insert(full.end(), vs.begin() + static_cast<std::ptrdiff_t>(batch_size_.size()), vs.end());
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
    std::get<TensorDictPtr>(source_->get_atom(key))->assign_at(index_, *std::get<TensorDictPtr>(value));
}

TensorDictPtr SubTensorDict::create_nested(const std::string& key) {
    return source_->create_nested(key)->get_sub_tensordict(index_);
}

TensorDictBase& SubTensorDict::assign(const NestedKey& key, Value value) {
    return set(key, std::move(value), has_key(key));
}

TensorDictPtr SubTensorDict::clone(bool recurse) const {
    if (recurse)
        return to_tensordict();
    return std::make_shared<SubTensorDict>(source_, index_);
}

TensorDictBase& SubTensorDict::lock_() {
    throw UnsupportedOperationError("Cannot lock a SubTensorDict. Lock the parent tensordict instead.");
}

TensorDictBase& SubTensorDict::unlock_() {
    if (is_locked())
        throw UnsupportedOperationError(
            "Cannot unlock a SubTensorDict. Unlock the parent tensordict instead.");
    return *this;
}

TensorDictBase& SubTensorDict::memmap_(const std::optional<std::string>& prefix, bool copy_existing) {
    check_memmap(prefix, copy_existing);
    return *this;
}

void SubTensorDict::check_memmap(const std::optional<std::string>&, bool) const {
    throw UnsupportedOperationError("Converting a sub-tensordict values to memmap cannot be done.");
}

TensorDictBase& SubTensorDict::share_memory_() {
    throw UnsupportedOperationError(
        "Casting a sub-tensordict values to shared memory cannot be done.");
}

} // namespace tensordict
