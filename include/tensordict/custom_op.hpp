#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tensordict/tensordict_base.hpp"

namespace tensordict {

// ---------------------------------------------------------------------------
// View proxies
// ---------------------------------------------------------------------------
// A view proxy wraps a source container and a shape transform of its batch
// dimensions. Nothing is computed on construction: the batch size is derived
// from the source on every call and leaves are transformed when they are
// read. Writes go through the inverse transform into the source, so the
// proxy never owns storage. Lock state belongs to the source as well, and
// in-place memmap conversion is refused.
//
// Applying the exact inverse of a proxy's transform returns the source
// object itself.
// ---------------------------------------------------------------------------

class CustomOpTensorDict : public TensorDictBase {
  public:
    const TensorDictPtr& source() const { return source_; }

    Shape batch_size() const override;
    void set_batch_size(const Shape& batch_size) override;
    std::optional<Device> device() const override { return source_->device(); }
    Names names() const override { return forward_names(source_->names()); }
    void set_names(const Names& names) override;

    Value get_atom(const std::string& key) const override;
    bool has_atom(const std::string& key) const override { return source_->has_atom(key); }
    std::vector<std::string> atom_keys() const override { return source_->atom_keys(); }
    bool atom_is_tensordict(const std::string& key) const override {
        return source_->atom_is_tensordict(key);
    }
    void set_atom(const std::string& key, Value value, bool inplace) override;
    void del_atom(const std::string& key) override { source_->del_atom(key); }
    TensorDictPtr create_nested(const std::string& key) override;

    /// Without @p recurse, the same transform over the same source.
    TensorDictPtr clone(bool recurse = true) const override;
    TensorDictPtr to(const Device& device) const override;

    bool is_locked() const override { return source_->is_locked(); }
    LockIds lock_ids() const override { return source_->lock_ids(); }
    TensorDictBase& lock_() override;
    TensorDictBase& unlock_() override;
    void propagate_lock(const LockIds& ids) override { source_->propagate_lock(ids); }
    void propagate_unlock(const LockIds& ids) override { source_->propagate_unlock(ids); }
    void remove_lock(std::uint64_t id) override { source_->remove_lock(id); }
    void collect_unlock(const LockIds& ids,
                        std::map<const TensorDictBase*, LockIds>& released) const override {
        source_->collect_unlock(ids, released);
    }
    std::uint64_t lock_generation() const override { return source_->lock_generation(); }

    TensorDictBase& memmap_(const std::optional<std::string>& prefix = std::nullopt,
                            bool copy_existing = false) override;
    void check_memmap(const std::optional<std::string>& prefix, bool copy_existing) const override;
    TensorDictBase& share_memory_() override;
    bool is_memmap() const override { return source_->is_memmap(); }
    bool is_shared() const override { return source_->is_shared(); }

    /// Batch size of a view over a source of batch size @p source_batch.
    virtual Shape forward_shape(const Shape& source_batch) const = 0;
    virtual Names forward_names(const Names& source_names) const = 0;
    /// Source leaf to view leaf.
    virtual Tensor forward(const Tensor& leaf) const = 0;
    /// View leaf to source leaf.
    virtual Tensor inverse(const Tensor& leaf) const = 0;
    /// Apply the same transform to a nested source container.
    virtual TensorDictPtr forward(const TensorDictPtr& nested) const = 0;
    virtual TensorDictPtr inverse(const TensorDictPtr& nested) const = 0;
    /// Same transform over a different source.
    virtual TensorDictPtr rebind(const TensorDictPtr& source) const = 0;

  protected:
    explicit CustomOpTensorDict(TensorDictPtr source);

    TensorDictPtr source_;
};

/// Batch dimensions reordered by a permutation.
class PermutedTensorDict : public CustomOpTensorDict {
  public:
    PermutedTensorDict(TensorDictPtr source, std::vector<std::int64_t> dims);
    std::string type_name() const override { return "PermutedTensorDict"; }
    const std::vector<std::int64_t>& dims() const { return dims_; }

    TensorDictPtr permute(const std::vector<std::int64_t>& dims) override;

    Shape forward_shape(const Shape& source_batch) const override;
    Names forward_names(const Names& source_names) const override;
    Tensor forward(const Tensor& leaf) const override;
    Tensor inverse(const Tensor& leaf) const override;
    TensorDictPtr forward(const TensorDictPtr& nested) const override;
    TensorDictPtr inverse(const TensorDictPtr& nested) const override;
    TensorDictPtr rebind(const TensorDictPtr& source) const override;

  private:
    std::vector<std::int64_t> leaf_dims(const std::vector<std::int64_t>& dims,
                                        std::int64_t leaf_ndim) const;

    std::vector<std::int64_t> dims_;
    std::vector<std::int64_t> inverse_dims_;
};

/// Two batch dimensions swapped.
class TransposedTensorDict : public CustomOpTensorDict {
  public:
    TransposedTensorDict(TensorDictPtr source, std::int64_t dim0, std::int64_t dim1);
    std::string type_name() const override { return "TransposedTensorDict"; }

    TensorDictPtr transpose(std::int64_t dim0, std::int64_t dim1) override;

    Shape forward_shape(const Shape& source_batch) const override;
    Names forward_names(const Names& source_names) const override;
    Tensor forward(const Tensor& leaf) const override { return leaf.transpose(dim0_, dim1_); }
    Tensor inverse(const Tensor& leaf) const override { return leaf.transpose(dim0_, dim1_); }
    TensorDictPtr forward(const TensorDictPtr& nested) const override {
        return nested->transpose(dim0_, dim1_);
    }
    TensorDictPtr inverse(const TensorDictPtr& nested) const override {
        return nested->transpose(dim0_, dim1_);
    }
    TensorDictPtr rebind(const TensorDictPtr& source) const override;

  private:
    std::int64_t dim0_;
    std::int64_t dim1_;
};

/// One batch dimension of size one removed.
class SqueezedTensorDict : public CustomOpTensorDict {
  public:
    SqueezedTensorDict(TensorDictPtr source, std::int64_t dim);
    std::string type_name() const override { return "SqueezedTensorDict"; }
    std::int64_t squeezed_dim() const { return dim_; }

    TensorDictPtr unsqueeze(std::int64_t dim) override;

    Shape forward_shape(const Shape& source_batch) const override;
    Names forward_names(const Names& source_names) const override;
    Tensor forward(const Tensor& leaf) const override { return leaf.squeeze(dim_); }
    Tensor inverse(const Tensor& leaf) const override { return leaf.unsqueeze(dim_); }
    TensorDictPtr forward(const TensorDictPtr& nested) const override {
        return nested->squeeze(dim_);
    }
    TensorDictPtr inverse(const TensorDictPtr& nested) const override {
        return nested->unsqueeze(dim_);
    }
    TensorDictPtr rebind(const TensorDictPtr& source) const override;

  private:
    std::int64_t dim_;
};

/// One batch dimension of size one inserted.
class UnsqueezedTensorDict : public CustomOpTensorDict {
  public:
    UnsqueezedTensorDict(TensorDictPtr source, std::int64_t dim);
    std::string type_name() const override { return "UnsqueezedTensorDict"; }
    std::int64_t unsqueezed_dim() const { return dim_; }

    TensorDictPtr squeeze(std::optional<std::int64_t> dim = std::nullopt) override;

    Shape forward_shape(const Shape& source_batch) const override;
    Names forward_names(const Names& source_names) const override;
    Tensor forward(const Tensor& leaf) const override { return leaf.unsqueeze(dim_); }
    Tensor inverse(const Tensor& leaf) const override { return leaf.squeeze(dim_); }
    TensorDictPtr forward(const TensorDictPtr& nested) const override {
        return nested->unsqueeze(dim_);
    }
    TensorDictPtr inverse(const TensorDictPtr& nested) const override {
        return nested->squeeze(dim_);
    }
    TensorDictPtr rebind(const TensorDictPtr& source) const override;

  private:
    std::int64_t dim_;
};

/// Batch dimensions reshaped without copying; leaves must be viewable.
class ViewedTensorDict : public CustomOpTensorDict {
  public:
    ViewedTensorDict(TensorDictPtr source, Shape shape);
    std::string type_name() const override { return "ViewedTensorDict"; }

    TensorDictPtr view(const Shape& shape) override;

    Shape forward_shape(const Shape& source_batch) const override;
    Names forward_names(const Names& source_names) const override;
    Tensor forward(const Tensor& leaf) const override;
    Tensor inverse(const Tensor& leaf) const override;
    TensorDictPtr forward(const TensorDictPtr& nested) const override;
    TensorDictPtr inverse(const TensorDictPtr& nested) const override;
    TensorDictPtr rebind(const TensorDictPtr& source) const override;

  private:
    Shape shape_;
};

/**
 * @brief Lazily indexed view.
 *
 * Writes are scattered into the source at the stored index, creating a zero
 * filled source leaf first when the key is new. The index has no inverse, so
 * writes always land in the existing source storage.
 */
class IndexedTensorDict : public CustomOpTensorDict {
  public:
    IndexedTensorDict(TensorDictPtr source, Index index);
    std::string type_name() const override { return "IndexedTensorDict"; }
    const Index& index_spec() const { return index_; }

    void set_atom(const std::string& key, Value value, bool inplace) override;

    Shape forward_shape(const Shape& source_batch) const override;
    Names forward_names(const Names& source_names) const override;
    Tensor forward(const Tensor& leaf) const override { return leaf.index(index_); }
    Tensor inverse(const Tensor& leaf) const override;
    TensorDictPtr forward(const TensorDictPtr& nested) const override {
        return nested->lazy_index(index_);
    }
    TensorDictPtr inverse(const TensorDictPtr& nested) const override;
    TensorDictPtr rebind(const TensorDictPtr& source) const override;

  private:
    Index index_;
};

} // namespace tensordict
