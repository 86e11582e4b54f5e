#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tensordict/tensordict_base.hpp"

namespace tensordict {

// ---------------------------------------------------------------------------
// LazyStackedTensorDict
// ---------------------------------------------------------------------------
// Logical stack of sibling containers along a new batch dimension. The
// siblings are kept as they are: reading a leaf stacks the siblings' leaves
// into a fresh tensor, reading a nested container returns another lazy stack
// and writing splits the value along the stack dimension into the siblings.
//
// The visible key set is the intersection of the siblings' keys. It is
// computed on construction and refreshed when a key that is not currently
// visible is queried, so a key that became common to all siblings shows up
// after its first lookup.
// ---------------------------------------------------------------------------

class LazyStackedTensorDict : public TensorDictBase {
  public:
    LazyStackedTensorDict(std::vector<TensorDictPtr> tensordicts, std::int64_t stack_dim = 0);
    ~LazyStackedTensorDict() override;

    static std::shared_ptr<LazyStackedTensorDict> make(std::vector<TensorDictPtr> tensordicts,
                                                       std::int64_t stack_dim = 0);

    std::string type_name() const override { return "LazyStackedTensorDict"; }
    const std::vector<TensorDictPtr>& tensordicts() const { return tensordicts_; }
    std::int64_t stack_dim() const { return stack_dim_; }
    std::size_t size() const { return tensordicts_.size(); }
    /// Identity membership of @p td among the siblings.
    bool contains(const TensorDictPtr& td) const;

    /// Insert a sibling at @p index. Rejects leaves, mismatched siblings and locked stacks.
    void insert(std::int64_t index, const Value& item);
    void append(const Value& item);
    /// Per-sibling leaves for @p key; only valid when stacking along dimension 0.
    std::vector<Tensor> get_nestedtensor(const NestedKey& key) const;
    /// Recompute the visible key set from the siblings.
    void update_valid_keys();

    Shape batch_size() const override;
    void set_batch_size(const Shape& batch_size) override;
    std::optional<Device> device() const override;
    Names names() const override;
    void set_names(const Names& names) override;

    Value get_atom(const std::string& key) const override;
    bool has_atom(const std::string& key) const override;
    std::vector<std::string> atom_keys() const override { return valid_keys_; }
    bool atom_is_tensordict(const std::string& key) const override;
    void set_atom(const std::string& key, Value value, bool inplace) override;
    void del_atom(const std::string& key) override;
    TensorDictPtr create_nested(const std::string& key) override;

    TensorDictPtr select(const std::vector<NestedKey>& keys, bool inplace = false,
                         bool strict = true) override;
    TensorDictPtr exclude(const std::vector<NestedKey>& keys, bool inplace = false) override;
    TensorDictPtr empty(bool recurse = false) const override;
    TensorDictPtr clone(bool recurse = true) const override;
    TensorDictPtr to(const Device& device) const override;

    TensorDictPtr index(const Index& index) override;
    std::vector<TensorDictPtr> unbind(std::int64_t dim) override;

    bool is_locked() const override;
    LockIds lock_ids() const override;
    void propagate_lock(const LockIds& ids) override;
    void propagate_unlock(const LockIds& ids) override;
    void remove_lock(std::uint64_t id) override;
    void collect_unlock(const LockIds& ids,
                        std::map<const TensorDictBase*, LockIds>& released) const override;
    std::uint64_t lock_generation() const override;

    TensorDictBase& memmap_(const std::optional<std::string>& prefix = std::nullopt,
                            bool copy_existing = false) override;
    void check_memmap(const std::optional<std::string>& prefix, bool copy_existing) const override;
    TensorDictBase& share_memory_() override;
    bool is_memmap() const override;
    bool is_shared() const override;

  protected:
    bool cache_valid() const override { return explicit_lock_.value_or(false); }

  private:
    /// Throws unless @p td can join this stack.
    void check_sibling(const TensorDictBase& td) const;
    /// Stack of @p children sharing this stack's dim name.
    std::shared_ptr<LazyStackedTensorDict> restack(std::vector<TensorDictPtr> children,
                                                   std::int64_t stack_dim) const;

    std::vector<TensorDictPtr> tensordicts_;
    std::int64_t stack_dim_;
    std::optional<bool> explicit_lock_{};
    mutable std::vector<std::string> valid_keys_{};
    std::optional<std::string> stack_dim_name_{};
};

/// Lazily stack @p tensordicts along a new dimension @p dim.
std::shared_ptr<LazyStackedTensorDict> stack(const std::vector<TensorDictPtr>& tensordicts,
                                             std::int64_t dim = 0);

/// Stack @p tensordicts along a new dimension into a plain TensorDict.
TensorDictPtr dense_stack(const std::vector<TensorDictPtr>& tensordicts, std::int64_t dim = 0);

/// Concatenate @p tensordicts along an existing batch dimension.
TensorDictPtr cat(const std::vector<TensorDictPtr>& tensordicts, std::int64_t dim = 0);

} // namespace tensordict
