#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tensordict/tensordict_base.hpp"

namespace tensordict {

/**
 * @brief Write-through view of a parent container at a fixed index.
 *
 * Reads return `parent.get(key)[index]`. In-place writes (set_, fill_,
 * zero_, update_) land in the parent's storage. Replacing an existing entry
 * is refused since the parent owns the full sized leaf; a brand new key is
 * created in the parent as a zero filled leaf before the slice is written.
 * A sub-view cannot be locked directly; it reports its parent's lock state
 * and a locked container holding it locks that parent.
 */
class SubTensorDict : public TensorDictBase {
  public:
    SubTensorDict(TensorDictPtr source, Index index);

    std::string type_name() const override { return "SubTensorDict"; }
    /// The container this sub-view was created from (never copied).
    const TensorDictPtr& get_parent_tensordict() const { return source_; }
    /// First ancestor that is not itself a sub-view.
    const TensorDictPtr& get_root_tensordict() const { return root_; }
    const Index& index_spec() const { return index_; }

    Shape batch_size() const override { return batch_size_; }
    void set_batch_size(const Shape& batch_size) override;
    std::optional<Device> device() const override { return source_->device(); }
    Names names() const override;
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

    TensorDictBase& assign(const NestedKey& key, Value value) override;
    TensorDictPtr clone(bool recurse = true) const override;

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

  private:
    TensorDictPtr source_;
    TensorDictPtr root_;
    Index index_;
    Shape batch_size_;
};

} // namespace tensordict
