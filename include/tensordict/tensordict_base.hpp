#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "tensordict/index.hpp"
#include "tensordict/keys.hpp"
#include "tensordict/tensor.hpp"

namespace tensordict {

class TensorDictBase;

using TensorDictPtr = std::shared_ptr<TensorDictBase>;
/// An entry is either a leaf tensor or a nested container.
using Value = std::variant<Tensor, TensorDictPtr>;
using Item = std::pair<NestedKey, Value>;
/// One optional label per batch dimension.
using Names = std::vector<std::optional<std::string>>;
using LockIds = std::set<std::uint64_t>;

inline bool is_tensor(const Value& v) { return std::holds_alternative<Tensor>(v); }
inline bool is_tensordict(const Value& v) { return std::holds_alternative<TensorDictPtr>(v); }

/// Shape of a leaf or batch size of a nested container.
Shape value_shape(const Value& v);

std::string names_to_string(const Names& names);

/// Throws KeyMissingError for @p key, listing the keys of @p td.
[[noreturn]] void throw_key_missing(const TensorDictBase& td, const std::string& key);

/**
 * @brief Results memoized while a container is locked.
 *
 * The cache belongs to a single container instance. It is only consulted
 * while that instance is locked and is dropped whenever the lock generation
 * of the container (or of the storage it views) moves.
 */
struct EnumerationCache {
    std::map<std::pair<bool, bool>, std::vector<NestedKey>> keys{};
    std::optional<std::vector<std::string>> sorted_keys{};
    std::map<std::string, TensorDictPtr> flattened{};
    std::map<std::string, TensorDictPtr> unflattened{};
};

// ---------------------------------------------------------------------------
// TensorDictBase
// ---------------------------------------------------------------------------
// Common interface of every container variant: the plain TensorDict, the
// lazily evaluated view proxies (permute, transpose, squeeze, unsqueeze, view
// and index), the stacked composite, the sub-view and the file-backed
// persistent container.
//
// Each variant implements a handful of single-atom primitives (get_atom,
// set_atom, del_atom, ...) and the shape/lock hooks. Everything else (nested
// key paths, flatten/unflatten, select/exclude, update, apply, split ...) is
// written once here on top of those primitives so that a write through any
// variant is routed to the storage that actually owns the leaf.
//
// Containers are always owned through std::shared_ptr; transformations that
// can return the receiver itself (identity permutations, inverse views) rely
// on shared_from_this().
// ---------------------------------------------------------------------------

class TensorDictBase : public std::enable_shared_from_this<TensorDictBase> {
  public:
    virtual ~TensorDictBase();
    TensorDictBase(const TensorDictBase&) = delete;
    TensorDictBase& operator=(const TensorDictBase&) = delete;

    /// Unique identifier used as lock owner id.
    std::uint64_t id() const { return id_; }
    virtual std::string type_name() const = 0;

    // -- batch size, device and names ---------------------------------------
    virtual Shape batch_size() const = 0;
    virtual void set_batch_size(const Shape& batch_size) = 0;
    std::int64_t batch_dims() const { return static_cast<std::int64_t>(batch_size().size()); }
    std::int64_t ndim() const { return batch_dims(); }
    std::int64_t numel() const { return shape_numel(batch_size()); }
    virtual std::optional<Device> device() const = 0;
    virtual Names names() const = 0;
    virtual void set_names(const Names& names) = 0;
    bool has_names() const;
    /// Positional rename; same as set_names().
    TensorDictBase& rename_(const Names& names);
    /// Rename selected dimensions, keyed by their current name.
    TensorDictBase& rename_(const std::map<std::string, std::string>& mapping);
    /// Shallow copy carrying new names.
    TensorDictPtr rename(const Names& names);
    /**
     * @brief Fill in missing names, checking the ones already present.
     *
     * An entry equal to "..." matches any number of dimensions, which keep
     * their current names.
     */
    TensorDictBase& refine_names(const Names& names);

    // -- single atom primitives -----------------------------------------------
    // These operate on one level of the tree and are what every variant has to
    // provide. Nested key handling is built on top of them.
    virtual Value get_atom(const std::string& key) const = 0;
    virtual bool has_atom(const std::string& key) const = 0;
    virtual std::vector<std::string> atom_keys() const = 0;
    virtual bool atom_is_tensordict(const std::string& key) const;
    virtual void set_atom(const std::string& key, Value value, bool inplace) = 0;
    /// Write @p value into the entry at @p index (read-modify-write by default).
    virtual void set_atom_at(const std::string& key, const Value& value, const Index& index);
    virtual void del_atom(const std::string& key) = 0;
    /// Create an empty nested container at @p key with this batch size.
    virtual TensorDictPtr create_nested(const std::string& key);

    // -- key path access ------------------------------------------------------
    Value get(const NestedKey& key) const;
    Value get_or(const NestedKey& key, const Value& default_value) const;
    Tensor get_tensor(const NestedKey& key) const;
    TensorDictPtr get_tensordict(const NestedKey& key) const;
    bool has_key(const NestedKey& key) const;
    /**
     * @brief Insert or replace an entry.
     *
     * With @p inplace the value of an existing leaf is copied into the
     * current storage instead of replacing it. Intermediate containers of a
     * nested key are created as needed.
     */
    TensorDictBase& set(const NestedKey& key, Value value, bool inplace = false);
    /// In-place update of an existing entry. Allowed on locked containers.
    TensorDictBase& set_(const NestedKey& key, Value value);
    TensorDictBase& set_at_(const NestedKey& key, const Value& value, const Index& index);
    /// Subscript style assignment (`td[key] = value`).
    virtual TensorDictBase& assign(const NestedKey& key, Value value);
    /// Write @p other at @p index (`td[index] = other`), creating missing keys.
    TensorDictBase& assign_at(const Index& index, const TensorDictBase& other);
    Value setdefault(const NestedKey& key, Value default_value);
    TensorDictBase& del_(const NestedKey& key);
    Value pop(const NestedKey& key);
    Value pop(const NestedKey& key, const Value& default_value);
    TensorDictBase& rename_key_(const NestedKey& old_key, const NestedKey& new_key, bool safe = false);

    // -- enumeration ----------------------------------------------------------
    std::vector<NestedKey> keys(bool include_nested = false, bool leaves_only = false) const;
    std::vector<Value> values(bool include_nested = false, bool leaves_only = false) const;
    std::vector<Item> items(bool include_nested = false, bool leaves_only = false) const;
    std::vector<std::string> sorted_keys() const;

    // -- structure ------------------------------------------------------------
    virtual TensorDictPtr select(const std::vector<NestedKey>& keys, bool inplace = false,
                                 bool strict = true);
    virtual TensorDictPtr exclude(const std::vector<NestedKey>& keys, bool inplace = false);
    TensorDictPtr flatten_keys(const std::string& separator = ".", bool inplace = false);
    TensorDictPtr unflatten_keys(const std::string& separator = ".", bool inplace = false);
    virtual TensorDictPtr empty(bool recurse = false) const;
    TensorDictBase& update(const TensorDictBase& other, bool inplace = false);
    TensorDictBase& update_(const TensorDictBase& other);
    TensorDictBase& update_at_(const TensorDictBase& other, const Index& index);
    TensorDictPtr apply(const std::function<Tensor(const Tensor&)>& fn,
                        std::optional<Shape> batch_size = std::nullopt) const;
    TensorDictBase& apply_(const std::function<Tensor(const Tensor&)>& fn);
    TensorDictBase& fill_(const NestedKey& key, double value);
    TensorDictBase& zero_();
    TensorDictBase& masked_fill_(const Tensor& mask, double value);
    TensorDictPtr masked_fill(const Tensor& mask, double value) const;
    virtual TensorDictPtr clone(bool recurse = true) const;
    /// Plain TensorDict holding copies of every leaf.
    virtual TensorDictPtr to_tensordict() const;
    virtual TensorDictPtr contiguous() const;
    virtual TensorDictPtr to(const Device& device) const;
    bool is_empty() const;
    /// Same keys, and element-wise equal leaves.
    bool all_equal(const TensorDictBase& other) const;
    bool all_close(const TensorDictBase& other, double rtol = 1e-5, double atol = 1e-8) const;

    // -- shape algebra --------------------------------------------------------
    virtual TensorDictPtr index(const Index& index);
    /// Index proxy evaluated on access, writing through to this container.
    TensorDictPtr lazy_index(const Index& index);
    virtual TensorDictPtr permute(const std::vector<std::int64_t>& dims);
    virtual TensorDictPtr transpose(std::int64_t dim0, std::int64_t dim1);
    virtual TensorDictPtr squeeze(std::optional<std::int64_t> dim = std::nullopt);
    virtual TensorDictPtr unsqueeze(std::int64_t dim);
    virtual TensorDictPtr view(const Shape& shape);
    TensorDictPtr reshape(const Shape& shape) const;
    TensorDictPtr expand(const Shape& shape) const;
    virtual std::vector<TensorDictPtr> unbind(std::int64_t dim);
    std::vector<TensorDictPtr> split(std::int64_t split_size, std::int64_t dim = 0);
    std::vector<TensorDictPtr> split(const std::vector<std::int64_t>& sizes, std::int64_t dim = 0);
    std::vector<TensorDictPtr> chunk(std::int64_t chunks, std::int64_t dim = 0);
    virtual TensorDictPtr get_sub_tensordict(const Index& index);

    // -- lock graph -----------------------------------------------------------
    virtual bool is_locked() const { return is_locked_; }
    /// Ids of the locked ancestors currently holding this container.
    virtual LockIds lock_ids() const { return lock_ids_; }
    virtual TensorDictBase& lock_();
    virtual TensorDictBase& unlock_();
    /// Mark locked and register @p ids as owners, recursing into children.
    virtual void propagate_lock(const LockIds& ids);
    /// Undo propagate_lock(). Callers run collect_unlock() first.
    virtual void propagate_unlock(const LockIds& ids);
    /// Drop owner @p id from this container and the children it locked.
    virtual void remove_lock(std::uint64_t id);
    /**
     * @brief Dry run of propagate_unlock().
     *
     * Records in @p released, for every container the unlock would reach,
     * the owner ids it would drop. Nothing is modified.
     */
    virtual void collect_unlock(const LockIds& ids,
                                std::map<const TensorDictBase*, LockIds>& released) const;
    /// Bumped on every unlock of this container or of the storage it reads.
    virtual std::uint64_t lock_generation() const { return lock_generation_; }

    // -- persistence ----------------------------------------------------------
    /**
     * @brief Move every leaf to file backed storage.
     *
     * Leaves are written under @p prefix (one file per leaf, one directory per
     * nested container, plus a `meta` sidecar), or to temporary files when no
     * prefix is given. The container is locked afterwards.
     */
    virtual TensorDictBase& memmap_(const std::optional<std::string>& prefix = std::nullopt,
                                    bool copy_existing = false) = 0;
    /// Throws what memmap_(@p prefix, @p copy_existing) would throw, before
    /// any file or leaf is touched.
    virtual void check_memmap(const std::optional<std::string>& prefix, bool copy_existing) const = 0;
    /// Memmapped copy of this container.
    TensorDictPtr memmap(const std::optional<std::string>& prefix = std::nullopt) const;
    /// Memmapped container with the same structure and zero filled leaves.
    TensorDictPtr memmap_like(const std::optional<std::string>& prefix = std::nullopt) const;
    virtual TensorDictBase& share_memory_() = 0;
    virtual bool is_memmap() const = 0;
    virtual bool is_shared() const = 0;

  protected:
    TensorDictBase();

    /// Throws LockedMutationError when the container is locked.
    void check_unlocked() const;
    /// Throws ShapeMismatchError unless @p value carries the batch prefix.
    void check_batch_prefix(const std::string& key, const Value& value) const;
    /// Cache usable by this call, or nullptr when results must not be memoized.
    EnumerationCache* cache() const;
    void erase_cache() const { cache_.reset(); }
    /// Whether memoized enumeration results are currently valid.
    virtual bool cache_valid() const { return is_locked(); }
    /// Shared access helper for const methods that need to hand out `this`.
    TensorDictPtr self() const;

    std::vector<NestedKey> compute_keys(bool include_nested, bool leaves_only) const;
    TensorDictPtr flatten_keys_impl(const std::string& separator) const;
    TensorDictPtr unflatten_keys_impl(const std::string& separator) const;

    bool is_locked_{false};
    LockIds lock_ids_{};
    std::vector<TensorDictPtr> locked_children_{};
    std::uint64_t lock_generation_{0};

  private:
    std::uint64_t id_{0};
    mutable std::unique_ptr<EnumerationCache> cache_{};
    mutable std::uint64_t cache_generation_{0};
};

/// Message used whenever a locked container rejects a structural change.
extern const char* const kLockedMessage;
/// Message used when a derived container is asked to change its batch size.
extern const char* const kLazyBatchSizeMessage;

} // namespace tensordict
