#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tensordict/serialization.hpp"
#include "tensordict/tensordict_base.hpp"

namespace tensordict {

// ---------------------------------------------------------------------------
// PersistentTensorDict
// ---------------------------------------------------------------------------
// Container whose entries live in a memmap directory rather than in memory.
// Every read maps the leaf file again, every structural write updates the
// files and rewrites the `meta` sidecar, so the directory stays loadable
// with load_memmap() at all times. The directory is the owner of the data:
// locking, selecting and converting in place are refused.
// ---------------------------------------------------------------------------

class PersistentTensorDict : public TensorDictBase {
  public:
    PersistentTensorDict(std::filesystem::path dir, ContainerMeta meta);

    /// Open the container stored under @p path.
    static std::shared_ptr<PersistentTensorDict> open(const std::string& path);
    /// Create an empty container under @p path. Fails if @p path already holds one.
    static std::shared_ptr<PersistentTensorDict> create(const std::string& path, Shape batch_size,
                                                        std::optional<Device> device = std::nullopt);

    std::string type_name() const override { return "PersistentTensorDict"; }
    const std::filesystem::path& directory() const { return dir_; }

    Shape batch_size() const override { return meta_.batch_size; }
    void set_batch_size(const Shape& batch_size) override;
    std::optional<Device> device() const override { return meta_.device; }
    Names names() const override { return meta_.names; }
    void set_names(const Names& names) override;

    Value get_atom(const std::string& key) const override;
    bool has_atom(const std::string& key) const override { return find(key) != nullptr; }
    std::vector<std::string> atom_keys() const override;
    bool atom_is_tensordict(const std::string& key) const override;
    void set_atom(const std::string& key, Value value, bool inplace) override;
    void del_atom(const std::string& key) override;

    TensorDictPtr select(const std::vector<NestedKey>& keys, bool inplace = false,
                         bool strict = true) override;
    TensorDictPtr exclude(const std::vector<NestedKey>& keys, bool inplace = false) override;

    TensorDictBase& lock_() override;
    TensorDictBase& unlock_() override;
    void propagate_lock(const LockIds&) override {}
    void propagate_unlock(const LockIds&) override {}
    void remove_lock(std::uint64_t) override {}
    void collect_unlock(const LockIds&, std::map<const TensorDictBase*, LockIds>&) const override {}

    TensorDictBase& memmap_(const std::optional<std::string>& prefix = std::nullopt,
                            bool copy_existing = false) override;
    void check_memmap(const std::optional<std::string>& prefix, bool copy_existing) const override;
    TensorDictBase& share_memory_() override;
    bool is_memmap() const override { return true; }
    bool is_shared() const override { return false; }

  protected:
    bool cache_valid() const override { return false; }

  private:
    const EntryMeta* find(const std::string& key) const;
    /// Remove the files of @p key and its sidecar entry.
    void erase_entry(const std::string& key);
    void flush() const;

    std::filesystem::path dir_;
    ContainerMeta meta_;
};

} // namespace tensordict
