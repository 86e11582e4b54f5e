#include "tensordict/persistent.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include "tensordict/errors.hpp"
#include "tensordict/log.hpp"
#include "tensordict/memmap.hpp"

namespace fs = std::filesystem;

namespace tensordict {

PersistentTensorDict::PersistentTensorDict(fs::path dir, ContainerMeta meta)
    : dir_{std::move(dir)}, meta_{std::move(meta)} {
    if (meta_.names.empty())
        meta_.names.resize(meta_.batch_size.size());
}

std::shared_ptr<PersistentTensorDict> PersistentTensorDict::open(const std::string& path) {
    ContainerMeta meta = read_meta(path);
    if (meta.type != "TensorDict")
        throw ValueError(fmt::format("expected a TensorDict memmap under {}, found '{}'", path, meta.type));
    return std::make_shared<PersistentTensorDict>(path, std::move(meta));
}

std::shared_ptr<PersistentTensorDict> PersistentTensorDict::create(const std::string& path, Shape batch_size,
                                                                   std::optional<Device> device) {
    if (fs::exists(fs::path{path} / kMetaFile))
        throw ValueError(fmt::format("a memmap tensordict already exists under {}", path));
    ContainerMeta meta;
    meta.batch_size = std::move(batch_size);
    meta.device = std::move(device);
    meta.names.resize(meta.batch_size.size());
    write_meta(path, meta);
    log_info("created persistent tensordict under {}", path);
    return std::make_shared<PersistentTensorDict>(path, std::move(meta));
}

void PersistentTensorDict::set_batch_size(const Shape&) {
    throw UnsupportedOperationError(
        "the batch size of a PersistentTensorDict is fixed by its files. Call to_tensordict() first.");
}

void PersistentTensorDict::set_names(const Names& names) {
    Names next = names.empty() ? Names(meta_.batch_size.size()) : names;
    if (next.size() != meta_.batch_size.size())
        throw ValueError(fmt::format(
            "the length of the dimension names must equate the tensordict batch_dims attribute. "
            "Got {} names for batch_dims {}.",
            next.size(), meta_.batch_size.size()));
    std::set<std::string> seen;
    for (const auto& n : next)
        if (n && !seen.insert(*n).second)
            throw ValueError(fmt::format("Some dimension names are non-unique: {}.", names_to_string(next)));
    meta_.names = std::move(next);
    flush();
}

const EntryMeta* PersistentTensorDict::find(const std::string& key) const {
    auto it = std::find_if(meta_.entries.begin(), meta_.entries.end(),
                           [&](const EntryMeta& e) { return e.key == key; });
    return it == meta_.entries.end() ? nullptr : &*it;
}

std::vector<std::string> PersistentTensorDict::atom_keys() const {
    std::vector<std::string> out;
    out.reserve(meta_.entries.size());
    for (const auto& e : meta_.entries)
        out.push_back(e.key);
    return out;
}

bool PersistentTensorDict::atom_is_tensordict(const std::string& key) const {
    const EntryMeta* e = find(key);
    if (!e)
        throw_key_missing(*this, key);
    return e->kind == EntryMeta::Kind::Nested;
}

Value PersistentTensorDict::get_atom(const std::string& key) const {
    const EntryMeta* e = find(key);
    if (!e)
        throw_key_missing(*this, key);
    if (e->kind == EntryMeta::Kind::Leaf)
        return open_memmap_tensor(leaf_file(dir_, key), e->dtype, e->shape,
                                  meta_.device.value_or(default_device()));
    const fs::path child = nested_dir(dir_, key);
    ContainerMeta meta = read_meta(child);
    if (meta.type == "TensorDict")
        return std::make_shared<PersistentTensorDict>(child, std::move(meta));
    return load_memmap(child.string());
}

void PersistentTensorDict::set_atom(const std::string& key, Value value, bool inplace) {
    check_batch_prefix(key, value);
    const EntryMeta* existing = find(key);
    if (existing && inplace) {
        if (existing->kind == EntryMeta::Kind::Leaf) {
            if (!is_tensor(value))
                throw TypeMismatchError(
                    fmt::format("cannot write a tensordict into the tensor at key '{}'", key));
            std::get<Tensor>(get_atom(key)).copy_(std::get<Tensor>(value));
            return;
        }
        if (!is_tensordict(value))
            throw TypeMismatchError(
                fmt::format("cannot write a tensor into the nested tensordict at key '{}'", key));
        std::get<TensorDictPtr>(get_atom(key))->update(*std::get<TensorDictPtr>(value), true);
        return;
    }
    if (existing)
        erase_entry(key);

    EntryMeta entry;
    entry.key = key;
    if (is_tensor(value)) {
        Tensor t = std::get<Tensor>(value);
        if (meta_.device && t.device() != *meta_.device)
            t = t.to(*meta_.device);
        memmap_tensor(t, leaf_file(dir_, key));
        entry.dtype = t.dtype();
        entry.shape = t.shape();
    } else {
        const auto& src = std::get<TensorDictPtr>(value);
        auto child = create(nested_dir(dir_, key).string(), src->batch_size(), meta_.device);
        if (src->has_names())
            child->set_names(src->names());
        child->update(*src);
        entry.kind = EntryMeta::Kind::Nested;
        entry.shape = src->batch_size();
    }
    meta_.entries.push_back(std::move(entry));
    flush();
}

void PersistentTensorDict::del_atom(const std::string& key) {
    if (!find(key))
        throw_key_missing(*this, key);
    erase_entry(key);
    flush();
}

void PersistentTensorDict::erase_entry(const std::string& key) {
    auto it = std::find_if(meta_.entries.begin(), meta_.entries.end(),
                           [&](const EntryMeta& e) { return e.key == key; });
    if (it == meta_.entries.end())
        return;
    std::error_code ec;
    if (it->kind == EntryMeta::Kind::Leaf)
        fs::remove(leaf_file(dir_, key), ec);
    else
        fs::remove_all(nested_dir(dir_, key), ec);
    if (ec)
        log_warn("failed to remove the files of '{}' under {}: {}", key, dir_.string(), ec.message());
    meta_.entries.erase(it);
}

void PersistentTensorDict::flush() const { write_meta(dir_, meta_); }

TensorDictPtr PersistentTensorDict::select(const std::vector<NestedKey>&, bool, bool) {
    throw UnsupportedOperationError(
        "Cannot call select on a PersistentTensorDict. Copy it with to_tensordict() first.");
}

TensorDictPtr PersistentTensorDict::exclude(const std::vector<NestedKey>&, bool) {
    throw UnsupportedOperationError(
        "Cannot call exclude on a PersistentTensorDict. Copy it with to_tensordict() first.");
}

TensorDictBase& PersistentTensorDict::lock_() {
    throw UnsupportedOperationError(
        "Cannot lock a PersistentTensorDict. Load it with load_memmap() and lock the result instead.");
}

TensorDictBase& PersistentTensorDict::unlock_() {
    throw UnsupportedOperationError(
        "Cannot unlock a PersistentTensorDict. Load it with load_memmap() and unlock the result instead.");
}

TensorDictBase& PersistentTensorDict::memmap_(const std::optional<std::string>& prefix, bool copy_existing) {
    check_memmap(prefix, copy_existing);
    return *this;
}

void PersistentTensorDict::check_memmap(const std::optional<std::string>&, bool) const {
    throw UnsupportedOperationError(
        "Cannot build a memmap TensorDict in-place from a PersistentTensorDict. Use memmap() instead.");
}

TensorDictBase& PersistentTensorDict::share_memory_() {
    throw UnsupportedOperationError("A PersistentTensorDict is already backed by files and cannot be shared.");
}

} // namespace tensordict
