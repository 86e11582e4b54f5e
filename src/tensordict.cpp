#include "tensordict/tensordict.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include <fmt/format.h>

#include "tensordict/errors.hpp"
#include "tensordict/log.hpp"
#include "tensordict/memmap.hpp"

namespace fs = std::filesystem;

namespace tensordict {

namespace {

Shape common_prefix(const Shape& a, const Shape& b) {
    Shape out;
    for (std::size_t i = 0; i < std::min(a.size(), b.size()) && a[i] == b[i]; ++i)
        out.push_back(a[i]);
    return out;
}

} // namespace

TensorDict::TensorDict(Shape batch_size, std::optional<Device> device, Names names)
    : batch_size_{std::move(batch_size)}, device_{std::move(device)} {
    for (auto s : batch_size_)
        if (s < 0)
            throw ValueError(fmt::format("batch size {} has negative entries", shape_to_string(batch_size_)));
    if (names.empty()) {
        names_ = Names(batch_size_.size());
    } else {
        validate_names(names);
        names_ = std::move(names);
    }
}

std::shared_ptr<TensorDict> TensorDict::make(const Source& source, Shape batch_size,
                                             std::optional<Device> device, Names names) {
    auto td = std::make_shared<TensorDict>(std::move(batch_size), std::move(device), std::move(names));
    for (const auto& [key, value] : source)
        td->set(key, value);
    return td;
}

std::shared_ptr<TensorDict> TensorDict::from_dict(const Source& source, std::optional<Shape> batch_size,
                                                  std::optional<std::int64_t> batch_dims,
                                                  std::optional<Device> device) {
    if (batch_size && batch_dims)
        throw ValueError("Cannot pass both batch_size and batch_dims to `from_dict`.");
    auto td = std::make_shared<TensorDict>(batch_size.value_or(Shape{}), std::move(device));
    for (const auto& [key, value] : source)
        td->set(key, value);
    if (!batch_size)
        td->auto_batch_size_(batch_dims);
    return td;
}

std::shared_ptr<TensorDict> make_tensordict(const TensorDict::Source& source,
                                            std::optional<Shape> batch_size,
                                            std::optional<Device> device) {
    return TensorDict::from_dict(source, std::move(batch_size), std::nullopt, std::move(device));
}

TensorDict& TensorDict::auto_batch_size_(std::optional<std::int64_t> batch_dims) {
    std::optional<Shape> common;
    for (const auto& key : order_) {
        Value& v = entries_.at(key);
        if (is_tensordict(v)) {
            auto nested = std::dynamic_pointer_cast<TensorDict>(std::get<TensorDictPtr>(v));
            if (nested && nested->batch_size().empty())
                nested->auto_batch_size_(batch_dims);
        }
        const Shape s = value_shape(v);
        common = common ? common_prefix(*common, s) : s;
    }
    Shape batch = common.value_or(Shape{});
    if (batch_dims) {
        if (*batch_dims < 0 || static_cast<std::size_t>(*batch_dims) > batch.size())
            throw ValueError(fmt::format("batch_dims={} exceeds the {} dimensions shared by all entries",
                                         *batch_dims, batch.size()));
        batch.resize(static_cast<std::size_t>(*batch_dims));
    }
    set_batch_size(batch);
    return *this;
}

void TensorDict::set_batch_size(const Shape& batch_size) {
    if (batch_size == batch_size_)
        return;
    check_batch_size(batch_size);
    for (const auto& key : order_) {
        Value& v = entries_.at(key);
        if (!is_tensordict(v))
            continue;
        auto& nested = std::get<TensorDictPtr>(v);
        if (nested->batch_dims() < static_cast<std::int64_t>(batch_size.size()))
            nested->set_batch_size(batch_size);
    }
    names_.resize(batch_size.size());
    batch_size_ = batch_size;
    erase_cache();
}

void TensorDict::check_batch_size(const Shape& batch_size) const {
    if (batch_size == batch_size_)
        return;
    check_unlocked();
    for (const auto& key : order_) {
        const Value& v = entries_.at(key);
        Shape s = value_shape(v);
        if (is_tensordict(v) && s.size() < batch_size.size()) {
            // Shorter nested containers grow to the new batch size.
            auto nested = std::dynamic_pointer_cast<const TensorDict>(std::get<TensorDictPtr>(v));
            if (!nested)
                throw UnsupportedOperationError(kLazyBatchSizeMessage);
            nested->check_batch_size(batch_size);
            s = batch_size;
        }
        if (s.size() < batch_size.size() || !std::equal(batch_size.begin(), batch_size.end(), s.begin()))
            throw ShapeMismatchError(fmt::format(
                "the tensor {} has shape {} which is incompatible with the new shape {}.", key,
                shape_to_string(s), shape_to_string(batch_size)));
    }
}

void TensorDict::validate_names(const Names& names) const {
    if (names.size() != batch_size_.size())
        throw ValueError(fmt::format(
            "the length of the dimension names must equate the tensordict batch_dims attribute. "
            "Got {} names for batch_dims {}.",
            names.size(), batch_size_.size()));
    std::set<std::string> seen;
    for (const auto& n : names)
        if (n && !seen.insert(*n).second)
            throw ValueError(fmt::format("Some dimension names are non-unique: {}.", names_to_string(names)));
}

void TensorDict::set_names(const Names& names) {
    if (names.empty()) {
        names_ = Names(batch_size_.size());
        for (const auto& key : order_) {
            const Value& v = entries_.at(key);
            if (is_tensordict(v))
                std::get<TensorDictPtr>(v)->set_names({});
        }
        erase_cache();
        return;
    }
    validate_names(names);
    names_ = names;
    for (const auto& key : order_) {
        const Value& v = entries_.at(key);
        if (!is_tensordict(v))
            continue;
        const auto& nested = std::get<TensorDictPtr>(v);
        Names nested_names = names;
        const Names current = nested->names();
        nested_names.insert(nested_names.end(), current.begin() + static_cast<std::ptrdiff_t>(names.size()),
                            current.end());
        nested->set_names(nested_names);
    }
    erase_cache();
}

Value TensorDict::get_atom(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end())
        throw_key_missing(*this, key);
    return it->second;
}

bool TensorDict::has_atom(const std::string& key) const { return entries_.count(key) > 0; }

bool TensorDict::atom_is_tensordict(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end())
        throw_key_missing(*this, key);
    return is_tensordict(it->second);
}

void TensorDict::copy_into(const std::string& key, Tensor& dest, const Tensor& src) const {
    if (!writable_into(src.shape(), dest.shape()))
        throw ValueError(fmt::format("Failed to update '{}' in tensordict: cannot copy a tensor of shape "
                                     "{} into a tensor of shape {}",
                                     key, shape_to_string(src.shape()), shape_to_string(dest.shape())));
    // A value that only lacks trailing singleton dimensions is written as is.
    if (!broadcastable_to(src.shape(), dest.shape())) {
        dest.copy_(src.reshape(dest.shape()));
        return;
    }
    dest.copy_(src);
}

Value TensorDict::reconcile(const std::string& key, Value value) {
    if (is_tensor(value)) {
        Tensor t = std::get<Tensor>(std::move(value));
        if (device_ && t.device() != *device_)
            t = t.to(*device_);
        return t;
    }
    TensorDictPtr td = std::get<TensorDictPtr>(std::move(value));
    if (!td)
        throw TypeMismatchError(fmt::format("cannot set an empty tensordict pointer at key '{}'", key));
    if (device_ && td->device() != device_)
        td = td->to(*device_);
    const auto ndim = static_cast<std::ptrdiff_t>(batch_size_.size());
    if (has_names()) {
        Names wanted = names_;
        const Names current = td->names();
        wanted.insert(wanted.end(), current.begin() + ndim, current.end());
        if (current != wanted) {
            if (!std::dynamic_pointer_cast<TensorDict>(td))
                td = td->clone(false);
            td->set_names(wanted);
        }
    } else if (td->has_names()) {
        const Names current = td->names();
        set_names(Names(current.begin(), current.begin() + ndim));
    }
    return td;
}

void TensorDict::set_atom(const std::string& key, Value value, bool inplace) {
    auto it = entries_.find(key);
    const bool exists = it != entries_.end();
    if (is_locked() && (!exists || !inplace))
        throw LockedMutationError(kLockedMessage);
    check_batch_prefix(key, value);
    if (exists && inplace) {
        Value& current = it->second;
        if (is_tensor(current) && is_tensor(value)) {
            copy_into(key, std::get<Tensor>(current), std::get<Tensor>(value));
            return;
        }
        if (is_tensordict(current) && is_tensordict(value)) {
            std::get<TensorDictPtr>(current)->update_(*std::get<TensorDictPtr>(value));
            return;
        }
        throw TypeMismatchError(fmt::format(
            "cannot update the {} at key '{}' in place with a {}", is_tensor(current) ? "tensor" : "tensordict",
            key, is_tensor(value) ? "tensor" : "tensordict"));
    }
    Value v = reconcile(key, std::move(value));
    if (!exists)
        order_.push_back(key);
    entries_.insert_or_assign(key, std::move(v));
}

void TensorDict::set_atom_at(const std::string& key, const Value& value, const Index& index) {
    auto it = entries_.find(key);
    if (it == entries_.end())
        throw_key_missing(*this, key);
    Value& current = it->second;
    if (is_tensordict(current)) {
        if (!is_tensordict(value))
            throw TypeMismatchError(
                fmt::format("cannot write a tensor into the nested tensordict at key '{}'", key));
        std::get<TensorDictPtr>(current)->assign_at(index, *std::get<TensorDictPtr>(value));
        return;
    }
    if (!is_tensor(value))
        throw TypeMismatchError(fmt::format("cannot write a tensordict into the tensor at key '{}'", key));
    std::get<Tensor>(current).index_put_(index, std::get<Tensor>(value));
}

void TensorDict::del_atom(const std::string& key) {
    check_unlocked();
    auto it = entries_.find(key);
    if (it == entries_.end())
        throw_key_missing(*this, key);
    entries_.erase(it);
    order_.erase(std::find(order_.begin(), order_.end(), key));
}

bool TensorDict::is_contiguous() const {
    for (const auto& key : keys(true, true))
        if (!get_tensor(key).is_contiguous())
            return false;
    return true;
}

void TensorDict::propagate_unlock(const LockIds& ids) {
    is_memmap_ = false;
    is_shared_ = false;
    TensorDictBase::propagate_unlock(ids);
}

// ---------------------------------------------------------------------------
// persistence
// ---------------------------------------------------------------------------

TensorDictBase& TensorDict::memmap_(const std::optional<std::string>& prefix, bool copy_existing) {
    if (!prefix && is_memmap_)
        return *this;
    check_memmap(prefix, copy_existing);
    std::optional<fs::path> dir;
    if (prefix) {
        dir = fs::path{*prefix};
        fs::create_directories(*dir);
    }
    std::size_t written = 0;
    for (const auto& key : order_) {
        Value& v = entries_.at(key);
        if (is_tensordict(v)) {
            auto& nested = std::get<TensorDictPtr>(v);
            if (dir)
                nested->memmap_(nested_dir(*dir, key).string(), copy_existing);
            else
                nested->memmap_(std::nullopt, copy_existing);
            continue;
        }
        Tensor& leaf = std::get<Tensor>(v);
        if (leaf.is_memmap() && leaf.is_contiguous()) {
            if (!dir)
                continue;
            std::error_code ec;
            if (fs::equivalent(leaf_file(*dir, key), fs::path{leaf.filename()}, ec))
                continue;
        }
        // The target file may be the one currently backing the leaf.
        const Tensor src = leaf.is_memmap() ? leaf.clone() : leaf;
        leaf = dir ? memmap_tensor(src, leaf_file(*dir, key)) : memmap_tensor(src);
        ++written;
    }
    if (dir) {
        write_meta(*dir, describe(*this));
        log_info("memmapped {} leaves of {} to {}", written, type_name(), dir->string());
    }
    is_memmap_ = true;
    lock_();
    return *this;
}

void TensorDict::check_memmap(const std::optional<std::string>& prefix, bool copy_existing) const {
    if (!prefix && is_memmap_)
        return;
    for (const auto& key : order_) {
        const Value& v = entries_.at(key);
        if (is_tensordict(v)) {
            const auto& nested = std::get<TensorDictPtr>(v);
            if (prefix)
                nested->check_memmap(nested_dir(*prefix, key).string(), copy_existing);
            else
                nested->check_memmap(std::nullopt, copy_existing);
            continue;
        }
        if (!prefix)
            continue;
        const fs::path target = leaf_file(*prefix, key);
        const Tensor& leaf = std::get<Tensor>(v);
        if (!leaf.is_memmap() || !leaf.is_contiguous() || copy_existing)
            continue;
        std::error_code ec;
        if (!fs::equivalent(target, fs::path{leaf.filename()}, ec))
            throw UnsupportedOperationError(
                "TensorDict already contains MemmapTensors saved to a location incompatible with "
                "prefix. Either move the location of the MemmapTensors, or do not specify a prefix, "
                "or set copy_existing=True.");
    }
}

std::shared_ptr<TensorDict> TensorDict::load_memmap(const std::string& prefix) {
    const fs::path dir{prefix};
    ContainerMeta meta = read_meta(dir);
    if (meta.type != "TensorDict")
        throw ValueError(fmt::format("expected a TensorDict memmap under {}, found '{}'", prefix, meta.type));
    auto td = std::make_shared<TensorDict>(meta.batch_size, meta.device, meta.names);
    const Device device = meta.device.value_or(default_device());
    for (const auto& e : meta.entries) {
        if (e.kind == EntryMeta::Kind::Nested)
            td->set_atom(e.key, tensordict::load_memmap(nested_dir(dir, e.key).string()), false);
        else
            td->set_atom(e.key, open_memmap_tensor(leaf_file(dir, e.key), e.dtype, e.shape, device), false);
    }
    td->is_memmap_ = true;
    td->lock_();
    log_info("loaded memmap with {} entries from {}", meta.entries.size(), prefix);
    return td;
}

TensorDictBase& TensorDict::share_memory_() {
    if (is_memmap_)
        throw UnsupportedOperationError("memmap and shared memory are mutually exclusive features.");
    for (const auto& key : order_) {
        Value& v = entries_.at(key);
        if (is_tensordict(v))
            std::get<TensorDictPtr>(v)->share_memory_();
        else
            std::get<Tensor>(v).share_memory_();
    }
    is_shared_ = true;
    lock_();
    return *this;
}

} // namespace tensordict
