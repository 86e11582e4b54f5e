#include "tensordict/lazy_stack.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/format.h>

#include "tensordict/errors.hpp"
#include "tensordict/log.hpp"
#include "tensordict/serialization.hpp"
#include "tensordict/tensordict.hpp"

namespace fs = std::filesystem;

namespace tensordict {

namespace {

/// Keys of the first sibling that every other sibling has too, in the first sibling's order.
std::vector<std::string> common_keys(const std::vector<TensorDictPtr>& tensordicts) {
    std::vector<std::string> out;
    for (const auto& key : tensordicts.front()->atom_keys()) {
        const bool everywhere = std::all_of(tensordicts.begin() + 1, tensordicts.end(),
                                            [&](const auto& td) { return td->has_atom(key); });
        if (everywhere)
            out.push_back(key);
    }
    return out;
}

bool is_full_slice(const IndexItem& item) {
    return item.is_slice() && !item.slice().start && !item.slice().stop && item.slice().step == 1;
}

std::string optional_to_string(const std::optional<std::string>& s) { return s ? *s : "None"; }

/// Throws what `td.set_atom(key, part, inplace)` would refuse, without writing.
void check_sibling_write(const TensorDictBase& td, const std::string& key, const Value& part, bool inplace) {
    const bool exists = td.has_atom(key);
    if (td.is_locked() && (!inplace || !exists))
        throw LockedMutationError(kLockedMessage);
    if (!inplace || !exists)
        return;
    const Value current = td.get_atom(key);
    if (is_tensor(current) != is_tensor(part))
        throw TypeMismatchError(fmt::format(
            "cannot update the {} at key '{}' in place with a {}", is_tensor(current) ? "tensor" : "tensordict",
            key, is_tensor(part) ? "tensor" : "tensordict"));
    if (!is_tensor(part))
        return;
    const Shape& dst = std::get<Tensor>(current).shape();
    const Shape& src = std::get<Tensor>(part).shape();
    if (!writable_into(src, dst))
        throw ValueError(fmt::format("Failed to update '{}' in tensordict: cannot copy a tensor of shape "
                                     "{} into a tensor of shape {}",
                                     key, shape_to_string(src), shape_to_string(dst)));
}

} // namespace

LazyStackedTensorDict::LazyStackedTensorDict(std::vector<TensorDictPtr> tensordicts, std::int64_t stack_dim)
    : tensordicts_{std::move(tensordicts)}, stack_dim_{0} {
    if (tensordicts_.empty())
        throw ValueError("No tensordicts provided to the LazyStackedTensorDict.");
    for (const auto& td : tensordicts_)
        if (!td)
            throw TypeMismatchError("Expected new value to be TensorDictBase instance but got a null pointer.");
    stack_dim_ = normalize_dim(stack_dim, tensordicts_.front()->batch_dims() + 1);
    for (std::size_t i = 1; i < tensordicts_.size(); ++i)
        check_sibling(*tensordicts_[i]);
    valid_keys_ = common_keys(tensordicts_);
}

LazyStackedTensorDict::~LazyStackedTensorDict() {
    if (!explicit_lock_.value_or(false))
        return;
    for (auto& td : tensordicts_)
        td->remove_lock(id());
}

std::shared_ptr<LazyStackedTensorDict> LazyStackedTensorDict::make(std::vector<TensorDictPtr> tensordicts,
                                                                   std::int64_t stack_dim) {
    return std::make_shared<LazyStackedTensorDict>(std::move(tensordicts), stack_dim);
}

void LazyStackedTensorDict::check_sibling(const TensorDictBase& td) const {
    const auto& first = *tensordicts_.front();
    if (td.batch_size() != first.batch_size())
        throw BatchSizeMismatchError(fmt::format(
            "Batch sizes in tensordicts differs, LazyStackedTensorDict cannot be created. Got "
            "td[0].batch_size={} and td.batch_size={}",
            shape_to_string(first.batch_size()), shape_to_string(td.batch_size())));
    if (td.device() != first.device())
        throw DeviceMismatchError(fmt::format(
            "Devices differ, LazyStackedTensorDict cannot be created. Got td[0].device={} and "
            "td.device={}",
            optional_to_string(first.device()), optional_to_string(td.device())));
}

std::shared_ptr<LazyStackedTensorDict>
LazyStackedTensorDict::restack(std::vector<TensorDictPtr> children, std::int64_t stack_dim) const {
    auto out = make(std::move(children), stack_dim);
    out->stack_dim_name_ = stack_dim_name_;
    return out;
}

bool LazyStackedTensorDict::contains(const TensorDictPtr& td) const {
    return std::find(tensordicts_.begin(), tensordicts_.end(), td) != tensordicts_.end();
}

void LazyStackedTensorDict::insert(std::int64_t index, const Value& item) {
    if (!is_tensordict(item) || !std::get<TensorDictPtr>(item))
        throw TypeMismatchError(
            "Expected new value to be TensorDictBase instance but got a Tensor instead.");
    if (is_locked())
        throw LockedMutationError(kLockedMessage);
    const auto& td = std::get<TensorDictPtr>(item);
    check_sibling(*td);
    const auto n = static_cast<std::int64_t>(tensordicts_.size());
    if (index < 0)
        index = std::max<std::int64_t>(0, index + n);
    index = std::min(index, n);
    tensordicts_.insert(tensordicts_.begin() + index, td);
    update_valid_keys();
}

void LazyStackedTensorDict::append(const Value& item) {
    insert(static_cast<std::int64_t>(tensordicts_.size()), item);
}

std::vector<Tensor> LazyStackedTensorDict::get_nestedtensor(const NestedKey& key) const {
    if (stack_dim_ != 0)
        throw UnsupportedOperationError(
            "LazyStackedTensorDict.get_nestedtensor can only be called when the stack_dim is 0.");
    std::vector<Tensor> out;
    out.reserve(tensordicts_.size());
    for (const auto& td : tensordicts_)
        out.push_back(td->get_tensor(key));
    return out;
}

void LazyStackedTensorDict::update_valid_keys() {
    valid_keys_ = common_keys(tensordicts_);
    erase_cache();
}

// ---------------------------------------------------------------------------
// batch size, device and names
// ---------------------------------------------------------------------------

Shape LazyStackedTensorDict::batch_size() const {
    Shape out = tensordicts_.front()->batch_size();
    out.insert(out.begin() + stack_dim_, static_cast<std::int64_t>(tensordicts_.size()));
    return out;
}

void LazyStackedTensorDict::set_batch_size(const Shape&) {
    throw UnsupportedOperationError(kLazyBatchSizeMessage);
}

std::optional<Device> LazyStackedTensorDict::device() const { return tensordicts_.front()->device(); }

Names LazyStackedTensorDict::names() const {
    Names out = tensordicts_.front()->names();
    out.insert(out.begin() + stack_dim_, stack_dim_name_);
    return out;
}

void LazyStackedTensorDict::set_names(const Names& names) {
    if (names.empty()) {
        stack_dim_name_.reset();
        for (auto& td : tensordicts_)
            td->set_names({});
        erase_cache();
        return;
    }
    if (static_cast<std::int64_t>(names.size()) != batch_dims())
        throw ValueError(fmt::format(
            "the length of the dimension names must equate the tensordict batch_dims attribute. "
            "Got {} names for batch_dims {}.",
            names.size(), batch_dims()));
    Names rest = names;
    rest.erase(rest.begin() + stack_dim_);
    const auto& name = names[static_cast<std::size_t>(stack_dim_)];
    if (name && std::find(rest.begin(), rest.end(), name) != rest.end())
        throw ValueError(fmt::format("Some dimension names are non-unique: {}.", names_to_string(names)));
    for (auto& td : tensordicts_)
        td->set_names(rest);
    stack_dim_name_ = name;
    erase_cache();
}

// ---------------------------------------------------------------------------
// single atom primitives
// ---------------------------------------------------------------------------

bool LazyStackedTensorDict::has_atom(const std::string& key) const {
    if (std::find(valid_keys_.begin(), valid_keys_.end(), key) != valid_keys_.end())
        return true;
    const bool everywhere = std::all_of(tensordicts_.begin(), tensordicts_.end(),
                                        [&](const auto& td) { return td->has_atom(key); });
    if (!everywhere)
        return false;
    log_debug("key '{}' is now present in every stacked tensordict, refreshing the key set", key);
    valid_keys_ = common_keys(tensordicts_);
    erase_cache();
    return true;
}

Value LazyStackedTensorDict::get_atom(const std::string& key) const {
    if (!has_atom(key)) {
        const auto present = std::count_if(tensordicts_.begin(), tensordicts_.end(),
                                           [&](const auto& td) { return td->has_atom(key); });
        if (present == 0)
            throw_key_missing(*this, key);
        throw UnsupportedOperationError(fmt::format(
            "key '{}' is only present in {} of the {} stacked tensordicts. Set it in every "
            "tensordict or read it from the tensordicts that hold it.",
            key, present, tensordicts_.size()));
    }
    std::vector<Tensor> tensors;
    std::vector<TensorDictPtr> nested;
    for (const auto& td : tensordicts_) {
        Value v = td->get_atom(key);
        if (is_tensor(v))
            tensors.push_back(std::get<Tensor>(std::move(v)));
        else
            nested.push_back(std::get<TensorDictPtr>(std::move(v)));
    }
    if (!tensors.empty() && !nested.empty())
        throw TypeMismatchError(fmt::format(
            "key '{}' holds tensors in some stacked tensordicts and tensordicts in others", key));
    if (!nested.empty())
        return restack(std::move(nested), stack_dim_);
    for (const auto& t : tensors)
        if (t.shape() != tensors.front().shape())
            throw ShapeMismatchError(fmt::format(
                "Found more than one unique shape in the tensors to be stacked ({} and {} for key "
                "'{}'). This is likely due to a modification of one of the stacked TensorDicts, "
                "where a key has been updated/created with an uncompatible shape. If the entries "
                "are intended to have a different shape, use the get_nestedtensor method instead.",
                shape_to_string(tensors.front().shape()), shape_to_string(t.shape()), key));
    return Tensor::stack(tensors, stack_dim_);
}

bool LazyStackedTensorDict::atom_is_tensordict(const std::string& key) const {
    if (!has_atom(key))
        throw_key_missing(*this, key);
    return tensordicts_.front()->atom_is_tensordict(key);
}

void LazyStackedTensorDict::set_atom(const std::string& key, Value value, bool inplace) {
    const bool exists = has_atom(key);
    if (is_locked() && (!inplace || !exists))
        throw LockedMutationError(kLockedMessage);
    check_batch_prefix(key, value);
    std::vector<Value> parts;
    if (is_tensor(value)) {
        for (auto& t : std::get<Tensor>(value).unbind(stack_dim_))
            parts.emplace_back(std::move(t));
    } else {
        for (auto& td : std::get<TensorDictPtr>(value)->unbind(stack_dim_))
            parts.emplace_back(std::move(td));
    }
    // Every sibling is checked before the first one is written.
    for (std::size_t i = 0; i < tensordicts_.size(); ++i)
        check_sibling_write(*tensordicts_[i], key, parts[i], inplace && exists);
    for (std::size_t i = 0; i < tensordicts_.size(); ++i)
        tensordicts_[i]->set_atom(key, std::move(parts[i]), inplace && exists);
    if (!exists)
        valid_keys_.push_back(key);
    erase_cache();
}

void LazyStackedTensorDict::del_atom(const std::string& key) {
    check_unlocked();
    for (auto& td : tensordicts_)
        if (td->has_atom(key))
            td->del_atom(key);
    valid_keys_.erase(std::remove(valid_keys_.begin(), valid_keys_.end(), key), valid_keys_.end());
    erase_cache();
}

TensorDictPtr LazyStackedTensorDict::create_nested(const std::string& key) {
    check_unlocked();
    for (auto& td : tensordicts_)
        td->create_nested(key);
    if (std::find(valid_keys_.begin(), valid_keys_.end(), key) == valid_keys_.end())
        valid_keys_.push_back(key);
    erase_cache();
    return std::get<TensorDictPtr>(get_atom(key));
}

// ---------------------------------------------------------------------------
// structure
// ---------------------------------------------------------------------------

TensorDictPtr LazyStackedTensorDict::select(const std::vector<NestedKey>& keys, bool inplace, bool strict) {
    if (inplace) {
        check_unlocked();
        for (auto& td : tensordicts_)
            td->select(keys, true, strict);
        update_valid_keys();
        return self();
    }
    std::vector<TensorDictPtr> out;
    for (auto& td : tensordicts_)
        out.push_back(td->select(keys, false, strict));
    return restack(std::move(out), stack_dim_);
}

TensorDictPtr LazyStackedTensorDict::exclude(const std::vector<NestedKey>& keys, bool inplace) {
    if (inplace) {
        check_unlocked();
        for (auto& td : tensordicts_)
            td->exclude(keys, true);
        update_valid_keys();
        return self();
    }
    std::vector<TensorDictPtr> out;
    for (auto& td : tensordicts_)
        out.push_back(td->exclude(keys, false));
    return restack(std::move(out), stack_dim_);
}

TensorDictPtr LazyStackedTensorDict::empty(bool recurse) const {
    std::vector<TensorDictPtr> out;
    for (const auto& td : tensordicts_)
        out.push_back(td->empty(recurse));
    return restack(std::move(out), stack_dim_);
}

TensorDictPtr LazyStackedTensorDict::clone(bool recurse) const {
    std::vector<TensorDictPtr> out;
    for (const auto& td : tensordicts_)
        out.push_back(td->clone(recurse));
    return restack(std::move(out), stack_dim_);
}

TensorDictPtr LazyStackedTensorDict::to(const Device& device) const {
    if (this->device() && *this->device() == device)
        return self();
    std::vector<TensorDictPtr> out;
    for (const auto& td : tensordicts_)
        out.push_back(td->to(device));
    return restack(std::move(out), stack_dim_);
}

// ---------------------------------------------------------------------------
// shape algebra
// ---------------------------------------------------------------------------
// Integer and slice indices are resolved on the siblings: the item at the
// stack dimension picks siblings, the remaining items index each picked
// sibling. An integer at the stack dimension returns the sibling itself
// when nothing else is indexed. Tensor indices and new axes fall back to
// eager indexing of the stacked leaves.
// ---------------------------------------------------------------------------

TensorDictPtr LazyStackedTensorDict::index(const Index& index) {
    const Index items = expand_ellipsis(index, batch_dims());
    const bool basic = std::all_of(items.begin(), items.end(),
                                   [](const IndexItem& it) { return it.is_integer() || it.is_slice(); });
    if (!basic)
        return TensorDictBase::index(items);

    const auto pos = static_cast<std::size_t>(stack_dim_);
    Index child_index;
    std::int64_t ints_before = 0;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i == pos)
            continue;
        if (i < pos && items[i].is_integer())
            ++ints_before;
        child_index.push_back(items[i]);
    }
    const bool trivial = std::all_of(child_index.begin(), child_index.end(), is_full_slice);
    auto pick = [&](const TensorDictPtr& td) { return trivial ? td : td->index(child_index); };

    const auto n = static_cast<std::int64_t>(tensordicts_.size());
    const IndexItem stack_item = pos < items.size() ? items[pos] : IndexItem{Slice{}};
    if (stack_item.is_integer()) {
        std::int64_t i = stack_item.integer();
        if (i < -n || i >= n)
            throw IndexError(fmt::format("index {} is out of range for a stack of {} tensordicts", i, n));
        if (i < 0)
            i += n;
        return pick(tensordicts_[static_cast<std::size_t>(i)]);
    }
    const Slice& s = stack_item.slice();
    const auto positions = Tensor::arange(n).slice(0, s.start, s.stop, s.step).to_vector<std::int64_t>();
    if (positions.empty())
        return TensorDictBase::index(items);
    std::vector<TensorDictPtr> children;
    children.reserve(positions.size());
    for (auto p : positions)
        children.push_back(pick(tensordicts_[static_cast<std::size_t>(p)]));
    return restack(std::move(children), stack_dim_ - ints_before);
}

std::vector<TensorDictPtr> LazyStackedTensorDict::unbind(std::int64_t dim) {
    if (normalize_dim(dim, batch_dims()) == stack_dim_)
        return tensordicts_;
    return TensorDictBase::unbind(dim);
}

// ---------------------------------------------------------------------------
// lock graph
// ---------------------------------------------------------------------------
// A stack has no lock ids of its own: it reports the ids held by its
// siblings. Unless it was locked explicitly (directly or through a locked
// parent) it counts as locked when every sibling is.
// ---------------------------------------------------------------------------

bool LazyStackedTensorDict::is_locked() const {
    if (explicit_lock_)
        return *explicit_lock_;
    return std::all_of(tensordicts_.begin(), tensordicts_.end(),
                       [](const auto& td) { return td->is_locked(); });
}

LockIds LazyStackedTensorDict::lock_ids() const {
    LockIds out;
    for (const auto& td : tensordicts_) {
        const auto ids = td->lock_ids();
        out.insert(ids.begin(), ids.end());
    }
    out.erase(id());
    return out;
}

void LazyStackedTensorDict::propagate_lock(const LockIds& ids) {
    explicit_lock_ = true;
    LockIds child_ids = ids;
    child_ids.insert(id());
    for (auto& td : tensordicts_)
        td->propagate_lock(child_ids);
}

void LazyStackedTensorDict::propagate_unlock(const LockIds& ids) {
    explicit_lock_.reset();
    ++lock_generation_;
    erase_cache();
    LockIds child_ids = ids;
    child_ids.insert(id());
    for (auto& td : tensordicts_)
        td->propagate_unlock(child_ids);
}

void LazyStackedTensorDict::remove_lock(std::uint64_t id) {
    for (auto& td : tensordicts_)
        td->remove_lock(id);
}

void LazyStackedTensorDict::collect_unlock(const LockIds& ids,
                                           std::map<const TensorDictBase*, LockIds>& released) const {
    LockIds child_ids = ids;
    child_ids.insert(id());
    for (const auto& td : tensordicts_)
        td->collect_unlock(child_ids, released);
}

// A stack locked through its siblings alone moves with any of them.
std::uint64_t LazyStackedTensorDict::lock_generation() const {
    std::uint64_t out = lock_generation_;
    for (const auto& td : tensordicts_)
        out += td->lock_generation();
    return out;
}

// ---------------------------------------------------------------------------
// persistence
// ---------------------------------------------------------------------------

TensorDictBase& LazyStackedTensorDict::memmap_(const std::optional<std::string>& prefix, bool copy_existing) {
    check_memmap(prefix, copy_existing);
    for (std::size_t i = 0; i < tensordicts_.size(); ++i) {
        std::optional<std::string> child_prefix;
        if (prefix)
            child_prefix = (fs::path{*prefix} / std::to_string(i)).string();
        tensordicts_[i]->memmap_(child_prefix, copy_existing);
    }
    if (prefix) {
        ContainerMeta meta;
        meta.type = type_name();
        meta.batch_size = batch_size();
        meta.device = device();
        meta.names = names();
        meta.stack_dim = stack_dim_;
        meta.count = static_cast<std::int64_t>(tensordicts_.size());
        write_meta(*prefix, meta);
        log_info("memmapped stack of {} tensordicts to {}", tensordicts_.size(), *prefix);
    }
    lock_();
    return *this;
}

void LazyStackedTensorDict::check_memmap(const std::optional<std::string>& prefix, bool copy_existing) const {
    for (std::size_t i = 0; i < tensordicts_.size(); ++i) {
        std::optional<std::string> child_prefix;
        if (prefix)
            child_prefix = (fs::path{*prefix} / std::to_string(i)).string();
        tensordicts_[i]->check_memmap(child_prefix, copy_existing);
    }
}

TensorDictBase& LazyStackedTensorDict::share_memory_() {
    for (auto& td : tensordicts_)
        td->share_memory_();
    lock_();
    return *this;
}

bool LazyStackedTensorDict::is_memmap() const {
    return std::all_of(tensordicts_.begin(), tensordicts_.end(),
                       [](const auto& td) { return td->is_memmap(); });
}

bool LazyStackedTensorDict::is_shared() const {
    return std::all_of(tensordicts_.begin(), tensordicts_.end(),
                       [](const auto& td) { return td->is_shared(); });
}

// ---------------------------------------------------------------------------
// free functions
// ---------------------------------------------------------------------------

std::shared_ptr<LazyStackedTensorDict> stack(const std::vector<TensorDictPtr>& tensordicts, std::int64_t dim) {
    return LazyStackedTensorDict::make(tensordicts, dim);
}

TensorDictPtr dense_stack(const std::vector<TensorDictPtr>& tensordicts, std::int64_t dim) {
    return stack(tensordicts, dim)->contiguous();
}

TensorDictPtr cat(const std::vector<TensorDictPtr>& tensordicts, std::int64_t dim) {
    if (tensordicts.empty())
        throw ValueError("cat expects a non-empty list of tensordicts");
    const auto& first = *tensordicts.front();
    const auto d = static_cast<std::size_t>(normalize_dim(dim, first.batch_dims()));
    Shape batch = first.batch_size();
    batch[d] = 0;
    for (const auto& td : tensordicts) {
        Shape a = td->batch_size();
        Shape b = first.batch_size();
        if (a.size() != b.size())
            throw BatchSizeMismatchError(fmt::format(
                "cat expects tensordicts with the same number of batch dimensions, got {} and {}",
                shape_to_string(b), shape_to_string(a)));
        const auto extent = a[d];
        a[d] = b[d] = 0;
        if (a != b)
            throw BatchSizeMismatchError(fmt::format(
                "cat expects batch sizes to match except in dimension {}, got {} and {}", d,
                shape_to_string(first.batch_size()), shape_to_string(td->batch_size())));
        batch[d] += extent;
    }
    auto out = std::make_shared<TensorDict>(batch, first.device(), first.has_names() ? first.names() : Names{});
    for (const auto& atom : first.atom_keys()) {
        std::vector<Tensor> tensors;
        std::vector<TensorDictPtr> nested;
        for (const auto& td : tensordicts) {
            Value v = td->get_atom(atom);
            if (is_tensor(v))
                tensors.push_back(std::get<Tensor>(std::move(v)));
            else
                nested.push_back(std::get<TensorDictPtr>(std::move(v)));
        }
        if (!tensors.empty() && !nested.empty())
            throw TypeMismatchError(fmt::format(
                "key '{}' holds tensors in some tensordicts and tensordicts in others", atom));
        if (nested.empty())
            out->set_atom(atom, Tensor::cat(tensors, static_cast<std::int64_t>(d)), false);
        else
            out->set_atom(atom, cat(nested, static_cast<std::int64_t>(d)), false);
    }
    return out;
}

} // namespace tensordict
