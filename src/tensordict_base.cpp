#include "tensordict/tensordict_base.hpp"

#include <algorithm>
#include <atomic>
#include <numeric>

#include <fmt/format.h>

#include "tensordict/custom_op.hpp"
#include "tensordict/errors.hpp"
#include "tensordict/log.hpp"
#include "tensordict/sub_tensordict.hpp"
#include "tensordict/tensordict.hpp"

namespace tensordict {

const char* const kLockedMessage =
    "Cannot modify locked TensorDict. For in-place modification, consider using the `set_()` "
    "method and make sure the key is present.";

const char* const kLazyBatchSizeMessage =
    "modifying the batch size of a lazy representation of a tensordict is not permitted. "
    "Consider instantiating the tensordict first by calling `td = td.to_tensordict()` before "
    "resetting the batch size.";

namespace {

const char* const kUnlockGraphMessage =
    "Cannot unlock a tensordict that is part of a locked graph. Unlock the root tensordict "
    "first. If the tensordict is part of multiple graphs, group the graphs under a common "
    "tensordict an unlock this root.";

std::atomic<std::uint64_t> next_id{1};

/// Empty plain container with the batch size, device and names of @p td.
std::shared_ptr<TensorDict> plain_like(const TensorDictBase& td) {
    return std::make_shared<TensorDict>(td.batch_size(), td.device(),
                                        td.has_names() ? td.names() : Names{});
}

/// Plain copy of @p td, with @p leaf_fn applied to every leaf.
template <typename F> TensorDictPtr plain_copy(const TensorDictBase& td, F&& leaf_fn) {
    auto out = plain_like(td);
    for (const auto& atom : td.atom_keys()) {
        Value v = td.get_atom(atom);
        if (is_tensordict(v))
            out->set_atom(atom, plain_copy(*std::get<TensorDictPtr>(v), leaf_fn), false);
        else
            out->set_atom(atom, leaf_fn(std::get<Tensor>(v)), false);
    }
    return out;
}

/// Top level atoms of @p keys in first-seen order with the remaining paths.
/// An empty tail list means the whole entry was named.
std::vector<std::pair<std::string, std::vector<NestedKey>>>
group_by_head(const std::vector<NestedKey>& keys) {
    std::vector<std::pair<std::string, std::vector<NestedKey>>> groups;
    std::vector<bool> whole;
    for (const auto& key : keys) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& g) { return g.first == key.front(); });
        std::size_t pos;
        if (it == groups.end()) {
            groups.emplace_back(key.front(), std::vector<NestedKey>{});
            whole.push_back(false);
            pos = groups.size() - 1;
        } else {
            pos = static_cast<std::size_t>(it - groups.begin());
        }
        if (!key.is_nested())
            whole[pos] = true;
        else if (!whole[pos])
            groups[pos].second.push_back(key.tail());
    }
    for (std::size_t i = 0; i < groups.size(); ++i)
        if (whole[i])
            groups[i].second.clear();
    return groups;
}

Index leading_slices(std::int64_t dim) { return Index(static_cast<std::size_t>(dim), Slice{}); }

} // namespace

Shape value_shape(const Value& v) {
    if (is_tensor(v))
        return std::get<Tensor>(v).shape();
    return std::get<TensorDictPtr>(v)->batch_size();
}

std::string names_to_string(const Names& names) {
    std::vector<std::string> parts;
    parts.reserve(names.size());
    for (const auto& n : names)
        parts.push_back(n ? "'" + *n + "'" : "None");
    return fmt::format("[{}]", fmt::join(parts, ", "));
}

void throw_key_missing(const TensorDictBase& td, const std::string& key) {
    std::vector<std::string> quoted;
    for (const auto& k : td.sorted_keys())
        quoted.push_back("'" + k + "'");
    throw KeyMissingError(fmt::format("key \"{}\" not found in {} with keys [{}]", key,
                                      td.type_name(), fmt::join(quoted, ", ")));
}

TensorDictBase::TensorDictBase() : id_{next_id.fetch_add(1)} {}

TensorDictBase::~TensorDictBase() {
    for (auto& child : locked_children_)
        child->remove_lock(id_);
}

// ---------------------------------------------------------------------------
// names
// ---------------------------------------------------------------------------

bool TensorDictBase::has_names() const {
    const auto n = names();
    return std::any_of(n.begin(), n.end(), [](const auto& name) { return name.has_value(); });
}

TensorDictBase& TensorDictBase::rename_(const Names& names) {
    set_names(names);
    return *this;
}

TensorDictBase& TensorDictBase::rename_(const std::map<std::string, std::string>& mapping) {
    Names current = names();
    std::vector<std::string> unknown;
    for (const auto& [from, to] : mapping) {
        auto it = std::find(current.begin(), current.end(), std::optional<std::string>{from});
        if (it == current.end()) {
            unknown.push_back(from);
            continue;
        }
        *it = to;
    }
    if (!unknown.empty())
        throw ValueError(fmt::format(
            "Some names to be renamed were not part of the tensordict names: [{}] vs {}.",
            fmt::join(unknown, ", "), names_to_string(names())));
    set_names(current);
    return *this;
}

TensorDictPtr TensorDictBase::rename(const Names& names) {
    auto out = clone(false);
    out->set_names(names);
    return out;
}

TensorDictBase& TensorDictBase::refine_names(const Names& names) {
    const Names current = this->names();
    const auto ndim = static_cast<std::size_t>(batch_dims());
    Names expanded;
    const auto ellipses = std::count(names.begin(), names.end(), std::optional<std::string>{"..."});
    if (ellipses > 1)
        throw ValueError("refine_names accepts at most one ellipsis");
    const std::size_t explicit_count = names.size() - static_cast<std::size_t>(ellipses);
    if (explicit_count > ndim || (ellipses == 0 && explicit_count != ndim))
        throw ValueError(fmt::format("refine_names: got {} names for a tensordict with {} batch dims",
                                     explicit_count, ndim));
    for (const auto& name : names) {
        if (name && *name == "...") {
            for (std::size_t i = 0; i < ndim - explicit_count; ++i)
                expanded.push_back(current[expanded.size()]);
        } else {
            expanded.push_back(name);
        }
    }
    for (std::size_t i = 0; i < ndim; ++i) {
        if (!expanded[i]) {
            expanded[i] = current[i];
        } else if (current[i] && *current[i] != *expanded[i]) {
            throw ValueError(fmt::format("refine_names: cannot coerce TensorDict names {} with {}.",
                                         names_to_string(current), names_to_string(expanded)));
        }
    }
    set_names(expanded);
    return *this;
}

// ---------------------------------------------------------------------------
// single atom defaults
// ---------------------------------------------------------------------------

bool TensorDictBase::atom_is_tensordict(const std::string& key) const {
    return is_tensordict(get_atom(key));
}

void TensorDictBase::set_atom_at(const std::string& key, const Value& value, const Index& index) {
    Value current = get_atom(key);
    if (is_tensordict(current)) {
        if (!is_tensordict(value))
            throw TypeMismatchError(
                fmt::format("cannot write a tensor into the nested tensordict at key '{}'", key));
        std::get<TensorDictPtr>(current)->assign_at(index, *std::get<TensorDictPtr>(value));
        return;
    }
    if (!is_tensor(value))
        throw TypeMismatchError(
            fmt::format("cannot write a tensordict into the tensor at key '{}'", key));
    Tensor leaf = std::get<Tensor>(current);
    leaf.index_put_(index, std::get<Tensor>(value));
    set_atom(key, leaf, true);
}

TensorDictPtr TensorDictBase::create_nested(const std::string& key) {
    set_atom(key, std::make_shared<TensorDict>(batch_size(), device()), false);
    return std::get<TensorDictPtr>(get_atom(key));
}

// ---------------------------------------------------------------------------
// key path access
// ---------------------------------------------------------------------------

Value TensorDictBase::get(const NestedKey& key) const {
    const TensorDictBase* current = this;
    TensorDictPtr holder;
    for (std::size_t i = 0; i + 1 < key.size(); ++i) {
        Value v = current->get_atom(key[i]);
        if (!is_tensordict(v))
            throw ValueError(fmt::format(
                "Expected a TensorDictBase instance but got a Tensor instead for key '{}' of {}.",
                key[i], key.to_string()));
        holder = std::get<TensorDictPtr>(std::move(v));
        current = holder.get();
    }
    return current->get_atom(key.back());
}

Value TensorDictBase::get_or(const NestedKey& key, const Value& default_value) const {
    if (!has_key(key))
        return default_value;
    return get(key);
}

Tensor TensorDictBase::get_tensor(const NestedKey& key) const {
    Value v = get(key);
    if (!is_tensor(v))
        throw TypeMismatchError(
            fmt::format("expected a tensor at key {} but found a tensordict", key.to_string()));
    return std::get<Tensor>(std::move(v));
}

TensorDictPtr TensorDictBase::get_tensordict(const NestedKey& key) const {
    Value v = get(key);
    if (!is_tensordict(v))
        throw TypeMismatchError(
            fmt::format("expected a tensordict at key {} but found a tensor", key.to_string()));
    return std::get<TensorDictPtr>(std::move(v));
}

bool TensorDictBase::has_key(const NestedKey& key) const {
    const TensorDictBase* current = this;
    TensorDictPtr holder;
    for (std::size_t i = 0; i + 1 < key.size(); ++i) {
        if (!current->has_atom(key[i]) || !current->atom_is_tensordict(key[i]))
            return false;
        holder = std::get<TensorDictPtr>(current->get_atom(key[i]));
        current = holder.get();
    }
    return current->has_atom(key.back());
}

TensorDictBase& TensorDictBase::set(const NestedKey& key, Value value, bool inplace) {
    TensorDictBase* current = this;
    TensorDictPtr holder;
    for (std::size_t i = 0; i + 1 < key.size(); ++i) {
        if (current->has_atom(key[i])) {
            Value v = current->get_atom(key[i]);
            if (!is_tensordict(v))
                throw ValueError(fmt::format(
                    "Expected a TensorDictBase instance but got a Tensor instead for key '{}' of {}.",
                    key[i], key.to_string()));
            holder = std::get<TensorDictPtr>(std::move(v));
        } else {
            holder = current->create_nested(key[i]);
        }
        current = holder.get();
    }
    const bool exists = inplace && current->has_atom(key.back());
    current->set_atom(key.back(), std::move(value), exists);
    return *this;
}

TensorDictBase& TensorDictBase::set_(const NestedKey& key, Value value) {
    TensorDictBase* current = this;
    TensorDictPtr holder;
    if (key.is_nested()) {
        holder = get_tensordict(key.parent());
        current = holder.get();
    }
    if (!current->has_atom(key.back()))
        throw_key_missing(*current, key.back());
    current->set_atom(key.back(), std::move(value), true);
    return *this;
}

TensorDictBase& TensorDictBase::set_at_(const NestedKey& key, const Value& value, const Index& index) {
    TensorDictBase* current = this;
    TensorDictPtr holder;
    if (key.is_nested()) {
        holder = get_tensordict(key.parent());
        current = holder.get();
    }
    if (!current->has_atom(key.back()))
        throw_key_missing(*current, key.back());
    current->set_atom_at(key.back(), value, index);
    return *this;
}

TensorDictBase& TensorDictBase::assign(const NestedKey& key, Value value) {
    return set(key, std::move(value), false);
}

TensorDictBase& TensorDictBase::assign_at(const Index& index, const TensorDictBase& other) {
    TensorDictPtr sub;
    for (const auto& atom : other.atom_keys()) {
        Value v = other.get_atom(atom);
        if (has_atom(atom)) {
            set_at_(atom, v, index);
            continue;
        }
        if (!sub)
            sub = get_sub_tensordict(index);
        sub->set(atom, std::move(v));
    }
    return *this;
}

Value TensorDictBase::setdefault(const NestedKey& key, Value default_value) {
    if (!has_key(key))
        set(key, std::move(default_value));
    return get(key);
}

TensorDictBase& TensorDictBase::del_(const NestedKey& key) {
    TensorDictBase* current = this;
    TensorDictPtr holder;
    if (key.is_nested()) {
        holder = get_tensordict(key.parent());
        current = holder.get();
    }
    if (!current->has_atom(key.back()))
        throw_key_missing(*current, key.back());
    current->del_atom(key.back());
    return *this;
}

Value TensorDictBase::pop(const NestedKey& key) {
    if (!has_key(key))
        throw KeyMissingError(fmt::format(
            "You are trying to pop key {} which is not in dict without providing default value.",
            key.to_string()));
    Value v = get(key);
    del_(key);
    return v;
}

Value TensorDictBase::pop(const NestedKey& key, const Value& default_value) {
    if (!has_key(key))
        return default_value;
    return pop(key);
}

TensorDictBase& TensorDictBase::rename_key_(const NestedKey& old_key, const NestedKey& new_key,
                                            bool safe) {
    check_unlocked();
    if (old_key == new_key)
        return *this;
    if (safe && has_key(new_key))
        throw KeyCollisionError(
            fmt::format("key {} already present in {}.", new_key.to_string(), type_name()));
    Value v = get(old_key);
    set(new_key, std::move(v));
    del_(old_key);
    return *this;
}

// ---------------------------------------------------------------------------
// enumeration
// ---------------------------------------------------------------------------

std::vector<NestedKey> TensorDictBase::compute_keys(bool include_nested, bool leaves_only) const {
    std::vector<NestedKey> out;
    for (const auto& atom : atom_keys()) {
        const bool nested = atom_is_tensordict(atom);
        if (!nested || !leaves_only)
            out.emplace_back(atom);
        if (nested && include_nested) {
            auto td = std::get<TensorDictPtr>(get_atom(atom));
            for (const auto& sub : td->keys(true, leaves_only))
                out.push_back(sub.prepend(atom));
        }
    }
    return out;
}

std::vector<NestedKey> TensorDictBase::keys(bool include_nested, bool leaves_only) const {
    EnumerationCache* c = cache();
    if (!c)
        return compute_keys(include_nested, leaves_only);
    const auto slot = std::make_pair(include_nested, leaves_only);
    auto it = c->keys.find(slot);
    if (it == c->keys.end())
        it = c->keys.emplace(slot, compute_keys(include_nested, leaves_only)).first;
    return it->second;
}

std::vector<Value> TensorDictBase::values(bool include_nested, bool leaves_only) const {
    std::vector<Value> out;
    for (const auto& key : keys(include_nested, leaves_only))
        out.push_back(get(key));
    return out;
}

std::vector<Item> TensorDictBase::items(bool include_nested, bool leaves_only) const {
    std::vector<Item> out;
    for (const auto& key : keys(include_nested, leaves_only))
        out.emplace_back(key, get(key));
    return out;
}

std::vector<std::string> TensorDictBase::sorted_keys() const {
    EnumerationCache* c = cache();
    if (c && c->sorted_keys)
        return *c->sorted_keys;
    auto out = atom_keys();
    std::sort(out.begin(), out.end());
    if (c)
        c->sorted_keys = out;
    return out;
}

// ---------------------------------------------------------------------------
// structure
// ---------------------------------------------------------------------------

TensorDictPtr TensorDictBase::select(const std::vector<NestedKey>& keys, bool inplace, bool strict) {
    if (inplace)
        check_unlocked();
    auto groups = group_by_head(keys);
    auto out = plain_like(*this);
    for (const auto& [atom, tails] : groups) {
        if (!has_atom(atom)) {
            if (strict)
                throw_key_missing(*this, atom);
            continue;
        }
        Value v = get_atom(atom);
        if (!tails.empty()) {
            if (!is_tensordict(v)) {
                if (strict)
                    throw_key_missing(*this, tails.front().prepend(atom).join("."));
                continue;
            }
            v = std::get<TensorDictPtr>(v)->select(tails, inplace, strict);
        }
        out->set_atom(atom, std::move(v), false);
    }
    if (!inplace)
        return out;
    for (const auto& atom : atom_keys())
        if (!out->has_atom(atom))
            del_atom(atom);
    return self();
}

TensorDictPtr TensorDictBase::exclude(const std::vector<NestedKey>& keys, bool inplace) {
    if (inplace)
        check_unlocked();
    auto groups = group_by_head(keys);
    auto find_group = [&](const std::string& atom) {
        return std::find_if(groups.begin(), groups.end(),
                            [&](const auto& g) { return g.first == atom; });
    };
    if (inplace) {
        for (const auto& [atom, tails] : groups) {
            if (!has_atom(atom))
                continue;
            if (tails.empty())
                del_atom(atom);
            else if (atom_is_tensordict(atom))
                std::get<TensorDictPtr>(get_atom(atom))->exclude(tails, true);
        }
        return self();
    }
    auto out = plain_like(*this);
    for (const auto& atom : atom_keys()) {
        auto g = find_group(atom);
        if (g != groups.end() && g->second.empty())
            continue;
        Value v = get_atom(atom);
        if (g != groups.end() && is_tensordict(v))
            v = std::get<TensorDictPtr>(v)->exclude(g->second, false);
        out->set_atom(atom, std::move(v), false);
    }
    return out;
}

TensorDictPtr TensorDictBase::flatten_keys_impl(const std::string& separator) const {
    auto out = plain_like(*this);
    auto put = [&](const std::string& key, Value v) {
        if (out->has_atom(key))
            throw KeyCollisionError(fmt::format(
                "Flattening keys in tensordict collides with existing key '{}'", key));
        out->set_atom(key, std::move(v), false);
    };
    for (const auto& atom : atom_keys()) {
        Value v = get_atom(atom);
        if (!is_tensordict(v)) {
            put(atom, std::move(v));
            continue;
        }
        auto inner = std::get<TensorDictPtr>(v)->flatten_keys(separator, false);
        for (const auto& inner_atom : inner->atom_keys())
            put(atom + separator + inner_atom, inner->get_atom(inner_atom));
    }
    return out;
}

TensorDictPtr TensorDictBase::flatten_keys(const std::string& separator, bool inplace) {
    if (!inplace) {
        EnumerationCache* c = cache();
        if (!c)
            return flatten_keys_impl(separator);
        auto it = c->flattened.find(separator);
        if (it == c->flattened.end())
            it = c->flattened.emplace(separator, flatten_keys_impl(separator)).first;
        return it->second;
    }
    check_unlocked();
    auto flat = flatten_keys_impl(separator);
    for (const auto& atom : atom_keys())
        if (atom_is_tensordict(atom))
            del_atom(atom);
    for (const auto& atom : flat->atom_keys())
        if (!has_atom(atom))
            set_atom(atom, flat->get_atom(atom), false);
    return self();
}

TensorDictPtr TensorDictBase::unflatten_keys_impl(const std::string& separator) const {
    auto out = plain_like(*this);
    const auto atoms = atom_keys();
    std::vector<std::pair<std::string, std::vector<std::pair<std::string, Value>>>> groups;
    for (const auto& atom : atoms) {
        auto parts = split_key(atom, separator);
        if (parts.size() == 1) {
            out->set_atom(atom, get_atom(atom), false);
            continue;
        }
        if (std::find(atoms.begin(), atoms.end(), parts.front()) != atoms.end())
            throw KeyCollisionError(
                "Unflattening key(s) in tensordict will override existing unflattened key");
        std::string rest = NestedKey{std::vector<std::string>(parts.begin() + 1, parts.end())}.join(separator);
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& g) { return g.first == parts.front(); });
        if (it == groups.end()) {
            groups.emplace_back(parts.front(), std::vector<std::pair<std::string, Value>>{});
            it = groups.end() - 1;
        }
        it->second.emplace_back(std::move(rest), get_atom(atom));
    }
    for (auto& [head, entries] : groups) {
        auto nested = plain_like(*this);
        for (auto& [rest, v] : entries)
            nested->set_atom(rest, std::move(v), false);
        out->set_atom(head, nested->unflatten_keys(separator, false), false);
    }
    return out;
}

TensorDictPtr TensorDictBase::unflatten_keys(const std::string& separator, bool inplace) {
    if (!inplace) {
        EnumerationCache* c = cache();
        if (!c)
            return unflatten_keys_impl(separator);
        auto it = c->unflattened.find(separator);
        if (it == c->unflattened.end())
            it = c->unflattened.emplace(separator, unflatten_keys_impl(separator)).first;
        return it->second;
    }
    check_unlocked();
    auto nested = unflatten_keys_impl(separator);
    for (const auto& atom : atom_keys())
        del_atom(atom);
    for (const auto& atom : nested->atom_keys())
        set_atom(atom, nested->get_atom(atom), false);
    return self();
}

TensorDictPtr TensorDictBase::empty(bool recurse) const {
    auto out = plain_like(*this);
    if (!recurse)
        return out;
    for (const auto& atom : atom_keys())
        if (atom_is_tensordict(atom))
            out->set_atom(atom, std::get<TensorDictPtr>(get_atom(atom))->empty(true), false);
    return out;
}

TensorDictBase& TensorDictBase::update(const TensorDictBase& other, bool inplace) {
    for (const auto& atom : other.atom_keys()) {
        Value v = other.get_atom(atom);
        if (is_tensordict(v) && has_atom(atom) && atom_is_tensordict(atom)) {
            std::get<TensorDictPtr>(get_atom(atom))->update(*std::get<TensorDictPtr>(v), inplace);
            continue;
        }
        set(atom, std::move(v), inplace);
    }
    return *this;
}

TensorDictBase& TensorDictBase::update_(const TensorDictBase& other) {
    for (const auto& atom : other.atom_keys()) {
        Value v = other.get_atom(atom);
        if (is_tensordict(v) && has_atom(atom) && atom_is_tensordict(atom)) {
            std::get<TensorDictPtr>(get_atom(atom))->update_(*std::get<TensorDictPtr>(v));
            continue;
        }
        set_(atom, std::move(v));
    }
    return *this;
}

TensorDictBase& TensorDictBase::update_at_(const TensorDictBase& other, const Index& index) {
    for (const auto& atom : other.atom_keys())
        set_at_(atom, other.get_atom(atom), index);
    return *this;
}

TensorDictPtr TensorDictBase::apply(const std::function<Tensor(const Tensor&)>& fn,
                                    std::optional<Shape> batch_size) const {
    auto out = batch_size ? std::make_shared<TensorDict>(*batch_size, device()) : plain_like(*this);
    for (const auto& atom : atom_keys()) {
        Value v = get_atom(atom);
        if (is_tensordict(v))
            out->set_atom(atom, std::get<TensorDictPtr>(v)->apply(fn), false);
        else
            out->set_atom(atom, fn(std::get<Tensor>(v)), false);
    }
    return out;
}

TensorDictBase& TensorDictBase::apply_(const std::function<Tensor(const Tensor&)>& fn) {
    for (const auto& atom : atom_keys()) {
        Value v = get_atom(atom);
        if (is_tensordict(v))
            std::get<TensorDictPtr>(v)->apply_(fn);
        else
            set_atom(atom, fn(std::get<Tensor>(v)), true);
    }
    return *this;
}

TensorDictBase& TensorDictBase::fill_(const NestedKey& key, double value) {
    Value v = get(key);
    if (is_tensordict(v)) {
        auto nested = std::get<TensorDictPtr>(v);
        for (const auto& leaf : nested->keys(true, true))
            nested->fill_(leaf, value);
        return *this;
    }
    Tensor leaf = std::get<Tensor>(v);
    leaf.fill_(value);
    return set_(key, leaf);
}

TensorDictBase& TensorDictBase::zero_() {
    for (const auto& key : keys(true, true))
        fill_(key, 0.0);
    return *this;
}

TensorDictBase& TensorDictBase::masked_fill_(const Tensor& mask, double value) {
    if (mask.dtype() != DType::Bool)
        throw TypeMismatchError("masked_fill_ expects a boolean mask");
    for (const auto& key : keys(true, true)) {
        Tensor leaf = get_tensor(key);
        set_at_(key, Tensor::full({}, value, leaf.dtype()), Index{mask});
    }
    return *this;
}

TensorDictPtr TensorDictBase::masked_fill(const Tensor& mask, double value) const {
    auto out = clone();
    out->masked_fill_(mask, value);
    return out;
}

TensorDictPtr TensorDictBase::clone(bool recurse) const {
    if (recurse)
        return to_tensordict();
    return plain_copy(*this, [](const Tensor& t) { return t; });
}

TensorDictPtr TensorDictBase::to_tensordict() const {
    return plain_copy(*this, [](const Tensor& t) { return t.clone(); });
}

TensorDictPtr TensorDictBase::contiguous() const {
    return plain_copy(*this, [](const Tensor& t) { return t.contiguous(); });
}

TensorDictPtr TensorDictBase::to(const Device& device) const {
    if (this->device() && *this->device() == device)
        return self();
    auto out = std::make_shared<TensorDict>(batch_size(), device, has_names() ? names() : Names{});
    for (const auto& atom : atom_keys()) {
        Value v = get_atom(atom);
        if (is_tensordict(v))
            out->set_atom(atom, std::get<TensorDictPtr>(v)->to(device), false);
        else
            out->set_atom(atom, std::get<Tensor>(v).to(device), false);
    }
    return out;
}

bool TensorDictBase::is_empty() const { return keys(true, true).empty(); }

bool TensorDictBase::all_equal(const TensorDictBase& other) const {
    if (batch_size() != other.batch_size())
        return false;
    auto mine = keys(true, true);
    auto theirs = other.keys(true, true);
    std::sort(mine.begin(), mine.end());
    std::sort(theirs.begin(), theirs.end());
    if (mine != theirs)
        return false;
    for (const auto& key : mine)
        if (!get_tensor(key).equal(other.get_tensor(key)))
            return false;
    return true;
}

bool TensorDictBase::all_close(const TensorDictBase& other, double rtol, double atol) const {
    if (batch_size() != other.batch_size())
        return false;
    auto mine = keys(true, true);
    auto theirs = other.keys(true, true);
    std::sort(mine.begin(), mine.end());
    std::sort(theirs.begin(), theirs.end());
    if (mine != theirs)
        return false;
    for (const auto& key : mine)
        if (!get_tensor(key).allclose(other.get_tensor(key), rtol, atol))
            return false;
    return true;
}

// ---------------------------------------------------------------------------
// shape algebra
// ---------------------------------------------------------------------------

TensorDictPtr TensorDictBase::index(const Index& index) {
    const Index items = expand_ellipsis(index, batch_dims());
    const Shape batch = indexed_shape(batch_size(), items);
    auto out = std::make_shared<TensorDict>(batch, device(),
                                            has_names() ? indexed_names(names(), items) : Names{});
    for (const auto& atom : atom_keys()) {
        Value v = get_atom(atom);
        if (is_tensordict(v))
            out->set_atom(atom, std::get<TensorDictPtr>(v)->index(items), false);
        else
            out->set_atom(atom, std::get<Tensor>(v).index(items), false);
    }
    return out;
}

TensorDictPtr TensorDictBase::lazy_index(const Index& index) {
    return std::make_shared<IndexedTensorDict>(self(), index);
}

TensorDictPtr TensorDictBase::permute(const std::vector<std::int64_t>& dims) {
    const std::int64_t n = batch_dims();
    std::vector<std::int64_t> normalized;
    normalized.reserve(dims.size());
    for (auto d : dims)
        normalized.push_back(normalize_dim(d, n));
    if (static_cast<std::int64_t>(normalized.size()) != n)
        throw ShapeMismatchError(fmt::format(
            "number of dims don't match in permute (got {}, expected {})", normalized.size(), n));
    std::vector<bool> seen(static_cast<std::size_t>(n), false);
    for (auto d : normalized) {
        if (seen[static_cast<std::size_t>(d)])
            throw ShapeMismatchError("repeated dim in permute");
        seen[static_cast<std::size_t>(d)] = true;
    }
    std::vector<std::int64_t> identity(static_cast<std::size_t>(n));
    std::iota(identity.begin(), identity.end(), 0);
    if (normalized == identity)
        return self();
    return std::make_shared<PermutedTensorDict>(self(), std::move(normalized));
}

TensorDictPtr TensorDictBase::transpose(std::int64_t dim0, std::int64_t dim1) {
    const auto d0 = normalize_dim(dim0, batch_dims());
    const auto d1 = normalize_dim(dim1, batch_dims());
    if (d0 == d1)
        return self();
    return std::make_shared<TransposedTensorDict>(self(), d0, d1);
}

TensorDictPtr TensorDictBase::squeeze(std::optional<std::int64_t> dim) {
    const Shape batch = batch_size();
    if (batch.empty())
        return self();
    if (!dim) {
        TensorDictPtr out = self();
        for (auto d = static_cast<std::int64_t>(batch.size()) - 1; d >= 0; --d)
            if (batch[static_cast<std::size_t>(d)] == 1)
                out = out->squeeze(d);
        return out;
    }
    const auto d = normalize_dim(*dim, batch_dims());
    if (batch[static_cast<std::size_t>(d)] != 1)
        return self();
    return std::make_shared<SqueezedTensorDict>(self(), d);
}

TensorDictPtr TensorDictBase::unsqueeze(std::int64_t dim) {
    const auto d = normalize_dim(dim, batch_dims() + 1);
    return std::make_shared<UnsqueezedTensorDict>(self(), d);
}

TensorDictPtr TensorDictBase::view(const Shape& shape) {
    Shape target = infer_view_shape(shape, numel());
    if (target == batch_size())
        return self();
    return std::make_shared<ViewedTensorDict>(self(), std::move(target));
}

TensorDictPtr TensorDictBase::reshape(const Shape& shape) const {
    const Shape target = infer_view_shape(shape, numel());
    const auto ndim = static_cast<std::size_t>(batch_dims());
    auto out = std::make_shared<TensorDict>(target, device());
    for (const auto& atom : atom_keys()) {
        Value v = get_atom(atom);
        Shape full = target;
        const Shape vs = value_shape(v);
        full.insert(full.end(), vs.begin() + static_cast<std::ptrdiff_t>(ndim), vs.end());
        if (is_tensordict(v))
            out->set_atom(atom, std::get<TensorDictPtr>(v)->reshape(full), false);
        else
            out->set_atom(atom, std::get<Tensor>(v).reshape(full), false);
    }
    return out;
}

TensorDictPtr TensorDictBase::expand(const Shape& shape) const {
    const auto ndim = static_cast<std::size_t>(batch_dims());
    if (shape.size() < ndim)
        throw ShapeMismatchError(fmt::format(
            "the number of sizes provided ({}) must be greater or equal to the number of "
            "dimensions in the TensorDict ({})",
            shape.size(), ndim));
    auto out = std::make_shared<TensorDict>(shape, device());
    for (const auto& atom : atom_keys()) {
        Value v = get_atom(atom);
        Shape full = shape;
        const Shape vs = value_shape(v);
        full.insert(full.end(), vs.begin() + static_cast<std::ptrdiff_t>(ndim), vs.end());
        if (is_tensordict(v))
            out->set_atom(atom, std::get<TensorDictPtr>(v)->expand(full), false);
        else
            out->set_atom(atom, std::get<Tensor>(v).expand(full), false);
    }
    return out;
}

std::vector<TensorDictPtr> TensorDictBase::unbind(std::int64_t dim) {
    const auto d = normalize_dim(dim, batch_dims());
    const std::int64_t n = batch_size()[static_cast<std::size_t>(d)];
    std::vector<TensorDictPtr> out;
    out.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        Index idx = leading_slices(d);
        idx.emplace_back(i);
        out.push_back(index(idx));
    }
    return out;
}

std::vector<TensorDictPtr> TensorDictBase::split(std::int64_t split_size, std::int64_t dim) {
    if (split_size <= 0)
        throw ValueError(fmt::format("split_size must be positive, got {}", split_size));
    const auto d = normalize_dim(dim, batch_dims());
    const std::int64_t n = batch_size()[static_cast<std::size_t>(d)];
    std::vector<std::int64_t> sizes;
    for (std::int64_t start = 0; start < n; start += split_size)
        sizes.push_back(std::min(split_size, n - start));
    return split(sizes, d);
}

std::vector<TensorDictPtr> TensorDictBase::split(const std::vector<std::int64_t>& sizes,
                                                 std::int64_t dim) {
    const auto d = normalize_dim(dim, batch_dims());
    const std::int64_t n = batch_size()[static_cast<std::size_t>(d)];
    const std::int64_t total = std::accumulate(sizes.begin(), sizes.end(), std::int64_t{0});
    if (total != n)
        throw ValueError(fmt::format(
            "Split method expects split_size to sum exactly to {} (tensordict's batch size), but "
            "got {}",
            n, total));
    std::vector<TensorDictPtr> out;
    std::int64_t start = 0;
    for (auto s : sizes) {
        Index idx = leading_slices(d);
        idx.emplace_back(Slice{start, start + s});
        out.push_back(index(idx));
        start += s;
    }
    return out;
}

std::vector<TensorDictPtr> TensorDictBase::chunk(std::int64_t chunks, std::int64_t dim) {
    if (chunks < 1)
        throw ValueError(fmt::format("chunks must be a strictly positive integer, got {}.", chunks));
    const auto d = normalize_dim(dim, batch_dims());
    const std::int64_t n = batch_size()[static_cast<std::size_t>(d)];
    return split(std::max<std::int64_t>(1, (n + chunks - 1) / chunks), d);
}

TensorDictPtr TensorDictBase::get_sub_tensordict(const Index& index) {
    return std::make_shared<SubTensorDict>(self(), index);
}

// ---------------------------------------------------------------------------
// lock graph
// ---------------------------------------------------------------------------
// Locking the root registers the root's id (and the ids of every ancestor
// in between) in each descendant's lock_ids. A descendant shared by two
// locked roots therefore carries both ids, and unlocking one root leaves it
// locked by the other: such an unlock is rejected before anything changes.
// ---------------------------------------------------------------------------

TensorDictBase& TensorDictBase::lock_() {
    if (is_locked())
        return *this;
    propagate_lock({});
    return *this;
}

TensorDictBase& TensorDictBase::unlock_() {
    std::map<const TensorDictBase*, LockIds> released;
    collect_unlock({}, released);
    for (const auto& [td, ids] : released) {
        LockIds held = td->lock_ids();
        for (auto id : ids)
            held.erase(id);
        if (held.empty())
            continue;
        log_debug("unlock of {} #{} rejected: {} #{} is still held by {} other lock(s)", type_name(),
                  id(), td->type_name(), td->id(), held.size());
        throw LockedMutationError(kUnlockGraphMessage);
    }
    propagate_unlock({});
    return *this;
}

void TensorDictBase::propagate_lock(const LockIds& ids) {
    is_locked_ = true;
    lock_ids_.insert(ids.begin(), ids.end());
    LockIds child_ids = ids;
    child_ids.insert(id_);
    for (const auto& atom : atom_keys()) {
        if (!atom_is_tensordict(atom))
            continue;
        auto nested = std::get<TensorDictPtr>(get_atom(atom));
        nested->propagate_lock(child_ids);
        if (std::find(locked_children_.begin(), locked_children_.end(), nested) == locked_children_.end())
            locked_children_.push_back(nested);
    }
}

void TensorDictBase::propagate_unlock(const LockIds& ids) {
    is_locked_ = false;
    for (auto id : ids)
        lock_ids_.erase(id);
    ++lock_generation_;
    erase_cache();
    LockIds child_ids = ids;
    child_ids.insert(id_);
    for (const auto& atom : atom_keys()) {
        if (atom_is_tensordict(atom))
            std::get<TensorDictPtr>(get_atom(atom))->propagate_unlock(child_ids);
    }
    locked_children_.clear();
}

void TensorDictBase::remove_lock(std::uint64_t id) {
    lock_ids_.erase(id);
    for (auto& child : locked_children_)
        child->remove_lock(id);
}

void TensorDictBase::collect_unlock(const LockIds& ids,
                                    std::map<const TensorDictBase*, LockIds>& released) const {
    released[this].insert(ids.begin(), ids.end());
    LockIds child_ids = ids;
    child_ids.insert(id_);
    for (const auto& atom : atom_keys()) {
        if (atom_is_tensordict(atom))
            std::get<TensorDictPtr>(get_atom(atom))->collect_unlock(child_ids, released);
    }
}

// ---------------------------------------------------------------------------
// persistence
// ---------------------------------------------------------------------------

TensorDictPtr TensorDictBase::memmap(const std::optional<std::string>& prefix) const {
    auto out = to_tensordict();
    out->memmap_(prefix);
    return out;
}

TensorDictPtr TensorDictBase::memmap_like(const std::optional<std::string>& prefix) const {
    auto out = apply([](const Tensor& t) { return Tensor{t.dtype(), t.shape(), t.device()}; });
    out->memmap_(prefix);
    return out;
}

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------

void TensorDictBase::check_unlocked() const {
    if (is_locked())
        throw LockedMutationError(kLockedMessage);
}

void TensorDictBase::check_batch_prefix(const std::string& key, const Value& value) const {
    const Shape batch = batch_size();
    const Shape shape = value_shape(value);
    const bool ok = shape.size() >= batch.size() && std::equal(batch.begin(), batch.end(), shape.begin());
    if (ok)
        return;
    const Shape prefix(shape.begin(),
                       shape.begin() + static_cast<std::ptrdiff_t>(std::min(shape.size(), batch.size())));
    throw ShapeMismatchError(fmt::format(
        "batch dimension mismatch, got self.batch_size={} and value.shape[:self.batch_dims]={} "
        "with value of shape {} for key '{}'",
        shape_to_string(batch), shape_to_string(prefix), shape_to_string(shape), key));
}

EnumerationCache* TensorDictBase::cache() const {
    if (!cache_valid())
        return nullptr;
    const auto generation = lock_generation();
    if (!cache_ || cache_generation_ != generation) {
        cache_ = std::make_unique<EnumerationCache>();
        cache_generation_ = generation;
    }
    return cache_.get();
}

TensorDictPtr TensorDictBase::self() const {
    return std::const_pointer_cast<TensorDictBase>(shared_from_this());
}

} // namespace tensordict
