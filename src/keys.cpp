#include "tensordict/keys.hpp"

#include <fmt/format.h>

#include "tensordict/errors.hpp"

namespace tensordict {

NestedKey::NestedKey(const char* key) : atoms_{std::string{key ? key : ""}} { validate(); }

NestedKey::NestedKey(std::string key) : atoms_{std::move(key)} { validate(); }

NestedKey::NestedKey(std::initializer_list<std::string> atoms) : atoms_{atoms} { validate(); }

NestedKey::NestedKey(std::vector<std::string> atoms) : atoms_{std::move(atoms)} { validate(); }

void NestedKey::validate() const {
    if (atoms_.empty())
        throw ValueError("a key path needs at least one atom");
    for (const auto& atom : atoms_)
        if (atom.empty())
            throw ValueError("key atoms must be non-empty strings");
}

NestedKey NestedKey::tail() const {
    return NestedKey{std::vector<std::string>(atoms_.begin() + 1, atoms_.end())};
}

NestedKey NestedKey::parent() const {
    return NestedKey{std::vector<std::string>(atoms_.begin(), atoms_.end() - 1)};
}

NestedKey NestedKey::append(const std::string& atom) const {
    auto atoms = atoms_;
    atoms.push_back(atom);
    return NestedKey{std::move(atoms)};
}

NestedKey NestedKey::prepend(const std::string& atom) const {
    std::vector<std::string> atoms;
    atoms.reserve(atoms_.size() + 1);
    atoms.push_back(atom);
    atoms.insert(atoms.end(), atoms_.begin(), atoms_.end());
    return NestedKey{std::move(atoms)};
}

std::string NestedKey::join(const std::string& separator) const {
    return fmt::format("{}", fmt::join(atoms_, separator));
}

std::string NestedKey::to_string() const {
    if (atoms_.size() == 1)
        return "'" + atoms_.front() + "'";
    std::vector<std::string> quoted;
    quoted.reserve(atoms_.size());
    for (const auto& a : atoms_)
        quoted.push_back("'" + a + "'");
    return fmt::format("({})", fmt::join(quoted, ", "));
}

std::vector<std::string> split_key(const std::string& joined, const std::string& separator) {
    std::vector<std::string> out;
    if (separator.empty()) {
        out.push_back(joined);
        return out;
    }
    std::size_t start = 0;
    while (true) {
        auto pos = joined.find(separator, start);
        if (pos == std::string::npos) {
            out.push_back(joined.substr(start));
            return out;
        }
        out.push_back(joined.substr(start, pos - start));
        start = pos + separator.size();
    }
}

NestedKey unravel_key(const std::vector<NestedKey>& parts) {
    std::vector<std::string> atoms;
    for (const auto& part : parts)
        atoms.insert(atoms.end(), part.atoms().begin(), part.atoms().end());
    return NestedKey{std::move(atoms)};
}

std::string keys_to_string(const std::vector<NestedKey>& keys) {
    std::vector<std::string> parts;
    parts.reserve(keys.size());
    for (const auto& k : keys)
        parts.push_back(k.to_string());
    return fmt::format("[{}]", fmt::join(parts, ", "));
}

} // namespace tensordict
