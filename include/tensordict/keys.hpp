#pragma once

#include <initializer_list>
#include <string>
#include <vector>

namespace tensordict {

/**
 * @brief Path of string atoms addressing an entry of a nested container.
 *
 * A NestedKey is never empty and none of its atoms is empty. It converts
 * implicitly from a single string so that `td->get("a")` and
 * `td->get({"a", "b"})` both read naturally.
 */
class NestedKey {
  public:
    NestedKey(const char* key);
    NestedKey(std::string key);
    NestedKey(std::initializer_list<std::string> atoms);
    explicit NestedKey(std::vector<std::string> atoms);

    const std::vector<std::string>& atoms() const { return atoms_; }
    std::size_t size() const { return atoms_.size(); }
    const std::string& front() const { return atoms_.front(); }
    const std::string& back() const { return atoms_.back(); }
    const std::string& operator[](std::size_t i) const { return atoms_[i]; }
    bool is_nested() const { return atoms_.size() > 1; }

    /// Path without its first atom. Requires is_nested().
    NestedKey tail() const;
    /// Path without its last atom. Requires is_nested().
    NestedKey parent() const;
    NestedKey append(const std::string& atom) const;
    NestedKey prepend(const std::string& atom) const;

    /// Atoms joined with @p separator.
    std::string join(const std::string& separator) const;
    /// Human readable form: `'a'` or `('a', 'b')`.
    std::string to_string() const;

    bool operator==(const NestedKey& other) const { return atoms_ == other.atoms_; }
    bool operator!=(const NestedKey& other) const { return atoms_ != other.atoms_; }
    bool operator<(const NestedKey& other) const { return atoms_ < other.atoms_; }

  private:
    void validate() const;

    std::vector<std::string> atoms_;
};

/// Split @p joined on every occurrence of @p separator.
std::vector<std::string> split_key(const std::string& joined, const std::string& separator);

/// Concatenate several paths into one (`("a", ("b", "c"))` -> `("a", "b", "c")`).
NestedKey unravel_key(const std::vector<NestedKey>& parts);

std::string keys_to_string(const std::vector<NestedKey>& keys);

} // namespace tensordict
