#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tensordict/tensor.hpp"

namespace tensordict {

/// Half-open start:stop:step range. Missing bounds cover the whole axis.
struct Slice {
    std::optional<std::int64_t> start{};
    std::optional<std::int64_t> stop{};
    std::int64_t step{1};
};

/// Expands to as many full slices as needed.
struct Ellipsis {};

/// Inserts a new axis of size one.
struct NewAxis {};

inline constexpr Ellipsis ellipsis{};
inline constexpr NewAxis newaxis{};

/**
 * @brief One element of an index expression.
 *
 * Integers select (and drop) a dimension, slices keep it, NewAxis inserts
 * one and Ellipsis stands for every dimension not named explicitly. A tensor
 * item is an advanced index: an integer tensor gathers along one dimension,
 * a boolean tensor masks as many dimensions as it has.
 */
class IndexItem {
  public:
    enum class Kind { Integer, Slice, Ellipsis, NewAxis, Tensor };

    IndexItem(int v) : value_{static_cast<std::int64_t>(v)} {}
    IndexItem(std::int64_t v) : value_{v} {}
    IndexItem(Slice s) : value_{s} {}
    IndexItem(Ellipsis e) : value_{e} {}
    IndexItem(NewAxis n) : value_{n} {}
    IndexItem(Tensor t) : value_{std::move(t)} {}

    Kind kind() const { return static_cast<Kind>(value_.index()); }
    bool is_integer() const { return kind() == Kind::Integer; }
    bool is_slice() const { return kind() == Kind::Slice; }
    bool is_ellipsis() const { return kind() == Kind::Ellipsis; }
    bool is_newaxis() const { return kind() == Kind::NewAxis; }
    bool is_tensor() const { return kind() == Kind::Tensor; }
    /// Boolean tensor index.
    bool is_mask() const { return is_tensor() && tensor().dtype() == DType::Bool; }

    std::int64_t integer() const { return std::get<std::int64_t>(value_); }
    const Slice& slice() const { return std::get<Slice>(value_); }
    const Tensor& tensor() const { return std::get<Tensor>(value_); }

    /// Number of source dimensions consumed by this item.
    std::int64_t consumed_dims() const;
    std::string to_string() const;

  private:
    std::variant<std::int64_t, Slice, Ellipsis, NewAxis, Tensor> value_;
};

/**
 * @brief Replace the (single) ellipsis of @p index with full slices so that
 * the result names every one of @p ndim leading dimensions at most once.
 *
 * Throws IndexError when the index has more than one ellipsis or addresses
 * more dimensions than @p ndim.
 */
Index expand_ellipsis(const Index& index, std::int64_t ndim);

/// Shape obtained by indexing a tensor of shape @p shape with @p index.
Shape indexed_shape(const Shape& shape, const Index& index);

/// Names that survive indexing a batch described by @p names.
std::vector<std::optional<std::string>>
indexed_names(const std::vector<std::optional<std::string>>& names, const Index& index);

/// True when the index only contains integers, slices, None and Ellipsis.
bool is_basic_index(const Index& index);

std::string index_to_string(const Index& index);

} // namespace tensordict
