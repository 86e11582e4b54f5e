#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "tensordict/config.hpp"

namespace tensordict {

/// Supported element types.
enum class DType { Bool, UInt8, Int32, Int64, Float32, Float64 };

using Shape = std::vector<std::int64_t>;
using Device = std::string;

class IndexItem;
using Index = std::vector<IndexItem>;

/**
 * @brief Return the size in bytes of a single element for the given type.
 */
std::size_t dtype_size(DType dt);

/// Short name used in error messages and metadata ("float32", "int64", ...).
const char* dtype_name(DType dt);

/// Inverse of dtype_name(). Throws ValueError on unknown names.
DType parse_dtype(const std::string& name);

/// Format a shape as "[3, 4]".
std::string shape_to_string(const Shape& s);

/// Number of elements described by a shape.
std::int64_t shape_numel(const Shape& s);

/// Row-major strides for a shape, in elements.
Shape contiguous_strides(const Shape& s);

/// Wrap a possibly negative dimension into [0, ndim). Throws IndexError.
std::int64_t normalize_dim(std::int64_t dim, std::int64_t ndim);

/// Resolve a single -1 entry of @p requested so that it holds @p numel elements.
Shape infer_view_shape(const Shape& requested, std::int64_t numel);

/// Common shape of two broadcastable shapes. Throws ShapeMismatchError.
Shape broadcast_shapes(const Shape& a, const Shape& b);

/// Whether @p src broadcasts to @p dst without changing @p dst.
bool broadcastable_to(const Shape& src, const Shape& dst);

/// Whether a value of shape @p src can be copied into a leaf of shape @p dst:
/// it broadcasts, or it only lacks the trailing singleton dimensions of @p dst.
bool writable_into(const Shape& src, const Shape& dst);

template <typename T> constexpr DType dtype_of();
template <> constexpr DType dtype_of<bool>() { return DType::Bool; }
template <> constexpr DType dtype_of<std::uint8_t>() { return DType::UInt8; }
template <> constexpr DType dtype_of<std::int32_t>() { return DType::Int32; }
template <> constexpr DType dtype_of<std::int64_t>() { return DType::Int64; }
template <> constexpr DType dtype_of<float>() { return DType::Float32; }
template <> constexpr DType dtype_of<double>() { return DType::Float64; }

namespace detail {
double load_element(const std::byte* p, DType dt);
void store_element(std::byte* p, DType dt, double value);
} // namespace detail

/**
 * @brief Reference counted byte buffer backing one or more tensors.
 *
 * A storage is either plain heap memory, an anonymous shared mapping that
 * survives fork() (see share_memory_()) or a file mapping used by the memmap
 * layer. Tensors never own bytes directly; they keep a shared_ptr to their
 * storage so that views, stacks and sub-containers alias the same data.
 */
class Storage {
  public:
    enum class Kind { Heap, Shared, File };

    static std::shared_ptr<Storage> allocate(std::size_t nbytes);
    static std::shared_ptr<Storage> allocate_shared(std::size_t nbytes);
    /**
     * @brief Map @p path read-write.
     *
     * When @p create is true the file is created (or truncated) and resized
     * to @p nbytes. Otherwise the file must already hold at least @p nbytes.
     * A temporary storage unlinks its file when released.
     */
    static std::shared_ptr<Storage> map_file(const std::string& path, std::size_t nbytes,
                                             bool create, bool temporary = false);

    ~Storage();
    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    std::byte* data() { return data_; }
    const std::byte* data() const { return data_; }
    std::size_t nbytes() const { return nbytes_; }
    Kind kind() const { return kind_; }
    const std::string& filename() const { return filename_; }

    /// Move heap bytes into an anonymous shared mapping. No-op if already shared.
    void share_memory_();

  private:
    Storage() = default;
    void release() noexcept;

    Kind kind_{Kind::Heap};
    std::vector<std::byte> heap_{};
    std::byte* data_{nullptr};
    std::size_t nbytes_{0};
    void* map_{nullptr};
    std::size_t map_size_{0};
    int fd_{-1};
    std::string filename_{};
    bool temporary_{false};
};

/**
 * @brief Strided n-dimensional array handle.
 *
 * A Tensor is a lightweight descriptor (shape, strides, offset, dtype and
 * device tag) over a shared Storage. Copying a Tensor aliases the same bytes;
 * clone() is the only way to obtain an independent buffer. View operations
 * (select, slice, permute, transpose, squeeze, unsqueeze, view, expand and
 * basic indexing) never copy. Advanced indexing with an integer or boolean
 * tensor returns a fresh buffer.
 */
class Tensor {
  public:
    Tensor() = default;
    /// Zero initialised contiguous tensor.
    Tensor(DType dtype, Shape shape, Device device = default_device());
    Tensor(std::shared_ptr<Storage> storage, DType dtype, Shape shape, Shape strides,
           std::int64_t offset, Device device);

    static Tensor zeros(const Shape& shape, DType dtype = DType::Float32);
    static Tensor ones(const Shape& shape, DType dtype = DType::Float32);
    static Tensor full(const Shape& shape, double value, DType dtype = DType::Float32);
    static Tensor arange(std::int64_t n, DType dtype = DType::Int64);
    /// Uniform samples in [0, 1).
    static Tensor rand(const Shape& shape, DType dtype = DType::Float32);
    /// Standard normal samples.
    static Tensor randn(const Shape& shape, DType dtype = DType::Float32);
    static void manual_seed(std::uint64_t seed);

    template <typename T> static Tensor from_vector(const std::vector<T>& values, Shape shape) {
        if (static_cast<std::int64_t>(values.size()) != shape_numel(shape))
            throw std::invalid_argument("from_vector: value count does not match shape");
        Tensor out{dtype_of<T>(), std::move(shape)};
        std::byte* dst = out.mutable_data();
        if constexpr (std::is_same_v<T, bool>) {
            for (std::size_t i = 0; i < values.size(); ++i)
                detail::store_element(dst + i, DType::Bool, values[i] ? 1.0 : 0.0);
        } else {
            std::memcpy(dst, values.data(), values.size() * sizeof(T));
        }
        return out;
    }

    template <typename T> static Tensor from_vector(const std::vector<T>& values) {
        return from_vector(values, Shape{static_cast<std::int64_t>(values.size())});
    }

    bool defined() const { return storage_ != nullptr; }
    const Shape& shape() const { return shape_; }
    const Shape& strides() const { return strides_; }
    std::int64_t dim() const { return static_cast<std::int64_t>(shape_.size()); }
    std::int64_t size(std::int64_t d) const;
    std::int64_t numel() const { return shape_numel(shape_); }
    DType dtype() const { return dtype_; }
    const Device& device() const { return device_; }
    std::int64_t offset() const { return offset_; }
    const std::shared_ptr<Storage>& storage() const { return storage_; }

    bool is_contiguous() const;
    bool is_shared() const;
    bool is_memmap() const;
    /// Backing file of a memmap tensor, empty otherwise.
    std::string filename() const;
    /// True when both handles describe exactly the same memory layout.
    bool is_same(const Tensor& other) const;

    Tensor select(std::int64_t dim, std::int64_t i) const;
    Tensor slice(std::int64_t dim, std::optional<std::int64_t> start,
                 std::optional<std::int64_t> stop, std::int64_t step = 1) const;
    Tensor permute(const std::vector<std::int64_t>& dims) const;
    Tensor transpose(std::int64_t d0, std::int64_t d1) const;
    /// Drop @p dim if it has size one, otherwise return an alias.
    Tensor squeeze(std::int64_t dim) const;
    Tensor unsqueeze(std::int64_t dim) const;
    /// Reinterpret the layout; throws ShapeMismatchError when impossible.
    Tensor view(const Shape& shape) const;
    /// view() when possible, a contiguous copy otherwise.
    Tensor reshape(const Shape& shape) const;
    Tensor expand(const Shape& shape) const;
    std::vector<Tensor> unbind(std::int64_t dim) const;
    Tensor index(const Index& index) const;

    Tensor clone() const;
    Tensor contiguous() const;
    Tensor to(const Device& device) const;
    Tensor to(DType dtype) const;

    /// Broadcasting, casting element copy from @p src.
    Tensor& copy_(const Tensor& src);
    Tensor& fill_(double value);
    Tensor& zero_() { return fill_(0.0); }
    Tensor& index_put_(const Index& index, const Tensor& value);
    /// In-place share of the underlying storage, visible through all aliases.
    Tensor& share_memory_();

    /// Same shape and element values (compared after conversion to double).
    bool equal(const Tensor& other) const;
    bool allclose(const Tensor& other, double rtol = 1e-5, double atol = 1e-8) const;
    /// True when every element is non-zero.
    bool all() const;
    /// True when at least one element is non-zero.
    bool any() const;
    /// Elementwise equality as a Bool tensor of the broadcast shape.
    Tensor eq(const Tensor& other) const;

    template <typename T> T item() const {
        if (numel() != 1)
            throw std::invalid_argument("a Tensor with " + std::to_string(numel()) +
                                        " elements cannot be converted to a scalar");
        return static_cast<T>(detail::load_element(element_ptr(Shape(shape_.size(), 0)), dtype_));
    }

    template <typename T> T at(const std::vector<std::int64_t>& coords) const {
        return static_cast<T>(detail::load_element(element_ptr(coords), dtype_));
    }

    template <typename T> std::vector<T> to_vector() const {
        Tensor c = contiguous();
        std::vector<T> out(static_cast<std::size_t>(c.numel()));
        const std::byte* src = c.data();
        const std::size_t es = dtype_size(dtype_);
        for (std::size_t i = 0; i < out.size(); ++i) {
            if constexpr (!std::is_same_v<T, bool>) {
                if (dtype_ == dtype_of<T>()) {
                    std::memcpy(&out[i], src + i * es, sizeof(T));
                    continue;
                }
            }
            out[i] = static_cast<T>(detail::load_element(src + i * es, dtype_));
        }
        return out;
    }

    static Tensor stack(const std::vector<Tensor>& tensors, std::int64_t dim);
    static Tensor cat(const std::vector<Tensor>& tensors, std::int64_t dim);

    /// Pointer to the first element (honours the offset).
    const std::byte* data() const;
    std::byte* mutable_data();

  private:
    const std::byte* element_ptr(const std::vector<std::int64_t>& coords) const;

    std::shared_ptr<Storage> storage_{};
    DType dtype_{DType::Float32};
    Shape shape_{};
    Shape strides_{};
    std::int64_t offset_{0};
    Device device_{};
};

} // namespace tensordict
