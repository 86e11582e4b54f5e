#include "tensordict/tensor.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include <fmt/format.h>

#include "tensordict/errors.hpp"
#include "tensordict/index.hpp"
#include "tensordict/log.hpp"

#if TENSORDICT_HAS_MMAP
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace tensordict {

std::size_t dtype_size(DType dt) {
    switch (dt) {
    case DType::Float32:
    case DType::Int32:
        return 4;
    case DType::Float64:
    case DType::Int64:
        return 8;
    case DType::Bool:
    case DType::UInt8:
    default:
        return 1;
    }
}

const char* dtype_name(DType dt) {
    switch (dt) {
    case DType::Bool:
        return "bool";
    case DType::UInt8:
        return "uint8";
    case DType::Int32:
        return "int32";
    case DType::Int64:
        return "int64";
    case DType::Float32:
        return "float32";
    case DType::Float64:
    default:
        return "float64";
    }
}

DType parse_dtype(const std::string& name) {
    if (name == "bool")
        return DType::Bool;
    if (name == "uint8" || name == "u8")
        return DType::UInt8;
    if (name == "int32" || name == "i32")
        return DType::Int32;
    if (name == "int64" || name == "i64")
        return DType::Int64;
    if (name == "float32" || name == "f32")
        return DType::Float32;
    if (name == "float64" || name == "f64")
        return DType::Float64;
    throw ValueError(fmt::format("unknown dtype '{}'", name));
}

std::string shape_to_string(const Shape& s) { return fmt::format("[{}]", fmt::join(s, ", ")); }

std::int64_t shape_numel(const Shape& s) {
    std::int64_t n = 1;
    for (auto d : s)
        n *= d;
    return n;
}

Shape contiguous_strides(const Shape& s) {
    Shape strides(s.size(), 1);
    std::int64_t acc = 1;
    for (std::size_t i = s.size(); i-- > 0;) {
        strides[i] = acc;
        acc *= std::max<std::int64_t>(s[i], 1);
    }
    return strides;
}

std::int64_t normalize_dim(std::int64_t dim, std::int64_t ndim) {
    const std::int64_t n = std::max<std::int64_t>(ndim, 1);
    if (dim < -n || dim >= n)
        throw IndexError(fmt::format(
            "Dimension out of range (expected to be in range of [{}, {}], but got {})", -n, n - 1,
            dim));
    return dim < 0 ? dim + n : dim;
}

Shape infer_view_shape(const Shape& requested, std::int64_t numel) {
    Shape out = requested;
    std::int64_t known = 1;
    std::optional<std::size_t> inferred;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (out[i] == -1) {
            if (inferred)
                throw ShapeMismatchError("only one dimension can be inferred");
            inferred = i;
        } else if (out[i] < 0) {
            throw ShapeMismatchError(fmt::format("invalid shape dimension {}", out[i]));
        } else {
            known *= out[i];
        }
    }
    if (inferred) {
        if (known == 0 || numel % known != 0)
            throw ShapeMismatchError(fmt::format("shape '{}' is invalid for input of size {}",
                                                 shape_to_string(requested), numel));
        out[*inferred] = numel / known;
    }
    if (shape_numel(out) != numel)
        throw ShapeMismatchError(fmt::format("shape '{}' is invalid for input of size {}",
                                             shape_to_string(requested), numel));
    return out;
}

Shape broadcast_shapes(const Shape& a, const Shape& b) {
    const std::size_t n = std::max(a.size(), b.size());
    Shape out(n, 1);
    for (std::size_t i = 0; i < n; ++i) {
        std::int64_t da = i < n - a.size() ? 1 : a[i - (n - a.size())];
        std::int64_t db = i < n - b.size() ? 1 : b[i - (n - b.size())];
        if (da != db && da != 1 && db != 1)
            throw ShapeMismatchError(fmt::format("shapes {} and {} cannot be broadcast together",
                                                 shape_to_string(a), shape_to_string(b)));
        out[i] = da == 1 ? db : da;
    }
    return out;
}

bool broadcastable_to(const Shape& src, const Shape& dst) {
    if (src.size() > dst.size())
        return false;
    const std::size_t lead = dst.size() - src.size();
    for (std::size_t i = 0; i < src.size(); ++i)
        if (src[i] != 1 && src[i] != dst[lead + i])
            return false;
    return true;
}

bool writable_into(const Shape& src, const Shape& dst) {
    if (broadcastable_to(src, dst))
        return true;
    Shape trimmed = dst;
    while (!trimmed.empty() && trimmed.back() == 1)
        trimmed.pop_back();
    return src == trimmed;
}

namespace detail {

double load_element(const std::byte* p, DType dt) {
    switch (dt) {
    case DType::Bool: {
        std::uint8_t v;
        std::memcpy(&v, p, 1);
        return v != 0 ? 1.0 : 0.0;
    }
    case DType::UInt8: {
        std::uint8_t v;
        std::memcpy(&v, p, 1);
        return v;
    }
    case DType::Int32: {
        std::int32_t v;
        std::memcpy(&v, p, sizeof(v));
        return v;
    }
    case DType::Int64: {
        std::int64_t v;
        std::memcpy(&v, p, sizeof(v));
        return static_cast<double>(v);
    }
    case DType::Float32: {
        float v;
        std::memcpy(&v, p, sizeof(v));
        return v;
    }
    case DType::Float64:
    default: {
        double v;
        std::memcpy(&v, p, sizeof(v));
        return v;
    }
    }
}

void store_element(std::byte* p, DType dt, double value) {
    switch (dt) {
    case DType::Bool: {
        std::uint8_t v = value != 0.0 ? 1 : 0;
        std::memcpy(p, &v, 1);
        break;
    }
    case DType::UInt8: {
        auto v = static_cast<std::uint8_t>(static_cast<std::int64_t>(value));
        std::memcpy(p, &v, 1);
        break;
    }
    case DType::Int32: {
        auto v = static_cast<std::int32_t>(value);
        std::memcpy(p, &v, sizeof(v));
        break;
    }
    case DType::Int64: {
        auto v = static_cast<std::int64_t>(value);
        std::memcpy(p, &v, sizeof(v));
        break;
    }
    case DType::Float32: {
        auto v = static_cast<float>(value);
        std::memcpy(p, &v, sizeof(v));
        break;
    }
    case DType::Float64:
    default:
        std::memcpy(p, &value, sizeof(value));
        break;
    }
}

} // namespace detail

namespace {

inline void copy_element(std::byte* dst, DType ddt, const std::byte* src, DType sdt) {
    if (ddt == sdt)
        std::memcpy(dst, src, dtype_size(ddt));
    else
        detail::store_element(dst, ddt, detail::load_element(src, sdt));
}

/// Visit every coordinate of @p shape in row-major order, passing the element
/// offsets obtained with the two stride sets.
template <typename F> void for_each_offset(const Shape& shape, const Shape& sa, const Shape& sb, F&& f) {
    if (shape_numel(shape) == 0)
        return;
    const std::size_t nd = shape.size();
    std::vector<std::int64_t> idx(nd, 0);
    std::int64_t oa = 0;
    std::int64_t ob = 0;
    while (true) {
        f(oa, ob);
        std::size_t d = nd;
        while (true) {
            if (d == 0)
                return;
            --d;
            if (++idx[d] < shape[d]) {
                oa += sa[d];
                ob += sb[d];
                break;
            }
            oa -= sa[d] * (shape[d] - 1);
            ob -= sb[d] * (shape[d] - 1);
            idx[d] = 0;
        }
    }
}

std::vector<std::int64_t> enumerate_offsets(const Shape& shape, const Shape& strides) {
    std::vector<std::int64_t> out;
    out.reserve(static_cast<std::size_t>(std::max<std::int64_t>(shape_numel(shape), 0)));
    for_each_offset(shape, strides, strides, [&](std::int64_t a, std::int64_t) { out.push_back(a); });
    return out;
}

/// Strides allowing @p new_shape to alias a tensor of @p old_shape and
/// @p old_strides, or nullopt when a copy is required.
std::optional<Shape> compute_view_strides(const Shape& old_shape, const Shape& old_strides,
                                          const Shape& new_shape) {
    Shape new_strides(new_shape.size(), 1);
    if (old_shape.empty())
        return contiguous_strides(new_shape);
    const std::int64_t numel = shape_numel(old_shape);
    if (numel == 0)
        return old_shape == new_shape ? old_strides : contiguous_strides(new_shape);

    std::int64_t view_d = static_cast<std::int64_t>(new_shape.size()) - 1;
    std::int64_t chunk_base_stride = old_strides.back();
    std::int64_t tensor_numel = 1;
    std::int64_t view_numel = 1;
    for (std::int64_t tensor_d = static_cast<std::int64_t>(old_shape.size()) - 1; tensor_d >= 0;
         --tensor_d) {
        tensor_numel *= old_shape[tensor_d];
        if (tensor_d == 0 ||
            (old_shape[tensor_d - 1] != 1 &&
             old_strides[tensor_d - 1] != tensor_numel * chunk_base_stride)) {
            while (view_d >= 0 && (view_numel < tensor_numel || new_shape[view_d] == 1)) {
                new_strides[view_d] = view_numel * chunk_base_stride;
                view_numel *= new_shape[view_d];
                --view_d;
            }
            if (view_numel != tensor_numel)
                return std::nullopt;
            if (tensor_d > 0) {
                chunk_base_stride = old_strides[tensor_d - 1];
                tensor_numel = 1;
                view_numel = 1;
            }
        }
    }
    if (view_d != -1)
        return std::nullopt;
    return new_strides;
}

std::mt19937_64& generator() {
    static std::mt19937_64 gen{0};
    return gen;
}

/// Result of applying every basic item of an index. The single tensor item,
/// if any, is resolved to element offsets into `base`.
struct AdvancedIndex {
    Tensor base{};
    std::int64_t pos{-1};
    std::int64_t span{0};
    Shape index_shape{};
    std::vector<std::int64_t> offsets{};
};

AdvancedIndex plan_index(const Tensor& self, const Index& items) {
    AdvancedIndex plan;
    plan.base = self;
    std::int64_t d = 0;
    const Tensor* adv = nullptr;
    bool mask = false;
    for (const auto& item : items) {
        switch (item.kind()) {
        case IndexItem::Kind::Integer:
            plan.base = plan.base.select(d, item.integer());
            break;
        case IndexItem::Kind::Slice:
            plan.base = plan.base.slice(d, item.slice().start, item.slice().stop, item.slice().step);
            ++d;
            break;
        case IndexItem::Kind::NewAxis:
            plan.base = plan.base.unsqueeze(d);
            ++d;
            break;
        case IndexItem::Kind::Tensor:
            if (adv)
                throw IndexError("only one tensor index per indexing expression is supported");
            adv = &item.tensor();
            mask = item.is_mask();
            plan.pos = d;
            plan.span = mask ? adv->dim() : 1;
            d += plan.span;
            break;
        case IndexItem::Kind::Ellipsis:
        default:
            throw IndexError("unexpected ellipsis in an expanded index");
        }
    }
    if (!adv)
        return plan;

    const Shape& bshape = plan.base.shape();
    const Shape& bstrides = plan.base.strides();
    if (plan.pos + plan.span > plan.base.dim())
        throw IndexError(fmt::format("too many indices for tensor of dimension {}", self.dim()));
    if (mask) {
        Shape covered(bshape.begin() + plan.pos, bshape.begin() + plan.pos + plan.span);
        if (covered != adv->shape())
            throw IndexError(fmt::format(
                "The shape of the mask {} at index {} does not match the shape of the indexed "
                "tensor {}",
                shape_to_string(adv->shape()), plan.pos, shape_to_string(covered)));
        auto flags = adv->to_vector<std::uint8_t>();
        Shape cstrides = contiguous_strides(covered);
        for (std::size_t i = 0; i < flags.size(); ++i) {
            if (!flags[i])
                continue;
            std::int64_t rem = static_cast<std::int64_t>(i);
            std::int64_t off = 0;
            for (std::size_t j = 0; j < covered.size(); ++j) {
                std::int64_t c = rem / cstrides[j];
                rem -= c * cstrides[j];
                off += c * bstrides[plan.pos + static_cast<std::int64_t>(j)];
            }
            plan.offsets.push_back(off);
        }
        plan.index_shape = {static_cast<std::int64_t>(plan.offsets.size())};
    } else {
        if (adv->dtype() != DType::Int64 && adv->dtype() != DType::Int32 &&
            adv->dtype() != DType::UInt8)
            throw IndexError("tensors used as indices must be long, int or bool tensors");
        const std::int64_t size = bshape[plan.pos];
        for (auto v : adv->to_vector<std::int64_t>()) {
            if (v < -size || v >= size)
                throw IndexError(fmt::format("index {} is out of bounds for dimension {} with size {}",
                                             v, plan.pos, size));
            plan.offsets.push_back((v < 0 ? v + size : v) * bstrides[plan.pos]);
        }
        plan.index_shape = adv->shape();
    }
    return plan;
}

Shape advanced_result_shape(const AdvancedIndex& plan, Shape& pre, Shape& post, Shape& pre_strides,
                            Shape& post_strides) {
    const Shape& bshape = plan.base.shape();
    const Shape& bstrides = plan.base.strides();
    pre.assign(bshape.begin(), bshape.begin() + plan.pos);
    pre_strides.assign(bstrides.begin(), bstrides.begin() + plan.pos);
    post.assign(bshape.begin() + plan.pos + plan.span, bshape.end());
    post_strides.assign(bstrides.begin() + plan.pos + plan.span, bstrides.end());
    Shape out = pre;
    out.insert(out.end(), plan.index_shape.begin(), plan.index_shape.end());
    out.insert(out.end(), post.begin(), post.end());
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Storage
// ---------------------------------------------------------------------------

std::shared_ptr<Storage> Storage::allocate(std::size_t nbytes) {
    std::shared_ptr<Storage> s{new Storage()};
    s->heap_.assign(nbytes, std::byte{0});
    s->data_ = s->heap_.data();
    s->nbytes_ = nbytes;
    return s;
}

std::shared_ptr<Storage> Storage::allocate_shared(std::size_t nbytes) {
    std::shared_ptr<Storage> s{new Storage()};
    s->nbytes_ = nbytes;
    s->kind_ = Kind::Shared;
#if TENSORDICT_HAS_MMAP
    if (nbytes > 0) {
        void* map = ::mmap(nullptr, nbytes, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
        if (map == MAP_FAILED)
            throw std::runtime_error("failed to allocate shared memory");
        s->map_ = map;
        s->map_size_ = nbytes;
        s->data_ = static_cast<std::byte*>(map);
    }
    return s;
#else
    throw UnsupportedOperationError("shared memory is not supported on this platform");
#endif
}

std::shared_ptr<Storage> Storage::map_file(const std::string& path, std::size_t nbytes, bool create,
                                           bool temporary) {
#if TENSORDICT_HAS_MMAP
    std::shared_ptr<Storage> s{new Storage()};
    s->kind_ = Kind::File;
    s->filename_ = path;
    s->nbytes_ = nbytes;
    int flags = O_RDWR | (create ? O_CREAT | O_TRUNC : 0);
    s->fd_ = ::open(path.c_str(), flags, 0644);
    if (s->fd_ < 0)
        throw std::runtime_error(fmt::format("failed to open memmap file '{}'", path));
    // The storage now owns the descriptor; anything thrown below releases it.
    s->temporary_ = temporary;
    if (create) {
        if (::ftruncate(s->fd_, static_cast<off_t>(nbytes)) != 0)
            throw std::runtime_error(fmt::format("failed to resize memmap file '{}'", path));
    } else {
        struct stat st{};
        if (::fstat(s->fd_, &st) != 0)
            throw std::runtime_error(fmt::format("failed to stat memmap file '{}'", path));
        if (static_cast<std::size_t>(st.st_size) < nbytes)
            throw std::runtime_error(fmt::format("memmap file '{}' holds {} bytes, expected {}", path,
                                                 st.st_size, nbytes));
    }
    if (nbytes > 0) {
        void* map = ::mmap(nullptr, nbytes, PROT_READ | PROT_WRITE, MAP_SHARED, s->fd_, 0);
        if (map == MAP_FAILED)
            throw std::runtime_error(fmt::format("failed to mmap file '{}'", path));
        s->map_ = map;
        s->map_size_ = nbytes;
        s->data_ = static_cast<std::byte*>(map);
    }
    return s;
#else
    (void)path;
    (void)nbytes;
    (void)create;
    (void)temporary;
    throw UnsupportedOperationError("memory mapping not supported on this platform");
#endif
}

Storage::~Storage() { release(); }

void Storage::release() noexcept {
#if TENSORDICT_HAS_MMAP
    if (map_ && ::munmap(map_, map_size_) != 0)
        log_warn("failed to unmap {} bytes of {}", map_size_,
                 filename_.empty() ? std::string{"shared memory"} : filename_);
    map_ = nullptr;
    if (fd_ >= 0)
        ::close(fd_);
    fd_ = -1;
    if (temporary_ && !filename_.empty() && ::unlink(filename_.c_str()) != 0)
        log_warn("failed to remove temporary memmap file {}", filename_);
#endif
}

void Storage::share_memory_() {
    if (kind_ != Kind::Heap)
        return;
    auto shared = allocate_shared(nbytes_);
    if (nbytes_ > 0)
        std::memcpy(shared->data_, data_, nbytes_);
    // Steal the mapping from the temporary storage.
    map_ = shared->map_;
    map_size_ = shared->map_size_;
    data_ = shared->data_;
    kind_ = Kind::Shared;
    shared->map_ = nullptr;
    shared->data_ = nullptr;
    heap_.clear();
    heap_.shrink_to_fit();
}

// ---------------------------------------------------------------------------
// Tensor
// ---------------------------------------------------------------------------

Tensor::Tensor(DType dtype, Shape shape, Device device)
    : dtype_{dtype}, shape_{std::move(shape)}, device_{std::move(device)} {
    for (auto d : shape_)
        if (d < 0)
            throw ValueError(fmt::format("negative dimension in shape {}", shape_to_string(shape_)));
    storage_ = Storage::allocate(static_cast<std::size_t>(shape_numel(shape_)) * dtype_size(dtype_));
    strides_ = contiguous_strides(shape_);
}

Tensor::Tensor(std::shared_ptr<Storage> storage, DType dtype, Shape shape, Shape strides,
               std::int64_t offset, Device device)
    : storage_{std::move(storage)}, dtype_{dtype}, shape_{std::move(shape)},
      strides_{std::move(strides)}, offset_{offset}, device_{std::move(device)} {
    if (shape_.size() != strides_.size())
        throw ValueError("shape and strides must have the same length");
}

Tensor Tensor::zeros(const Shape& shape, DType dtype) { return Tensor{dtype, shape}; }

Tensor Tensor::ones(const Shape& shape, DType dtype) { return full(shape, 1.0, dtype); }

Tensor Tensor::full(const Shape& shape, double value, DType dtype) {
    Tensor out{dtype, shape};
    out.fill_(value);
    return out;
}

Tensor Tensor::arange(std::int64_t n, DType dtype) {
    Tensor out{dtype, Shape{n}};
    std::byte* p = out.mutable_data();
    for (std::int64_t i = 0; i < n; ++i)
        detail::store_element(p + i * dtype_size(dtype), dtype, static_cast<double>(i));
    return out;
}

Tensor Tensor::rand(const Shape& shape, DType dtype) {
    Tensor out{dtype, shape};
    std::uniform_real_distribution<double> dist{0.0, 1.0};
    std::byte* p = out.mutable_data();
    for (std::int64_t i = 0; i < out.numel(); ++i)
        detail::store_element(p + i * dtype_size(dtype), dtype, dist(generator()));
    return out;
}

Tensor Tensor::randn(const Shape& shape, DType dtype) {
    Tensor out{dtype, shape};
    std::normal_distribution<double> dist{0.0, 1.0};
    std::byte* p = out.mutable_data();
    for (std::int64_t i = 0; i < out.numel(); ++i)
        detail::store_element(p + i * dtype_size(dtype), dtype, dist(generator()));
    return out;
}

void Tensor::manual_seed(std::uint64_t seed) { generator().seed(seed); }

std::int64_t Tensor::size(std::int64_t d) const {
    return shape_[static_cast<std::size_t>(normalize_dim(d, dim()))];
}

bool Tensor::is_contiguous() const {
    std::int64_t expected = 1;
    for (std::size_t i = shape_.size(); i-- > 0;) {
        if (shape_[i] == 0)
            return true;
        if (shape_[i] != 1 && strides_[i] != expected)
            return false;
        expected *= shape_[i];
    }
    return true;
}

bool Tensor::is_shared() const { return storage_ && storage_->kind() == Storage::Kind::Shared; }

bool Tensor::is_memmap() const { return storage_ && storage_->kind() == Storage::Kind::File; }

std::string Tensor::filename() const { return storage_ ? storage_->filename() : std::string{}; }

bool Tensor::is_same(const Tensor& other) const {
    return storage_ == other.storage_ && offset_ == other.offset_ && shape_ == other.shape_ &&
           strides_ == other.strides_ && dtype_ == other.dtype_;
}

const std::byte* Tensor::data() const {
    if (!storage_)
        throw std::runtime_error("access to an undefined tensor");
    return storage_->data() + offset_ * static_cast<std::int64_t>(dtype_size(dtype_));
}

std::byte* Tensor::mutable_data() {
    if (!storage_)
        throw std::runtime_error("access to an undefined tensor");
    return storage_->data() + offset_ * static_cast<std::int64_t>(dtype_size(dtype_));
}

const std::byte* Tensor::element_ptr(const std::vector<std::int64_t>& coords) const {
    if (coords.size() != shape_.size())
        throw IndexError(fmt::format("expected {} coordinates, got {}", shape_.size(), coords.size()));
    std::int64_t off = 0;
    for (std::size_t i = 0; i < coords.size(); ++i) {
        std::int64_t c = coords[i];
        if (c < -shape_[i] || c >= shape_[i])
            throw IndexError(fmt::format("index {} is out of bounds for dimension {} with size {}", c,
                                         i, shape_[i]));
        off += (c < 0 ? c + shape_[i] : c) * strides_[i];
    }
    return data() + off * static_cast<std::int64_t>(dtype_size(dtype_));
}

Tensor Tensor::select(std::int64_t dim, std::int64_t i) const {
    if (shape_.empty())
        throw IndexError("invalid index of a 0-dim tensor");
    auto d = static_cast<std::size_t>(normalize_dim(dim, this->dim()));
    const std::int64_t n = shape_[d];
    if (i < -n || i >= n)
        throw IndexError(fmt::format("index {} is out of bounds for dimension {} with size {}", i, d, n));
    Tensor out = *this;
    out.offset_ += (i < 0 ? i + n : i) * strides_[d];
    out.shape_.erase(out.shape_.begin() + static_cast<std::ptrdiff_t>(d));
    out.strides_.erase(out.strides_.begin() + static_cast<std::ptrdiff_t>(d));
    return out;
}

Tensor Tensor::slice(std::int64_t dim, std::optional<std::int64_t> start,
                     std::optional<std::int64_t> stop, std::int64_t step) const {
    if (step <= 0)
        throw ValueError("slice step must be positive");
    auto d = static_cast<std::size_t>(normalize_dim(dim, this->dim()));
    if (shape_.empty())
        throw IndexError("invalid index of a 0-dim tensor");
    const std::int64_t n = shape_[d];
    auto clamp = [n](std::optional<std::int64_t> v, std::int64_t def) {
        if (!v)
            return def;
        std::int64_t x = *v < 0 ? *v + n : *v;
        return std::clamp<std::int64_t>(x, 0, n);
    };
    const std::int64_t s = clamp(start, 0);
    const std::int64_t e = clamp(stop, n);
    const std::int64_t len = e > s ? (e - s + step - 1) / step : 0;
    Tensor out = *this;
    if (len > 0)
        out.offset_ += s * strides_[d];
    out.shape_[d] = len;
    out.strides_[d] = strides_[d] * step;
    return out;
}

Tensor Tensor::permute(const std::vector<std::int64_t>& dims) const {
    std::vector<std::int64_t> norm;
    norm.reserve(dims.size());
    for (auto d : dims)
        norm.push_back(normalize_dim(d, dim()));
    if (static_cast<std::int64_t>(norm.size()) != dim())
        throw ShapeMismatchError(fmt::format(
            "number of dims don't match in permute: got {} dims for a tensor of dimension {}",
            norm.size(), dim()));
    std::vector<bool> seen(norm.size(), false);
    for (auto d : norm) {
        if (seen[static_cast<std::size_t>(d)])
            throw ShapeMismatchError("repeated dim in permute");
        seen[static_cast<std::size_t>(d)] = true;
    }
    Tensor out = *this;
    for (std::size_t i = 0; i < norm.size(); ++i) {
        out.shape_[i] = shape_[static_cast<std::size_t>(norm[i])];
        out.strides_[i] = strides_[static_cast<std::size_t>(norm[i])];
    }
    return out;
}

Tensor Tensor::transpose(std::int64_t d0, std::int64_t d1) const {
    auto a = static_cast<std::size_t>(normalize_dim(d0, dim()));
    auto b = static_cast<std::size_t>(normalize_dim(d1, dim()));
    Tensor out = *this;
    if (shape_.empty())
        return out;
    std::swap(out.shape_[a], out.shape_[b]);
    std::swap(out.strides_[a], out.strides_[b]);
    return out;
}

Tensor Tensor::squeeze(std::int64_t dim) const {
    if (shape_.empty())
        return *this;
    auto d = static_cast<std::size_t>(normalize_dim(dim, this->dim()));
    if (shape_[d] != 1)
        return *this;
    Tensor out = *this;
    out.shape_.erase(out.shape_.begin() + static_cast<std::ptrdiff_t>(d));
    out.strides_.erase(out.strides_.begin() + static_cast<std::ptrdiff_t>(d));
    return out;
}

Tensor Tensor::unsqueeze(std::int64_t dim) const {
    auto d = static_cast<std::size_t>(normalize_dim(dim, this->dim() + 1));
    const std::int64_t stride = d < shape_.size() ? shape_[d] * strides_[d] : 1;
    Tensor out = *this;
    out.shape_.insert(out.shape_.begin() + static_cast<std::ptrdiff_t>(d), 1);
    out.strides_.insert(out.strides_.begin() + static_cast<std::ptrdiff_t>(d), stride);
    return out;
}

Tensor Tensor::view(const Shape& shape) const {
    Shape target = infer_view_shape(shape, numel());
    auto strides = compute_view_strides(shape_, strides_, target);
    if (!strides)
        throw ShapeMismatchError(
            "view size is not compatible with input tensor's size and stride (at least one "
            "dimension spans across two contiguous subspaces). Use reshape(...) instead.");
    Tensor out = *this;
    out.shape_ = std::move(target);
    out.strides_ = std::move(*strides);
    return out;
}

Tensor Tensor::reshape(const Shape& shape) const {
    Shape target = infer_view_shape(shape, numel());
    if (compute_view_strides(shape_, strides_, target))
        return view(target);
    return contiguous().view(target);
}

Tensor Tensor::expand(const Shape& shape) const {
    if (shape.size() < shape_.size())
        throw ShapeMismatchError(fmt::format(
            "the number of sizes provided ({}) must be greater or equal to the number of "
            "dimensions in the tensor ({})",
            shape.size(), shape_.size()));
    const std::size_t lead = shape.size() - shape_.size();
    Tensor out = *this;
    out.shape_.assign(shape.size(), 0);
    out.strides_.assign(shape.size(), 0);
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i < lead) {
            if (shape[i] < 0)
                throw ShapeMismatchError(fmt::format(
                    "The expanded size of the tensor ({}) isn't allowed in a leading, "
                    "non-existing dimension {}",
                    shape[i], i));
            out.shape_[i] = shape[i];
            out.strides_[i] = 0;
            continue;
        }
        const std::size_t j = i - lead;
        if (shape[i] == -1 || shape[i] == shape_[j]) {
            out.shape_[i] = shape_[j];
            out.strides_[i] = strides_[j];
        } else if (shape_[j] == 1) {
            out.shape_[i] = shape[i];
            out.strides_[i] = 0;
        } else {
            throw ShapeMismatchError(fmt::format(
                "The expanded size of the tensor ({}) must match the existing size ({}) at "
                "non-singleton dimension {}.  Target sizes: {}.  Tensor sizes: {}",
                shape[i], shape_[j], i, shape_to_string(shape), shape_to_string(shape_)));
        }
    }
    return out;
}

std::vector<Tensor> Tensor::unbind(std::int64_t dim) const {
    auto d = normalize_dim(dim, this->dim());
    std::vector<Tensor> out;
    const std::int64_t n = shape_.empty() ? 0 : shape_[static_cast<std::size_t>(d)];
    out.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i)
        out.push_back(select(d, i));
    return out;
}

Tensor Tensor::index(const Index& index) const {
    Index items = expand_ellipsis(index, dim());
    AdvancedIndex plan = plan_index(*this, items);
    if (plan.pos < 0)
        return plan.base;

    Shape pre, post, pre_strides, post_strides;
    Shape out_shape = advanced_result_shape(plan, pre, post, pre_strides, post_strides);
    Tensor out{dtype_, out_shape, device_};
    const auto pre_offsets = enumerate_offsets(pre, pre_strides);
    const auto post_offsets = enumerate_offsets(post, post_strides);
    const auto es = static_cast<std::int64_t>(dtype_size(dtype_));
    const std::byte* src = plan.base.data();
    std::byte* dst = out.mutable_data();
    std::int64_t k = 0;
    for (auto po : pre_offsets)
        for (auto o : plan.offsets)
            for (auto qo : post_offsets)
                std::memcpy(dst + (k++) * es, src + (po + o + qo) * es, static_cast<std::size_t>(es));
    return out;
}

Tensor Tensor::clone() const {
    Tensor out{dtype_, shape_, device_};
    out.copy_(*this);
    return out;
}

Tensor Tensor::contiguous() const { return is_contiguous() ? *this : clone(); }

Tensor Tensor::to(const Device& device) const {
    if (device == device_)
        return *this;
    Tensor out = clone();
    out.device_ = device;
    return out;
}

Tensor Tensor::to(DType dtype) const {
    if (dtype == dtype_)
        return *this;
    Tensor out{dtype, shape_, device_};
    out.copy_(*this);
    return out;
}

Tensor& Tensor::copy_(const Tensor& src) {
    if (!defined() || !src.defined())
        throw std::runtime_error("copy_ with an undefined tensor");
    Tensor s = src.storage_ == storage_ ? src.clone() : src;
    Tensor b = s.expand(shape_);
    const auto des = static_cast<std::int64_t>(dtype_size(dtype_));
    const auto ses = static_cast<std::int64_t>(dtype_size(b.dtype_));
    std::byte* dst = mutable_data();
    const std::byte* from = b.data();
    for_each_offset(shape_, strides_, b.strides_, [&](std::int64_t a, std::int64_t c) {
        copy_element(dst + a * des, dtype_, from + c * ses, b.dtype_);
    });
    return *this;
}

Tensor& Tensor::fill_(double value) {
    const auto es = static_cast<std::int64_t>(dtype_size(dtype_));
    std::byte* dst = mutable_data();
    for_each_offset(shape_, strides_, strides_,
                    [&](std::int64_t a, std::int64_t) { detail::store_element(dst + a * es, dtype_, value); });
    return *this;
}

Tensor& Tensor::index_put_(const Index& index, const Tensor& value) {
    Index items = expand_ellipsis(index, dim());
    if (is_basic_index(items)) {
        this->index(items).copy_(value);
        return *this;
    }
    AdvancedIndex plan = plan_index(*this, items);
    Shape pre, post, pre_strides, post_strides;
    Shape out_shape = advanced_result_shape(plan, pre, post, pre_strides, post_strides);
    Tensor v = (value.storage_ == storage_ ? value.clone() : value).expand(out_shape);
    const auto value_offsets = enumerate_offsets(out_shape, v.strides_);
    const auto pre_offsets = enumerate_offsets(pre, pre_strides);
    const auto post_offsets = enumerate_offsets(post, post_strides);
    const auto des = static_cast<std::int64_t>(dtype_size(dtype_));
    const auto ses = static_cast<std::int64_t>(dtype_size(v.dtype_));
    std::byte* dst = plan.base.mutable_data();
    const std::byte* src = v.data();
    std::size_t k = 0;
    for (auto po : pre_offsets)
        for (auto o : plan.offsets)
            for (auto qo : post_offsets)
                copy_element(dst + (po + o + qo) * des, dtype_, src + value_offsets[k++] * ses, v.dtype_);
    return *this;
}

Tensor& Tensor::share_memory_() {
    if (storage_)
        storage_->share_memory_();
    return *this;
}

bool Tensor::equal(const Tensor& other) const {
    if (shape_ != other.shape_)
        return false;
    const auto a = to_vector<double>();
    const auto b = other.to_vector<double>();
    return a == b;
}

bool Tensor::allclose(const Tensor& other, double rtol, double atol) const {
    if (shape_ != other.shape_)
        return false;
    const auto a = to_vector<double>();
    const auto b = other.to_vector<double>();
    for (std::size_t i = 0; i < a.size(); ++i)
        if (std::fabs(a[i] - b[i]) > atol + rtol * std::fabs(b[i]))
            return false;
    return true;
}

bool Tensor::all() const {
    for (auto v : to_vector<double>())
        if (v == 0.0)
            return false;
    return true;
}

bool Tensor::any() const {
    for (auto v : to_vector<double>())
        if (v != 0.0)
            return true;
    return false;
}

Tensor Tensor::eq(const Tensor& other) const {
    Shape shape = broadcast_shapes(shape_, other.shape_);
    const auto a = expand(shape).contiguous().to_vector<double>();
    const auto b = other.expand(shape).contiguous().to_vector<double>();
    Tensor out{DType::Bool, shape, device_};
    std::byte* dst = out.mutable_data();
    for (std::size_t i = 0; i < a.size(); ++i)
        detail::store_element(dst + i, DType::Bool, a[i] == b[i] ? 1.0 : 0.0);
    return out;
}

Tensor Tensor::stack(const std::vector<Tensor>& tensors, std::int64_t dim) {
    if (tensors.empty())
        throw ValueError("stack expects a non-empty list of tensors");
    const Tensor& first = tensors.front();
    for (std::size_t i = 1; i < tensors.size(); ++i)
        if (tensors[i].shape() != first.shape())
            throw ShapeMismatchError(fmt::format(
                "stack expects each tensor to be equal size, but got {} at entry 0 and {} at entry {}",
                shape_to_string(first.shape()), shape_to_string(tensors[i].shape()), i));
    auto d = normalize_dim(dim, first.dim() + 1);
    Shape shape = first.shape();
    shape.insert(shape.begin() + d, static_cast<std::int64_t>(tensors.size()));
    Tensor out{first.dtype(), shape, first.device()};
    for (std::size_t i = 0; i < tensors.size(); ++i)
        out.select(d, static_cast<std::int64_t>(i)).copy_(tensors[i]);
    return out;
}

Tensor Tensor::cat(const std::vector<Tensor>& tensors, std::int64_t dim) {
    if (tensors.empty())
        throw ValueError("cat expects a non-empty list of tensors");
    const Tensor& first = tensors.front();
    if (first.dim() == 0)
        throw ValueError("zero-dimensional tensors cannot be concatenated");
    auto d = static_cast<std::size_t>(normalize_dim(dim, first.dim()));
    Shape shape = first.shape();
    shape[d] = 0;
    for (std::size_t i = 0; i < tensors.size(); ++i) {
        Shape a = tensors[i].shape();
        Shape b = first.shape();
        if (a.size() != b.size())
            throw ShapeMismatchError("cat expects tensors with the same number of dimensions");
        a[d] = b[d] = 0;
        if (a != b)
            throw ShapeMismatchError(fmt::format(
                "Sizes of tensors must match except in dimension {}. Got {} and {} at entry {}", d,
                shape_to_string(first.shape()), shape_to_string(tensors[i].shape()), i));
        shape[d] += tensors[i].shape()[d];
    }
    Tensor out{first.dtype(), shape, first.device()};
    std::int64_t off = 0;
    for (const auto& t : tensors) {
        const std::int64_t n = t.shape()[d];
        out.slice(static_cast<std::int64_t>(d), off, off + n).copy_(t);
        off += n;
    }
    return out;
}

} // namespace tensordict
