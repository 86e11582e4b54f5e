#include "tensordict/index.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "tensordict/errors.hpp"

namespace tensordict {

std::int64_t IndexItem::consumed_dims() const {
    switch (kind()) {
    case Kind::Integer:
    case Kind::Slice:
        return 1;
    case Kind::Tensor:
        return is_mask() ? tensor().dim() : 1;
    case Kind::Ellipsis:
    case Kind::NewAxis:
    default:
        return 0;
    }
}

std::string IndexItem::to_string() const {
    switch (kind()) {
    case Kind::Integer:
        return std::to_string(integer());
    case Kind::Slice: {
        const auto& s = slice();
        std::string out = s.start ? std::to_string(*s.start) : "";
        out += ":";
        out += s.stop ? std::to_string(*s.stop) : "";
        if (s.step != 1)
            out += ":" + std::to_string(s.step);
        return out;
    }
    case Kind::Ellipsis:
        return "...";
    case Kind::NewAxis:
        return "None";
    case Kind::Tensor:
    default:
        return fmt::format("tensor(shape={}, dtype={})", shape_to_string(tensor().shape()),
                           dtype_name(tensor().dtype()));
    }
}

Index expand_ellipsis(const Index& index, std::int64_t ndim) {
    std::int64_t consumed = 0;
    std::int64_t ellipses = 0;
    for (const auto& item : index) {
        consumed += item.consumed_dims();
        if (item.is_ellipsis())
            ++ellipses;
    }
    if (ellipses > 1)
        throw IndexError("an index can only have a single ellipsis ('...')");
    if (consumed > ndim)
        throw IndexError(fmt::format("too many indices for tensor of dimension {}", ndim));
    if (ellipses == 0)
        return index;
    Index out;
    out.reserve(index.size() + static_cast<std::size_t>(ndim - consumed));
    for (const auto& item : index) {
        if (item.is_ellipsis()) {
            for (std::int64_t i = 0; i < ndim - consumed; ++i)
                out.emplace_back(Slice{});
        } else {
            out.push_back(item);
        }
    }
    return out;
}

Shape indexed_shape(const Shape& shape, const Index& index) {
    const Index items = expand_ellipsis(index, static_cast<std::int64_t>(shape.size()));
    Shape out;
    std::size_t d = 0;
    bool advanced = false;
    for (const auto& item : items) {
        // out.size() is the position of the current dimension in the partially indexed result.
        switch (item.kind()) {
        case IndexItem::Kind::Integer: {
            const std::int64_t n = shape[d++];
            const std::int64_t i = item.integer();
            if (i < -n || i >= n)
                throw IndexError(fmt::format("index {} is out of bounds for dimension {} with size {}", i,
                                             out.size(), n));
            break;
        }
        case IndexItem::Kind::Slice: {
            const auto& sl = item.slice();
            if (sl.step <= 0)
                throw ValueError("slice step must be positive");
            const std::int64_t n = shape[d++];
            auto clamp = [n](std::optional<std::int64_t> v, std::int64_t def) {
                if (!v)
                    return def;
                std::int64_t x = *v < 0 ? *v + n : *v;
                return std::clamp<std::int64_t>(x, 0, n);
            };
            const std::int64_t start = clamp(sl.start, 0);
            const std::int64_t stop = clamp(sl.stop, n);
            out.push_back(stop > start ? (stop - start + sl.step - 1) / sl.step : 0);
            break;
        }
        case IndexItem::Kind::NewAxis:
            out.push_back(1);
            break;
        case IndexItem::Kind::Tensor: {
            if (advanced)
                throw IndexError("only one tensor index per indexing expression is supported");
            advanced = true;
            const Tensor& t = item.tensor();
            if (item.is_mask()) {
                const auto span = static_cast<std::size_t>(t.dim());
                const Shape covered(shape.begin() + static_cast<std::ptrdiff_t>(d),
                                    shape.begin() + static_cast<std::ptrdiff_t>(d + span));
                if (covered != t.shape())
                    throw IndexError(fmt::format(
                        "The shape of the mask {} at index {} does not match the shape of the indexed "
                        "tensor {}",
                        shape_to_string(t.shape()), out.size(), shape_to_string(covered)));
                const auto flags = t.to_vector<std::uint8_t>();
                out.push_back(static_cast<std::int64_t>(
                    std::count_if(flags.begin(), flags.end(), [](std::uint8_t f) { return f != 0; })));
                d += span;
                break;
            }
            if (t.dtype() != DType::Int64 && t.dtype() != DType::Int32 && t.dtype() != DType::UInt8)
                throw IndexError("tensors used as indices must be long, int or bool tensors");
            const std::int64_t n = shape[d++];
            for (auto v : t.to_vector<std::int64_t>())
                if (v < -n || v >= n)
                    throw IndexError(fmt::format("index {} is out of bounds for dimension {} with size {}",
                                                 v, out.size(), n));
            out.insert(out.end(), t.shape().begin(), t.shape().end());
            break;
        }
        case IndexItem::Kind::Ellipsis:
        default:
            break;
        }
    }
    out.insert(out.end(), shape.begin() + static_cast<std::ptrdiff_t>(d), shape.end());
    return out;
}

std::vector<std::optional<std::string>>
indexed_names(const std::vector<std::optional<std::string>>& names, const Index& index) {
    Index items = expand_ellipsis(index, static_cast<std::int64_t>(names.size()));
    std::vector<std::optional<std::string>> out;
    std::size_t d = 0;
    for (const auto& item : items) {
        switch (item.kind()) {
        case IndexItem::Kind::Integer:
            ++d;
            break;
        case IndexItem::Kind::Slice:
            out.push_back(names[d++]);
            break;
        case IndexItem::Kind::NewAxis:
            out.emplace_back(std::nullopt);
            break;
        case IndexItem::Kind::Tensor:
            if (item.is_mask()) {
                d += static_cast<std::size_t>(item.tensor().dim());
                out.emplace_back(std::nullopt);
            } else if (item.tensor().dim() == 1) {
                out.push_back(names[d++]);
            } else {
                ++d;
                for (std::int64_t i = 0; i < item.tensor().dim(); ++i)
                    out.emplace_back(std::nullopt);
            }
            break;
        case IndexItem::Kind::Ellipsis:
        default:
            break;
        }
    }
    for (; d < names.size(); ++d)
        out.push_back(names[d]);
    return out;
}

bool is_basic_index(const Index& index) {
    for (const auto& item : index)
        if (item.is_tensor())
            return false;
    return true;
}

std::string index_to_string(const Index& index) {
    std::vector<std::string> parts;
    parts.reserve(index.size());
    for (const auto& item : index)
        parts.push_back(item.to_string());
    return fmt::format("({})", fmt::join(parts, ", "));
}

} // namespace tensordict
