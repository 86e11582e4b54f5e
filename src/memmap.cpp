#include "tensordict/memmap.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

#include <fmt/format.h>

#include "tensordict/errors.hpp"
#include "tensordict/lazy_stack.hpp"
#include "tensordict/log.hpp"
#include "tensordict/tensordict.hpp"

#if TENSORDICT_HAS_MMAP
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace tensordict {

namespace {

void check_file_key(const std::string& key) {
    if (key.empty() || key == "." || key == ".." || key.find_first_of("/\\") != std::string::npos)
        throw ValueError(fmt::format("key '{}' cannot be stored on disk: memmap keys must be plain file names", key));
}

} // namespace

fs::path leaf_file(const fs::path& dir, const std::string& key) {
    check_file_key(key);
    return dir / (key + ".memmap");
}

fs::path nested_dir(const fs::path& dir, const std::string& key) {
    check_file_key(key);
    if (key == kMetaFile)
        throw ValueError(fmt::format("nested key '{}' collides with the memmap sidecar", key));
    return dir / key;
}

std::string make_temp_memmap_file() {
#if TENSORDICT_HAS_MMAP
    const fs::path dir{memmap_directory()};
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::string pattern = (dir / "tensordict-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0)
        throw std::runtime_error(fmt::format("failed to create a temporary memmap file in {}", dir.string()));
    ::close(fd);
    return std::string{buf.data()};
#else
    throw UnsupportedOperationError("memory mapping not supported on this platform");
#endif
}

Tensor memmap_tensor(const Tensor& src, const std::optional<fs::path>& path) {
    const std::size_t nbytes = static_cast<std::size_t>(src.numel()) * dtype_size(src.dtype());
    std::shared_ptr<Storage> storage;
    if (path) {
        fs::create_directories(path->parent_path());
        storage = Storage::map_file(path->string(), nbytes, true);
    } else {
        storage = Storage::map_file(make_temp_memmap_file(), nbytes, true, true);
    }
    Tensor out{storage, src.dtype(), src.shape(), contiguous_strides(src.shape()), 0, src.device()};
    out.copy_(src);
    log_debug("memmapped tensor of shape {} to {}", shape_to_string(src.shape()), storage->filename());
    return out;
}

Tensor open_memmap_tensor(const fs::path& path, DType dtype, const Shape& shape, const Device& device) {
    const std::size_t nbytes = static_cast<std::size_t>(shape_numel(shape)) * dtype_size(dtype);
    auto storage = Storage::map_file(path.string(), nbytes, false);
    return Tensor{storage, dtype, shape, contiguous_strides(shape), 0, device};
}

ContainerMeta describe(const TensorDictBase& td) {
    ContainerMeta meta;
    meta.type = td.type_name();
    meta.batch_size = td.batch_size();
    meta.device = td.device();
    meta.names = td.names();
    for (const auto& atom : td.atom_keys()) {
        EntryMeta e;
        e.key = atom;
        Value v = td.get_atom(atom);
        if (is_tensordict(v)) {
            e.kind = EntryMeta::Kind::Nested;
            e.shape = std::get<TensorDictPtr>(v)->batch_size();
        } else {
            const auto& t = std::get<Tensor>(v);
            e.dtype = t.dtype();
            e.shape = t.shape();
        }
        meta.entries.push_back(std::move(e));
    }
    return meta;
}

TensorDictPtr load_memmap(const std::string& prefix) {
    const fs::path dir{prefix};
    ContainerMeta meta = read_meta(dir);
    if (meta.type == "TensorDict")
        return TensorDict::load_memmap(prefix);
    if (meta.type != "LazyStackedTensorDict")
        throw ValueError(fmt::format("cannot load a memmap of type '{}' from {}", meta.type, prefix));
    std::vector<TensorDictPtr> children;
    children.reserve(static_cast<std::size_t>(meta.count));
    for (std::int64_t i = 0; i < meta.count; ++i)
        children.push_back(load_memmap((dir / std::to_string(i)).string()));
    auto out = LazyStackedTensorDict::make(std::move(children), meta.stack_dim);
    if (std::any_of(meta.names.begin(), meta.names.end(), [](const auto& n) { return n.has_value(); }))
        out->set_names(meta.names);
    out->lock_();
    log_info("loaded stacked memmap of {} tensordicts from {}", meta.count, prefix);
    return out;
}

} // namespace tensordict
