#include <filesystem>
#include <iostream>
#include <string>

#include <tensordict/memmap.hpp>
#include <tensordict/serialization.hpp>

// ---------------------------------------------------------------------------
// Memmap inspector
// ---------------------------------------------------------------------------
// Prints the structure recorded in the `meta` sidecars of a memmap
// directory: container type, batch size, device, names and every leaf with
// its dtype and shape. Data files are never opened, so this also works on
// directories whose leaves are still being written by another process.
// ---------------------------------------------------------------------------

using namespace tensordict;

namespace fs = std::filesystem;

namespace {

void usage() { std::cerr << "Usage: memmap_info_cli <prefix>\n"; }

std::string names_line(const ContainerMeta& meta) {
    std::string out = "[";
    for (std::size_t i = 0; i < meta.names.size(); ++i) {
        if (i)
            out += ", ";
        out += meta.names[i] ? *meta.names[i] : "None";
    }
    return out + "]";
}

void print_container(const fs::path& dir, const std::string& indent, const std::string& path) {
    ContainerMeta meta = read_meta(dir);
    std::cout << indent << "type " << meta.type << '\n';
    std::cout << indent << "batch_size " << shape_to_string(meta.batch_size) << '\n';
    std::cout << indent << "device " << meta.device.value_or("None") << '\n';
    std::cout << indent << "names " << names_line(meta) << '\n';
    if (meta.type == "LazyStackedTensorDict") {
        std::cout << indent << "stack_dim " << meta.stack_dim << '\n';
        for (std::int64_t i = 0; i < meta.count; ++i) {
            std::cout << indent << "sibling " << i << '\n';
            print_container(dir / std::to_string(i), indent + "  ", path);
        }
        return;
    }
    for (const auto& e : meta.entries) {
        const std::string key = path.empty() ? e.key : path + "." + e.key;
        if (e.kind == EntryMeta::Kind::Leaf) {
            std::cout << indent << "leaf " << key << ' ' << dtype_name(e.dtype) << ' '
                      << shape_to_string(e.shape) << '\n';
            continue;
        }
        std::cout << indent << "nested " << key << ' ' << shape_to_string(e.shape) << '\n';
        print_container(nested_dir(dir, e.key), indent + "  ", key);
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }
    try {
        print_container(argv[1], "", "");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
}
