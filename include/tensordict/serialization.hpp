#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tensordict/tensor.hpp"

namespace tensordict {

/// Version written to every memmap sidecar.
inline constexpr std::uint32_t kMetaVersion = 1;

/// Name of the sidecar file describing a memmap directory.
inline constexpr const char* kMetaFile = "meta";

/**
 * @brief One entry of a memmap sidecar.
 *
 * Leaves are stored in `<key>.memmap` next to the sidecar, nested containers
 * in a sub-directory named after the key.
 */
struct EntryMeta {
    enum class Kind : std::uint8_t { Leaf = 0, Nested = 1 };

    Kind kind{Kind::Leaf};
    std::string key{};
    DType dtype{DType::Float32};
    Shape shape{};
};

/// Contents of a memmap sidecar.
struct ContainerMeta {
    std::string type{"TensorDict"};
    Shape batch_size{};
    std::optional<Device> device{};
    std::vector<std::optional<std::string>> names{};
    /// Stacked containers only.
    std::int64_t stack_dim{0};
    std::int64_t count{0};
    std::vector<EntryMeta> entries{};
};

// Multi-byte integers in the sidecar are little endian regardless of the host.

inline void write_le32(std::ostream& out, std::uint32_t v) {
    unsigned char b[4];
    for (int i = 0; i < 4; ++i)
        b[i] = static_cast<unsigned char>(v >> (8 * i));
    out.write(reinterpret_cast<const char*>(b), 4);
}

inline void write_le64(std::ostream& out, std::uint64_t v) {
    unsigned char b[8];
    for (int i = 0; i < 8; ++i)
        b[i] = static_cast<unsigned char>(v >> (8 * i));
    out.write(reinterpret_cast<const char*>(b), 8);
}

/// Read a little endian 32-bit integer, throwing @p what on a short read.
inline std::uint32_t read_le32(std::istream& in, const char* what) {
    unsigned char b[4];
    in.read(reinterpret_cast<char*>(b), 4);
    if (!in)
        throw std::runtime_error(what);
    return static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
           (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
}

inline std::uint64_t read_le64(std::istream& in, const char* what) {
    unsigned char b[8];
    in.read(reinterpret_cast<char*>(b), 8);
    if (!in)
        throw std::runtime_error(what);
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i)
        v = (v << 8) | b[i];
    return v;
}

inline std::uint8_t read_u8(std::istream& in, const char* what) {
    char c;
    in.read(&c, 1);
    if (!in)
        throw std::runtime_error(what);
    return static_cast<std::uint8_t>(c);
}

inline void write_string(std::ostream& out, const std::string& s) {
    write_le32(out, static_cast<std::uint32_t>(s.size()));
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

inline std::string read_string(std::istream& in) {
    const std::uint32_t len = read_le32(in, "failed to read string length");
    std::string s(len, '\0');
    in.read(s.data(), len);
    if (!in)
        throw std::runtime_error("failed to read string data");
    return s;
}

inline void write_shape(std::ostream& out, const Shape& shape) {
    write_le32(out, static_cast<std::uint32_t>(shape.size()));
    for (auto d : shape)
        write_le64(out, static_cast<std::uint64_t>(d));
}

inline Shape read_shape(std::istream& in) {
    const std::uint32_t dims = read_le32(in, "failed to read shape rank");
    Shape shape(dims);
    for (std::uint32_t i = 0; i < dims; ++i)
        shape[i] = static_cast<std::int64_t>(read_le64(in, "failed to read shape"));
    return shape;
}

inline void write_optional_string(std::ostream& out, const std::optional<std::string>& s) {
    out.put(s ? 1 : 0);
    if (s)
        write_string(out, *s);
}

inline std::optional<std::string> read_optional_string(std::istream& in) {
    if (!read_u8(in, "failed to read optional flag"))
        return std::nullopt;
    return read_string(in);
}

inline void save_meta(const ContainerMeta& meta, std::ostream& out) {
    out.write("TDMM", 4);
    write_le32(out, kMetaVersion);
    write_string(out, meta.type);
    write_shape(out, meta.batch_size);
    write_optional_string(out, meta.device);

    write_le32(out, static_cast<std::uint32_t>(meta.names.size()));
    for (const auto& n : meta.names)
        write_optional_string(out, n);

    write_le64(out, static_cast<std::uint64_t>(meta.stack_dim));
    write_le64(out, static_cast<std::uint64_t>(meta.count));

    write_le32(out, static_cast<std::uint32_t>(meta.entries.size()));
    for (const auto& e : meta.entries) {
        out.put(static_cast<char>(e.kind));
        write_string(out, e.key);
        out.put(static_cast<char>(e.dtype));
        write_shape(out, e.shape);
    }
}

inline ContainerMeta load_meta(std::istream& in) {
    char magic[4];
    in.read(magic, 4);
    if (!in || std::string(magic, 4) != "TDMM")
        throw std::runtime_error("invalid memmap metadata file");
    const std::uint32_t ver = read_le32(in, "failed to read memmap metadata version");
    if (ver > kMetaVersion)
        throw std::runtime_error("unsupported memmap metadata version " + std::to_string(ver));

    ContainerMeta meta;
    meta.type = read_string(in);
    meta.batch_size = read_shape(in);
    meta.device = read_optional_string(in);

    std::uint32_t count = read_le32(in, "failed to read names");
    meta.names.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i)
        meta.names.push_back(read_optional_string(in));

    meta.stack_dim = static_cast<std::int64_t>(read_le64(in, "failed to read stack dim"));
    meta.count = static_cast<std::int64_t>(read_le64(in, "failed to read sibling count"));

    count = read_le32(in, "failed to read entry count");
    meta.entries.resize(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        auto& e = meta.entries[i];
        const std::uint8_t kind = read_u8(in, "invalid entry kind");
        if (kind > 1)
            throw std::runtime_error("invalid entry kind");
        e.kind = static_cast<EntryMeta::Kind>(kind);
        e.key = read_string(in);
        const std::uint8_t dt = read_u8(in, "invalid entry dtype");
        if (dt > static_cast<std::uint8_t>(DType::Float64))
            throw std::runtime_error("invalid entry dtype");
        e.dtype = static_cast<DType>(dt);
        e.shape = read_shape(in);
    }
    return meta;
}

/// Write `dir/meta`, creating @p dir if needed.
inline void write_meta(const std::filesystem::path& dir, const ContainerMeta& meta) {
    std::filesystem::create_directories(dir);
    std::ofstream out(dir / kMetaFile, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("failed to open " + (dir / kMetaFile).string());
    save_meta(meta, out);
    if (!out)
        throw std::runtime_error("failed to write " + (dir / kMetaFile).string());
}

inline ContainerMeta read_meta(const std::filesystem::path& dir) {
    std::ifstream in(dir / kMetaFile, std::ios::binary);
    if (!in)
        throw std::runtime_error("no memmap metadata found in " + dir.string());
    return load_meta(in);
}

} // namespace tensordict
