#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "tensordict/serialization.hpp"
#include "tensordict/tensordict_base.hpp"

namespace tensordict {

// ---------------------------------------------------------------------------
// Memmap persistence
// ---------------------------------------------------------------------------
// A memmapped container is a directory holding one raw C-order file per leaf
// (`<key>.memmap`), one sub-directory per nested container and a binary
// `meta` sidecar (see serialization.hpp). Stacked containers store each
// sibling in a numbered sub-directory. Leaves created without a directory
// live in temporary files under memmap_directory() that are removed once
// the last tensor aliasing them is gone.
// ---------------------------------------------------------------------------

/**
 * @brief Path of the file holding leaf @p key inside @p dir.
 *
 * Throws ValueError when @p key is not a plain file name (empty, `.`, `..`
 * or containing a path separator), so that no entry lands outside @p dir.
 */
std::filesystem::path leaf_file(const std::filesystem::path& dir, const std::string& key);

/// Sub-directory holding nested container @p key inside @p dir. Same checks
/// as leaf_file(); the sidecar name is refused as well.
std::filesystem::path nested_dir(const std::filesystem::path& dir, const std::string& key);

/// Create a fresh, uniquely named temporary file under memmap_directory().
std::string make_temp_memmap_file();

/**
 * @brief File-backed copy of @p src.
 *
 * The bytes are written to @p path, or to a temporary file when no path is
 * given. The result is contiguous and keeps the dtype and device of @p src.
 */
Tensor memmap_tensor(const Tensor& src, const std::optional<std::filesystem::path>& path = std::nullopt);

/// Map an existing leaf file written by memmap_tensor().
Tensor open_memmap_tensor(const std::filesystem::path& path, DType dtype, const Shape& shape,
                          const Device& device);

/// Sidecar describing the current top level entries of @p td.
ContainerMeta describe(const TensorDictBase& td);

/**
 * @brief Rebuild the container stored under @p prefix.
 *
 * Dispatches on the type recorded in the sidecar and returns either a
 * TensorDict or a LazyStackedTensorDict. Loaded containers are memmapped and
 * locked.
 */
TensorDictPtr load_memmap(const std::string& prefix);

} // namespace tensordict
