#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tensordict/tensordict_base.hpp"

namespace tensordict {

/**
 * @brief The plain container: an ordered mapping of key atoms to leaves or
 * nested containers sharing a leading batch shape.
 *
 * Entries keep their insertion order. Leaves must have the batch size as a
 * shape prefix and nested containers must have a batch size extending it.
 * When a device is set every inserted leaf is cast to it.
 */
class TensorDict : public TensorDictBase {
  public:
    using Source = std::vector<std::pair<NestedKey, Value>>;

    explicit TensorDict(Shape batch_size = {}, std::optional<Device> device = std::nullopt,
                        Names names = {});
    ~TensorDict() override = default;

    /**
     * @brief Build a container from @p source.
     *
     * Nested keys in @p source create intermediate containers sharing
     * @p batch_size. @p names, when given, must have one entry per batch
     * dimension.
     */
    static std::shared_ptr<TensorDict> make(const Source& source = {}, Shape batch_size = {},
                                            std::optional<Device> device = std::nullopt,
                                            Names names = {});
    /**
     * @brief Build a container from @p source, inferring its batch size.
     *
     * Without @p batch_size the batch size is the longest shape prefix shared
     * by every entry, computed bottom-up for nested containers created from
     * the source. @p batch_dims truncates the inferred batch size. Passing
     * both is a ValueError.
     */
    static std::shared_ptr<TensorDict> from_dict(const Source& source,
                                                 std::optional<Shape> batch_size = std::nullopt,
                                                 std::optional<std::int64_t> batch_dims = std::nullopt,
                                                 std::optional<Device> device = std::nullopt);
    /// Rebuild a container written by memmap_() under @p prefix.
    static std::shared_ptr<TensorDict> load_memmap(const std::string& prefix);

    std::string type_name() const override { return "TensorDict"; }

    Shape batch_size() const override { return batch_size_; }
    void set_batch_size(const Shape& batch_size) override;
    std::optional<Device> device() const override { return device_; }
    Names names() const override { return names_; }
    void set_names(const Names& names) override;

    Value get_atom(const std::string& key) const override;
    bool has_atom(const std::string& key) const override;
    std::vector<std::string> atom_keys() const override { return order_; }
    bool atom_is_tensordict(const std::string& key) const override;
    void set_atom(const std::string& key, Value value, bool inplace) override;
    void set_atom_at(const std::string& key, const Value& value, const Index& index) override;
    void del_atom(const std::string& key) override;

    /// True when every leaf is stored contiguously.
    bool is_contiguous() const;

    /// Infer the batch size from the entries (see from_dict()).
    TensorDict& auto_batch_size_(std::optional<std::int64_t> batch_dims = std::nullopt);

    void propagate_unlock(const LockIds& ids) override;

    TensorDictBase& memmap_(const std::optional<std::string>& prefix = std::nullopt,
                            bool copy_existing = false) override;
    void check_memmap(const std::optional<std::string>& prefix, bool copy_existing) const override;
    TensorDictBase& share_memory_() override;
    bool is_memmap() const override { return is_memmap_; }
    bool is_shared() const override { return is_shared_; }

  private:
    /// Copy @p src into the existing leaf @p dest (see set_()).
    void copy_into(const std::string& key, Tensor& dest, const Tensor& src) const;
    /// Cast / rename an incoming value so that it fits this container.
    Value reconcile(const std::string& key, Value value);
    void validate_names(const Names& names) const;
    /// Throws unless set_batch_size(@p batch_size) can succeed; changes nothing.
    void check_batch_size(const Shape& batch_size) const;

    Shape batch_size_{};
    std::optional<Device> device_{};
    Names names_{};
    std::vector<std::string> order_{};
    std::unordered_map<std::string, Value> entries_{};
    bool is_memmap_{false};
    bool is_shared_{false};
};

/// Free function form of TensorDict::from_dict() without batch_dims.
std::shared_ptr<TensorDict> make_tensordict(const TensorDict::Source& source,
                                            std::optional<Shape> batch_size = std::nullopt,
                                            std::optional<Device> device = std::nullopt);

} // namespace tensordict
