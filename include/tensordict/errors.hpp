#pragma once

#include <stdexcept>
#include <string>

namespace tensordict {

/** @brief A leaf or nested container violates the batch-prefix invariant. */
class ShapeMismatchError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Structural mutation of a locked container or a rejected unlock. */
class LockedMutationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Operation not available on this container variant. */
class UnsupportedOperationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Base class of key lookup failures. */
class KeyError : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
};

/// Key path not present.
class KeyMissingError : public KeyError {
  public:
    using KeyError::KeyError;
};

/// Two logical keys would alias after a flatten / unflatten / rename.
class KeyCollisionError : public KeyError {
  public:
    using KeyError::KeyError;
};

/** @brief Index or dimension out of range. */
class IndexError : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
};

/** @brief Invalid argument value. */
class ValueError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/// Siblings of a stack disagree on their batch size.
class BatchSizeMismatchError : public ValueError {
  public:
    using ValueError::ValueError;
};

/// Siblings of a stack live on different devices.
class DeviceMismatchError : public ValueError {
  public:
    using ValueError::ValueError;
};

/** @brief Wrong kind of value (leaf where a container is required, ...). */
class TypeMismatchError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

} // namespace tensordict
