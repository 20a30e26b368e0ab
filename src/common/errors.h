#pragma once

#include <stdexcept>
#include <string>

namespace DeepBatch {

/**
 * Raised when an object graph cannot be deep-copied (an uncopyable object
 * was reached, or the graph is too deep to traverse). Surfaces to whichever
 * caller triggered the flush.
 */
class CopyError : public std::runtime_error {
public:
    explicit CopyError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Raised for invalid configuration, at construction time rather than at
 * first use.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace DeepBatch
