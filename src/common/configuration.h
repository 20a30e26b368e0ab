#ifndef DEEPBATCH_COMMON_CONFIGURATION_H_
#define DEEPBATCH_COMMON_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "batcher/batcher_options.h"

namespace YAML {
class Node;
}

namespace DeepBatch {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct DeepBatchConfig {
    struct Batcher {
        ConfigValue<int> max_items{64, "DEEPBATCH_MAX_ITEMS"};
        // 0 disables the byte cap
        ConfigValue<size_t> max_bytes{0, "DEEPBATCH_MAX_BYTES"};
        ConfigValue<std::string> consistency{"at_access", "DEEPBATCH_CONSISTENCY"};
        ConfigValue<std::string> alias{"preserve", "DEEPBATCH_ALIAS"};
    } batcher;

    struct Logging {
        ConfigValue<int> verbosity{0, "DEEPBATCH_LOG_VERBOSITY"};
    } logging;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Restore every value to its built-in default
    void reset() { config_ = DeepBatchConfig{}; }

    // Get the configuration
    const DeepBatchConfig& config() const { return config_; }
    DeepBatchConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getMaxItems() const { return config_.batcher.max_items.get(); }
    size_t getMaxBytes() const { return config_.batcher.max_bytes.get(); }
    int getLogVerbosity() const { return config_.logging.verbosity.get(); }

    // Build Batcher options from the effective values. Throws ConfigError
    // listing every validation error.
    BatcherOptions toBatcherOptions() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    DeepBatchConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies the 'deepbatch' section on top of target. Throws YAML::Exception
    // on a conversion error.
    void parseRoot(const YAML::Node& yaml, DeepBatchConfig& target);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace DeepBatch

#endif // DEEPBATCH_COMMON_CONFIGURATION_H_
