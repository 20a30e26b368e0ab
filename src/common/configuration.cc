#include "configuration.h"

#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"

namespace DeepBatch {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        // stoull accepts a sign and wraps negative values around.
        std::string text(env_val);
        size_t first = text.find_first_not_of(" \t\n\r\f\v");
        if (first != std::string::npos && text[first] == '-') {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": negative value " << text;
            return std::nullopt;
        }
        try {
            return std::stoull(text);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseRoot(const YAML::Node& yaml, DeepBatchConfig& target) {
    if (!yaml["deepbatch"]) {
        LOG(WARNING) << "Configuration has no 'deepbatch' section, keeping defaults";
        return;
    }
    auto root = yaml["deepbatch"];

    // Batcher
    if (root["batcher"]) {
        auto batcher = root["batcher"];
        if (batcher["max_items"]) target.batcher.max_items.set(batcher["max_items"].as<int>());
        if (batcher["max_bytes"]) target.batcher.max_bytes.set(batcher["max_bytes"].as<size_t>());
        if (batcher["consistency"]) target.batcher.consistency.set(batcher["consistency"].as<std::string>());
        if (batcher["alias"]) target.batcher.alias.set(batcher["alias"].as<std::string>());
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) target.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        // Parse into a copy so a conversion error leaves the current values intact.
        DeepBatchConfig parsed = config_;
        parseRoot(yaml, parsed);
        config_ = parsed;
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        // Parse into a copy so a conversion error leaves the current values intact.
        DeepBatchConfig parsed = config_;
        parseRoot(yaml, parsed);
        config_ = parsed;
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

BatcherOptions Configuration::toBatcherOptions() const {
    if (!validate()) {
        std::string message = "Invalid configuration:";
        for (const auto& error : validation_errors_) {
            message += " " + error + ";";
        }
        throw ConfigError(message);
    }

    BatcherOptions options;
    options.max_items = config_.batcher.max_items.get();
    size_t max_bytes = config_.batcher.max_bytes.get();
    if (max_bytes > 0) {
        options.max_bytes = max_bytes;
    }
    options.consistency = ParseConsistency(config_.batcher.consistency.get());
    options.alias = ParseAliasPolicy(config_.batcher.alias.get());
    return options;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.batcher.max_items.get() <= 0) {
        validation_errors_.push_back("Batcher max_items must be at least 1");
    }

    try {
        ParseConsistency(config_.batcher.consistency.get());
    } catch (const ConfigError& e) {
        validation_errors_.push_back(e.what());
    }

    try {
        ParseAliasPolicy(config_.batcher.alias.get());
    } catch (const ConfigError& e) {
        validation_errors_.push_back(e.what());
    }

    if (config_.logging.verbosity.get() < 0) {
        validation_errors_.push_back("Log verbosity cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace DeepBatch
