#include "batcher_options.h"

#include <algorithm>
#include <cctype>

#include "common/errors.h"

namespace DeepBatch {

namespace {

std::string Lowered(const std::string& value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

void ValidateOptions(const BatcherOptions& options) {
    if (options.max_items <= 0) {
        throw ConfigError("max_items must be positive, got " + std::to_string(options.max_items));
    }
    if (options.max_bytes.has_value() && *options.max_bytes == 0) {
        throw ConfigError("max_bytes must be positive when set");
    }
}

Consistency ParseConsistency(const std::string& value) {
    std::string v = Lowered(value);
    if (v == "at_access") return Consistency::kAtAccess;
    if (v == "strict") return Consistency::kStrict;
    throw ConfigError("Invalid consistency: " + value);
}

AliasPolicy ParseAliasPolicy(const std::string& value) {
    std::string v = Lowered(value);
    if (v == "preserve") return AliasPolicy::kPreserve;
    if (v == "duplicate") return AliasPolicy::kDuplicate;
    throw ConfigError("Invalid alias policy: " + value);
}

const char* ToString(Consistency consistency) {
    switch (consistency) {
        case Consistency::kAtAccess: return "at_access";
        case Consistency::kStrict: return "strict";
    }
    return "unknown";
}

const char* ToString(AliasPolicy alias) {
    switch (alias) {
        case AliasPolicy::kPreserve: return "preserve";
        case AliasPolicy::kDuplicate: return "duplicate";
    }
    return "unknown";
}

} // namespace DeepBatch
