#include "osync/core/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace osync {
namespace {

using json = nlohmann::json;

Result<void> invalid(const std::string& message) {
    return Err<void>(make_error(ErrorCode::InvalidConfig, message));
}

// Reads an optional non-negative integer key, no larger than max, into out
Result<void> read_count(const json& document, const char* key, std::uint64_t max, std::uint64_t& out) {
    if (!document.contains(key)) {
        return Ok();
    }
    const auto& value = document.at(key);
    if (!value.is_number_unsigned()) {
        return invalid(std::string("'") + key + "' must be a non-negative integer");
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw > max) {
        return invalid(std::string("'") + key + "' must not exceed " + std::to_string(max));
    }
    out = raw;
    return Ok();
}

Result<void> read_millis(const json& document, const char* key, std::chrono::milliseconds& out) {
    constexpr auto max_millis = static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
    std::uint64_t raw = static_cast<std::uint64_t>(out.count());
    auto read = read_count(document, key, max_millis, raw);
    if (read.is_error()) {
        return read;
    }
    out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(raw));
    return Ok();
}

Result<sync::EntityPolicy> parse_policy(const std::string& type, const json& node) {
    if (!node.is_object()) {
        return Fail<sync::EntityPolicy>(ErrorCode::InvalidConfig,
                                        "Policy for '" + type + "' must be an object");
    }

    sync::EntityPolicy policy;
    if (node.contains("mode")) {
        if (!node.at("mode").is_string()) {
            return Fail<sync::EntityPolicy>(ErrorCode::InvalidConfig,
                                            "Mode of '" + type + "' must be a string");
        }
        auto mode = sync::conflict_mode_from_string(node.at("mode").get<std::string>());
        if (mode.is_error()) {
            return Err<sync::EntityPolicy>(mode.error());
        }
        policy.mode = mode.value();
    }

    if (node.contains("mergeable_fields")) {
        const auto& fields = node.at("mergeable_fields");
        if (!fields.is_array()) {
            return Fail<sync::EntityPolicy>(ErrorCode::InvalidConfig,
                                            "mergeable_fields of '" + type + "' must be an array");
        }
        for (const auto& field : fields) {
            if (!field.is_string() || field.get<std::string>().empty()) {
                return Fail<sync::EntityPolicy>(ErrorCode::InvalidConfig,
                                                "mergeable_fields of '" + type + "' must hold field names");
            }
            policy.mergeable_fields.insert(field.get<std::string>());
        }
    }
    return Ok(std::move(policy));
}

} // namespace

const char* to_string(SupersededPolicy policy) {
    switch (policy) {
        case SupersededPolicy::Discard: return "discard";
        case SupersededPolicy::Rederive: return "rederive";
    }
    return "unknown";
}

Result<SupersededPolicy> superseded_policy_from_string(const std::string& text) {
    if (text == "discard") return Ok(SupersededPolicy::Discard);
    if (text == "rederive") return Ok(SupersededPolicy::Rederive);
    return Fail<SupersededPolicy>(ErrorCode::InvalidConfig, "Unknown superseded policy: " + text);
}

Result<void> validate_engine_config(const EngineConfig& config) {
    if (config.node_id.empty()) {
        return invalid("node_id must not be empty");
    }
    if (config.backoff_multiplier < 1.0) {
        return invalid("backoff_multiplier must be at least 1");
    }
    if (config.base_backoff > config.max_backoff) {
        return invalid("base_backoff must not exceed max_backoff");
    }
    if (!config.clock) {
        return invalid("clock must be set");
    }
    return Ok();
}

Result<LoadedConfig> parse_engine_config(const json& document) {
    if (!document.is_object()) {
        return Fail<LoadedConfig>(ErrorCode::InvalidConfig, "Configuration must be a JSON object");
    }

    LoadedConfig loaded;
    auto& engine = loaded.engine;

    if (!document.contains("node_id") || !document.at("node_id").is_string()) {
        return Fail<LoadedConfig>(ErrorCode::InvalidConfig, "'node_id' is required and must be a string");
    }
    engine.node_id = document.at("node_id").get<std::string>();

    std::uint64_t max_retries = engine.max_retries;
    std::uint64_t history_limit = engine.history_limit;
    for (auto result : {read_count(document, "max_retries", std::numeric_limits<std::uint32_t>::max(), max_retries),
                        read_count(document, "history_limit", std::numeric_limits<std::size_t>::max(), history_limit),
                        read_millis(document, "base_backoff_ms", engine.base_backoff),
                        read_millis(document, "max_backoff_ms", engine.max_backoff),
                        read_millis(document, "remote_timeout_ms", engine.remote_timeout)}) {
        if (result.is_error()) {
            return Err<LoadedConfig>(result.error());
        }
    }
    engine.max_retries = static_cast<std::uint32_t>(max_retries);
    engine.history_limit = static_cast<std::size_t>(history_limit);

    if (document.contains("backoff_multiplier")) {
        if (!document.at("backoff_multiplier").is_number()) {
            return Fail<LoadedConfig>(ErrorCode::InvalidConfig, "'backoff_multiplier' must be a number");
        }
        engine.backoff_multiplier = document.at("backoff_multiplier").get<double>();
    }

    if (document.contains("superseded_policy")) {
        if (!document.at("superseded_policy").is_string()) {
            return Fail<LoadedConfig>(ErrorCode::InvalidConfig, "'superseded_policy' must be a string");
        }
        auto policy = superseded_policy_from_string(document.at("superseded_policy").get<std::string>());
        if (policy.is_error()) {
            return Err<LoadedConfig>(policy.error());
        }
        engine.superseded_policy = policy.value();
    }

    if (document.contains("entity_types")) {
        const auto& types = document.at("entity_types");
        if (!types.is_object()) {
            return Fail<LoadedConfig>(ErrorCode::InvalidConfig, "'entity_types' must be an object");
        }
        for (const auto& [type, node] : types.items()) {
            auto policy = parse_policy(type, node);
            if (policy.is_error()) {
                return Err<LoadedConfig>(policy.error());
            }
            loaded.policies.emplace(type, std::move(policy.value()));
        }
    }

    auto valid = validate_engine_config(engine);
    if (valid.is_error()) {
        return Err<LoadedConfig>(valid.error());
    }
    return Ok(std::move(loaded));
}

Result<LoadedConfig> load_engine_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Fail<LoadedConfig>(ErrorCode::InvalidConfig, "Cannot open config file " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return Fail<LoadedConfig>(ErrorCode::InvalidConfig, "Config file " + path.string() + " is not valid JSON");
    }

    auto loaded = parse_engine_config(document);
    if (loaded.is_ok()) {
        spdlog::info("Loaded engine config for node '{}' from {} ({} entity policies)",
                     loaded.value().engine.node_id, path.string(), loaded.value().policies.size());
    }
    return loaded;
}

void register_policies(const LoadedConfig& config, sync::ConflictResolver& resolver) {
    for (const auto& [type, policy] : config.policies) {
        resolver.register_policy(type, policy);
    }
}

} // namespace osync
