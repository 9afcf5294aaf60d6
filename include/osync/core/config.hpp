#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/conflict.hpp"
#include "osync/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace osync {

/**
 * @brief What to do with a local operation the remote already outdated
 */
enum class SupersededPolicy {
    Discard,   ///< Drop it; the UI adopts the remote version
    Rederive   ///< Build a fresh operation from current local state and queue it
};

const char* to_string(SupersededPolicy policy);
Result<SupersededPolicy> superseded_policy_from_string(const std::string& text);

struct EngineConfig {
    std::string node_id;
    std::uint32_t max_retries = 5;
    std::chrono::milliseconds base_backoff{1000};
    std::chrono::milliseconds max_backoff{5 * 60 * 1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds remote_timeout{10 * 1000};
    SupersededPolicy superseded_policy = SupersededPolicy::Discard;
    std::size_t history_limit = 256;   ///< Terminal items kept for item() lookups

    // Wall clock by default; tests inject a manual one
    std::function<sync::Timestamp()> clock = [] { return std::chrono::system_clock::now(); };
};

/**
 * @brief Engine settings plus the per-entity-type conflict policies
 */
struct LoadedConfig {
    EngineConfig engine;
    std::map<std::string, sync::EntityPolicy> policies;
};

/**
 * @brief Check the invariants the engine relies on
 *
 * node_id must be non-empty, the multiplier at least 1 and
 * base_backoff no larger than max_backoff.
 */
Result<void> validate_engine_config(const EngineConfig& config);

/**
 * @brief Read a configuration document
 *
 * {
 *   "node_id": "laptop-7",
 *   "max_retries": 5,
 *   "base_backoff_ms": 1000,
 *   "max_backoff_ms": 300000,
 *   "backoff_multiplier": 2.0,
 *   "remote_timeout_ms": 10000,
 *   "superseded_policy": "discard",
 *   "history_limit": 256,
 *   "entity_types": {
 *     "forum_post": {"mode": "field_merge", "mergeable_fields": ["title", "body"]},
 *     "grade":      {"mode": "manual"}
 *   }
 * }
 *
 * Every key except node_id is optional. Fails with InvalidConfig.
 */
Result<LoadedConfig> parse_engine_config(const nlohmann::json& document);

Result<LoadedConfig> load_engine_config(const std::filesystem::path& path);

/**
 * @brief Install every policy of config into resolver
 */
void register_policies(const LoadedConfig& config, sync::ConflictResolver& resolver);

} // namespace osync
