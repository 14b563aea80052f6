#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <arrow/result.h>
#include <arrow/status.h>
#include <nlohmann/json.hpp>

namespace semgraph {

// Engine-wide defaults and limits
struct EngineConfig {
    // query(): row cap and wall-clock limit when the caller passes none
    size_t default_max_results = 1000;
    std::chrono::milliseconds default_timeout{30000};

    // Rows per operator batch
    size_t batch_size = 1024;

    // Default caps for the browsing operations
    size_t prefix_search_limit = 25;
    size_t concept_search_limit = 50;
    size_t neighbors_limit = 200;

    // Rows scanned between two deadline checks inside operator loops
    size_t deadline_check_interval = 256;

    // Directories read by DirectorySourceProvider (empty: not used)
    std::string builtin_schema_dir;
    std::string taxonomy_dir;

    arrow::Status Validate() const;

    nlohmann::json ToJson() const;

    // Missing keys keep their defaults; unknown keys are ignored
    static arrow::Result<EngineConfig> FromJson(const nlohmann::json& j);
};

// Read a JSON config file, then apply SEMGRAPH_MAX_RESULTS / SEMGRAPH_QUERY_TIMEOUT_MS
arrow::Result<EngineConfig> LoadEngineConfig(const std::string& path);

// Apply environment overrides to an existing config
arrow::Status ApplyEnvironmentOverrides(EngineConfig* config);

} // namespace semgraph
