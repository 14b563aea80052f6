#include <semgraph/util/config.h>
#include <semgraph/util/logging.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace semgraph {

SEMGRAPH_LOG_TAG(Config);

namespace {

template <typename T>
arrow::Status ReadField(const nlohmann::json& j, const char* key, T* out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return arrow::Status::OK();
    }
    try {
        *out = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        return arrow::Status::Invalid("Config field '", key, "': ", e.what());
    }
    return arrow::Status::OK();
}

arrow::Result<long long> ParsePositiveEnv(const char* name, const char* value) {
    char* end = nullptr;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0' || parsed <= 0) {
        return arrow::Status::Invalid("Environment variable ", name,
                                      " must be a positive integer, got '", value, "'");
    }
    return parsed;
}

} // namespace

arrow::Status EngineConfig::Validate() const {
    if (batch_size == 0) {
        return arrow::Status::Invalid("batch_size must be positive");
    }
    if (default_max_results == 0) {
        return arrow::Status::Invalid("default_max_results must be positive");
    }
    if (default_timeout.count() <= 0) {
        return arrow::Status::Invalid("default_timeout_ms must be positive");
    }
    if (prefix_search_limit == 0 || concept_search_limit == 0 || neighbors_limit == 0) {
        return arrow::Status::Invalid("search and neighbor limits must be positive");
    }
    if (deadline_check_interval == 0) {
        return arrow::Status::Invalid("deadline_check_interval must be positive");
    }
    return arrow::Status::OK();
}

nlohmann::json EngineConfig::ToJson() const {
    nlohmann::json j;
    j["default_max_results"] = default_max_results;
    j["default_timeout_ms"] = default_timeout.count();
    j["batch_size"] = batch_size;
    j["prefix_search_limit"] = prefix_search_limit;
    j["concept_search_limit"] = concept_search_limit;
    j["neighbors_limit"] = neighbors_limit;
    j["deadline_check_interval"] = deadline_check_interval;
    j["builtin_schema_dir"] = builtin_schema_dir;
    j["taxonomy_dir"] = taxonomy_dir;
    return j;
}

arrow::Result<EngineConfig> EngineConfig::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return arrow::Status::Invalid("Engine config must be a JSON object");
    }

    EngineConfig config;
    long long timeout_ms = config.default_timeout.count();
    ARROW_RETURN_NOT_OK(ReadField(j, "default_max_results", &config.default_max_results));
    ARROW_RETURN_NOT_OK(ReadField(j, "default_timeout_ms", &timeout_ms));
    ARROW_RETURN_NOT_OK(ReadField(j, "batch_size", &config.batch_size));
    ARROW_RETURN_NOT_OK(ReadField(j, "prefix_search_limit", &config.prefix_search_limit));
    ARROW_RETURN_NOT_OK(ReadField(j, "concept_search_limit", &config.concept_search_limit));
    ARROW_RETURN_NOT_OK(ReadField(j, "neighbors_limit", &config.neighbors_limit));
    ARROW_RETURN_NOT_OK(ReadField(j, "deadline_check_interval", &config.deadline_check_interval));
    ARROW_RETURN_NOT_OK(ReadField(j, "builtin_schema_dir", &config.builtin_schema_dir));
    ARROW_RETURN_NOT_OK(ReadField(j, "taxonomy_dir", &config.taxonomy_dir));
    config.default_timeout = std::chrono::milliseconds(timeout_ms);

    ARROW_RETURN_NOT_OK(config.Validate());
    return config;
}

arrow::Status ApplyEnvironmentOverrides(EngineConfig* config) {
    if (const char* value = std::getenv("SEMGRAPH_MAX_RESULTS")) {
        ARROW_ASSIGN_OR_RAISE(auto parsed, ParsePositiveEnv("SEMGRAPH_MAX_RESULTS", value));
        config->default_max_results = static_cast<size_t>(parsed);
        SEMGRAPH_LOG_INFO(Config) << "default_max_results overridden to " << parsed;
    }
    if (const char* value = std::getenv("SEMGRAPH_QUERY_TIMEOUT_MS")) {
        ARROW_ASSIGN_OR_RAISE(auto parsed, ParsePositiveEnv("SEMGRAPH_QUERY_TIMEOUT_MS", value));
        config->default_timeout = std::chrono::milliseconds(parsed);
        SEMGRAPH_LOG_INFO(Config) << "default_timeout overridden to " << parsed << " ms";
    }
    return arrow::Status::OK();
}

arrow::Result<EngineConfig> LoadEngineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return arrow::Status::IOError("Cannot open config file: ", path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return arrow::Status::Invalid("Config file ", path, " is not valid JSON: ", e.what());
    }

    ARROW_ASSIGN_OR_RAISE(auto config, EngineConfig::FromJson(j));
    ARROW_RETURN_NOT_OK(ApplyEnvironmentOverrides(&config));
    ARROW_RETURN_NOT_OK(config.Validate());
    return config;
}

} // namespace semgraph
