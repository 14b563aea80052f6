// semgraph_cli: load sources into a knowledge graph and run one read operation.
//
// Usage:
//   semgraph_cli [--config engine.json] [--manifest sources.json] <command> [args...]
//
// Commands:
//   query <sparql> [max_results] [timeout_ms]
//   explain <sparql>
//   prefix <text> [limit]
//   search <text> [taxonomy] [limit]
//   taxonomies
//   concepts [taxonomy]
//   grouped [taxonomy]
//   toplevel [taxonomy]
//   concept <iri>
//   hierarchy <iri>
//   neighbors <iri> [limit]
//   stats
//
// The manifest names the sources a directory scan cannot see:
//   {
//     "definitions": [{"name": "...", "content": "..." | "file": "...", "format": "ttl"}],
//     "glossaries":  [{"name": "...", "terms": [{"id": "...", "name": "...",
//                      "definition": "...", "parent_id": "...", "synonyms": []}]}],
//     "links":       [{"entity_type": "...", "entity_id": "...", "target_iri": "..."}]
//   }
// Results are printed to stdout as JSON.

#include <semgraph/engine/knowledge_graph.h>
#include <semgraph/util/config.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace semgraph;

namespace {

struct Manifest {
    std::vector<DefinitionRow> definitions;
    std::vector<GlossarySource> glossaries;
    std::vector<EntityLinkRow> links;
};

arrow::Result<std::string> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return arrow::Status::IOError("Cannot open ", path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

arrow::Result<Manifest> LoadManifest(const std::string& path) {
    ARROW_ASSIGN_OR_RAISE(auto text, ReadFile(path));
    Manifest manifest;
    try {
        auto j = nlohmann::json::parse(text);
        for (const auto& item : j.value("definitions", nlohmann::json::array())) {
            DefinitionRow row;
            row.name = item.at("name").get<std::string>();
            row.format = item.value("format", std::string("ttl"));
            row.enabled = item.value("enabled", true);
            if (item.contains("file")) {
                ARROW_ASSIGN_OR_RAISE(row.content, ReadFile(item.at("file").get<std::string>()));
            } else {
                row.content = item.value("content", std::string());
            }
            manifest.definitions.push_back(std::move(row));
        }
        for (const auto& item : j.value("glossaries", nlohmann::json::array())) {
            GlossarySource glossary;
            glossary.name = item.at("name").get<std::string>();
            for (const auto& t : item.value("terms", nlohmann::json::array())) {
                GlossaryTerm term;
                term.id = t.at("id").get<std::string>();
                term.name = t.value("name", std::string());
                term.definition = t.value("definition", std::string());
                if (t.contains("parent_id") && !t.at("parent_id").is_null()) {
                    term.parent_id = t.at("parent_id").get<std::string>();
                }
                term.synonyms = t.value("synonyms", std::vector<std::string>());
                glossary.terms.push_back(std::move(term));
            }
            manifest.glossaries.push_back(std::move(glossary));
        }
        for (const auto& item : j.value("links", nlohmann::json::array())) {
            EntityLinkRow link;
            link.entity_type = item.at("entity_type").get<std::string>();
            link.entity_id = item.at("entity_id").get<std::string>();
            link.target_iri = item.at("target_iri").get<std::string>();
            manifest.links.push_back(std::move(link));
        }
    } catch (const nlohmann::json::exception& e) {
        return arrow::Status::Invalid("Manifest ", path, ": ", e.what());
    }
    return manifest;
}

nlohmann::json ResultToJson(const QueryResult& result) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : result.rows) {
        nlohmann::json r = nlohmann::json::object();
        for (const auto& [name, value] : row) {
            r[name] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
        }
        rows.push_back(std::move(r));
    }
    return {{"columns", result.columns},
            {"rows", std::move(rows)},
            {"time_ms", result.stats.total_time_ms}};
}

std::optional<std::string> Arg(const std::vector<std::string>& args, size_t i) {
    if (i < args.size()) {
        return args[i];
    }
    return std::nullopt;
}

std::optional<size_t> SizeArg(const std::vector<std::string>& args, size_t i) {
    if (i < args.size()) {
        return static_cast<size_t>(std::stoull(args[i]));
    }
    return std::nullopt;
}

void PrintUsage() {
    std::cerr << "Usage: semgraph_cli [--config FILE] [--manifest FILE] <command> [args...]\n"
              << "Commands: query explain prefix search taxonomies concepts grouped toplevel\n"
              << "          concept hierarchy neighbors stats\n";
}

arrow::Result<nlohmann::json> RunCommand(const KnowledgeGraph& graph,
                                         const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "query" || command == "explain") {
        auto text = Arg(args, 1);
        if (!text) {
            return arrow::Status::Invalid(command, " needs a query");
        }
        if (command == "explain") {
            ARROW_ASSIGN_OR_RAISE(auto plan, graph.Explain(*text));
            return nlohmann::json{{"plan", plan}};
        }
        std::optional<std::chrono::milliseconds> timeout;
        if (auto ms = SizeArg(args, 3)) {
            timeout = std::chrono::milliseconds(static_cast<int64_t>(*ms));
        }
        ARROW_ASSIGN_OR_RAISE(auto result, graph.Query(*text, SizeArg(args, 2), timeout));
        return ResultToJson(result);
    }
    if (command == "prefix") {
        auto text = Arg(args, 1);
        if (!text) {
            return arrow::Status::Invalid("prefix needs a search text");
        }
        return nlohmann::json(graph.PrefixSearch(*text, SizeArg(args, 2)));
    }
    if (command == "search") {
        auto text = Arg(args, 1);
        if (!text) {
            return arrow::Status::Invalid("search needs a search text");
        }
        return nlohmann::json(graph.SearchConcepts(*text, Arg(args, 2), SizeArg(args, 3)));
    }
    if (command == "taxonomies") {
        return nlohmann::json(graph.GetTaxonomies());
    }
    if (command == "concepts") {
        return nlohmann::json(graph.GetConceptsByTaxonomy(Arg(args, 1)));
    }
    if (command == "grouped") {
        return nlohmann::json(graph.GetGroupedConcepts(Arg(args, 1)));
    }
    if (command == "toplevel") {
        return nlohmann::json(graph.GetTopLevelConcepts(Arg(args, 1)));
    }
    if (command == "concept" || command == "hierarchy" || command == "neighbors") {
        auto iri = Arg(args, 1);
        if (!iri) {
            return arrow::Status::Invalid(command, " needs an IRI");
        }
        if (command == "neighbors") {
            return nlohmann::json(graph.Neighbors(*iri, SizeArg(args, 2)));
        }
        if (command == "concept") {
            auto found = graph.GetConceptDetails(*iri);
            return found ? nlohmann::json(*found) : nlohmann::json(nullptr);
        }
        auto hierarchy = graph.GetConceptHierarchy(*iri);
        return hierarchy ? nlohmann::json(*hierarchy) : nlohmann::json(nullptr);
    }
    if (command == "stats") {
        return nlohmann::json(graph.GetTaxonomyStats());
    }
    return arrow::Status::Invalid("Unknown command: ", command);
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string manifest_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--manifest" && i + 1 < argc) {
            manifest_path = argv[++i];
        } else {
            args.push_back(std::move(arg));
        }
    }
    if (args.empty()) {
        PrintUsage();
        return 2;
    }

    EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = LoadEngineConfig(config_path);
        if (!loaded.ok()) {
            std::cerr << "Failed to load config: " << loaded.status().ToString() << std::endl;
            return 1;
        }
        config = *loaded;
    } else {
        auto status = ApplyEnvironmentOverrides(&config);
        if (!status.ok()) {
            std::cerr << "Invalid environment: " << status.ToString() << std::endl;
            return 1;
        }
    }

    auto provider = std::make_unique<DirectorySourceProvider>(config.taxonomy_dir,
                                                              config.builtin_schema_dir);
    if (!manifest_path.empty()) {
        auto manifest = LoadManifest(manifest_path);
        if (!manifest.ok()) {
            std::cerr << "Failed to load manifest: " << manifest.status().ToString() << std::endl;
            return 1;
        }
        provider->SetDefinitions(std::move(manifest->definitions));
        provider->SetGlossaries(std::move(manifest->glossaries));
        provider->SetLinks(std::move(manifest->links));
    }

    KnowledgeGraph graph(config, std::move(provider));
    auto report = graph.Rebuild();
    if (!report.ok()) {
        std::cerr << "Rebuild failed: " << report.status().ToString() << std::endl;
        return 1;
    }
    for (const auto& skipped : report->skipped) {
        std::cerr << "Skipped " << skipped << std::endl;
    }

    arrow::Result<nlohmann::json> output;
    try {
        output = RunCommand(graph, args);
    } catch (const std::invalid_argument& e) {
        output = arrow::Status::Invalid("Bad numeric argument: ", e.what());
    } catch (const std::out_of_range& e) {
        output = arrow::Status::Invalid("Numeric argument out of range: ", e.what());
    }
    if (!output.ok()) {
        auto kind = ClassifyQueryError(output.status());
        std::cerr << (kind ? std::string(toString(*kind)) : std::string("Error")) << ": "
                  << output.status().message() << std::endl;
        return 1;
    }
    std::cout << output->dump(2) << std::endl;
    return 0;
}
