#include <semgraph/loader/source_provider.h>
#include <semgraph/util/logging.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace semgraph {

SEMGRAPH_LOG_TAG(SourceProvider);

namespace fs = std::filesystem;

namespace {

arrow::Result<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return arrow::Status::IOError("Cannot open ", path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return arrow::Status::IOError("Read failed for ", path.string());
    }
    return buffer.str();
}

} // namespace

arrow::Result<std::vector<SourceFile>> ReadSourceDirectory(const std::string& dir) {
    std::vector<SourceFile> files;
    if (dir.empty()) {
        return files;
    }

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        SEMGRAPH_LOG_INFO(SourceProvider) << "Source directory not found: " << dir;
        return files;
    }

    std::vector<fs::path> paths;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && IsRdfFileName(it->path().filename().string())) {
            paths.push_back(it->path());
        }
    }
    if (ec) {
        return arrow::Status::IOError("Cannot list ", dir, ": ", ec.message());
    }
    std::sort(paths.begin(), paths.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });

    for (const auto& path : paths) {
        auto text = ReadFile(path);
        if (!text.ok()) {
            SEMGRAPH_LOG_WARN(SourceProvider) << "Skipping " << path.string() << ": "
                                              << text.status().ToString();
            continue;
        }
        files.push_back(SourceFile{path.string(), text.MoveValueUnsafe()});
    }
    return files;
}

arrow::Result<SourceSet> DirectorySourceProvider::Collect() {
    SourceSet sources;
    ARROW_ASSIGN_OR_RAISE(sources.taxonomy_files, ReadSourceDirectory(taxonomy_dir_));
    ARROW_ASSIGN_OR_RAISE(sources.builtin_schemas, ReadSourceDirectory(builtin_schema_dir_));
    sources.definitions = definitions_;
    sources.glossaries = glossaries_;
    sources.links = links_;
    return sources;
}

} // namespace semgraph
