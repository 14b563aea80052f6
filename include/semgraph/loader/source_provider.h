#pragma once

#include <string>
#include <vector>
#include <arrow/result.h>
#include <semgraph/loader/source_loader.h>

namespace semgraph {

// SourceProvider: the collaborator seam that gathers current source state for a rebuild.
// All I/O of a rebuild happens behind this interface.
class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    virtual arrow::Result<SourceSet> Collect() = 0;
};

// Hands out a fixed SourceSet (tests, embedding callers that manage sources themselves)
class StaticSourceProvider : public SourceProvider {
public:
    StaticSourceProvider() = default;
    explicit StaticSourceProvider(SourceSet sources) : sources_(std::move(sources)) {}

    arrow::Result<SourceSet> Collect() override { return sources_; }

    SourceSet& mutable_sources() { return sources_; }

private:
    SourceSet sources_;
};

// Reads taxonomy and built-in schema files from two directories.
//
// Files with an accepted RDF extension are read in file-name order. A missing
// directory contributes nothing; an unreadable file is logged and skipped.
// Definitions, glossaries and links are injected by the caller.
class DirectorySourceProvider : public SourceProvider {
public:
    DirectorySourceProvider(std::string taxonomy_dir, std::string builtin_schema_dir)
        : taxonomy_dir_(std::move(taxonomy_dir)),
          builtin_schema_dir_(std::move(builtin_schema_dir)) {}

    arrow::Result<SourceSet> Collect() override;

    void SetDefinitions(std::vector<DefinitionRow> rows) { definitions_ = std::move(rows); }
    void SetGlossaries(std::vector<GlossarySource> glossaries) { glossaries_ = std::move(glossaries); }
    void SetLinks(std::vector<EntityLinkRow> links) { links_ = std::move(links); }

private:
    std::string taxonomy_dir_;
    std::string builtin_schema_dir_;
    std::vector<DefinitionRow> definitions_;
    std::vector<GlossarySource> glossaries_;
    std::vector<EntityLinkRow> links_;
};

// Read every RDF file of dir (sorted by name). Missing directory -> empty list.
arrow::Result<std::vector<SourceFile>> ReadSourceDirectory(const std::string& dir);

} // namespace semgraph
