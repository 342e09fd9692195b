#pragma once

#include "cdd/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cdd {

// ============================================================================
// Source Reference Analysis
// ============================================================================
//
// Captures a readable source file as a frozen reference: a snapshot copy,
// a structure.json document, a PATTERNS.md template and an elements.md
// summary. Contracts' source_ref fields point into these documents.

// File type for a recognized extension ("python", "cpp", ...)
std::optional<std::string> source_file_type(const std::string& path);

bool is_source_file(const std::string& path);

// Number of lines as a text reader sees them (a final unterminated line counts)
int count_lines(const std::string& path);

struct SourceStructure {
    std::string type = "source_reference";
    std::string original_path;
    std::string snapshot_path;      // relative to the analysis directory
    std::string hash;               // SHA-256 hex
    std::string captured_at;
    std::string file_type;
    std::uintmax_t size_bytes = 0;
    int line_count = 0;
};

struct SourceAnalysis {
    SourceStructure structure;
    std::string source_name;
    std::string output_dir;
    std::vector<std::string> files;
};

Result<SourceAnalysis> analyze_source(const std::string& source_path,
                                      const std::string& output_dir);

// Accepts an analysis directory or a structure.json path
Result<SourceStructure> load_source_structure(const std::string& path);

nlohmann::json source_structure_to_json(const SourceStructure& structure);
nlohmann::json source_analysis_to_json(const SourceAnalysis& analysis);

// {type, match, original_hash, generated_hash, file_type_match, ..., summary}
nlohmann::json compare_source_analyses(const SourceStructure& original,
                                       const SourceStructure& generated);

} // namespace cdd
