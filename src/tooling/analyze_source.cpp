#include "cdd/analyze.hpp"
#include "cdd/hash.hpp"
#include "cdd/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

namespace cdd {

namespace fs = std::filesystem;

namespace {

constexpr const char* kStructureFile = "structure.json";
constexpr const char* kPatternsFile = "PATTERNS.md";
constexpr const char* kElementsFile = "elements.md";

const std::map<std::string, std::string>& source_extensions() {
    static const std::map<std::string, std::string> extensions = {
        {".py", "python"},     {".pyi", "python"},
        {".js", "javascript"}, {".jsx", "javascript"},
        {".ts", "typescript"}, {".tsx", "typescript"},
        {".scd", "supercollider"}, {".sc", "supercollider"},
        {".yaml", "yaml"},     {".yml", "yaml"},
        {".json", "json"},     {".toml", "toml"},
        {".sh", "shell"},      {".bash", "shell"},   {".zsh", "shell"},
        {".md", "markdown"},   {".txt", "text"},
        {".css", "css"},       {".sql", "sql"},      {".r", "r"},
        {".rs", "rust"},       {".go", "go"},        {".rb", "ruby"},
        {".lua", "lua"},
        {".c", "c"},           {".h", "c"},
        {".cpp", "cpp"},       {".hpp", "cpp"},
        {".java", "java"},     {".swift", "swift"},  {".kt", "kotlin"},
    };
    return extensions;
}

std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string short_hash(const std::string& hash) {
    return hash.substr(0, 12) + "...";
}

std::string type_specific_section(const std::string& file_type) {
    if (file_type == "python") {
        return R"(
## Python-Specific

### Classes
<!-- List key classes and their responsibilities -->

### Public API
<!-- Functions/methods that form the interface -->

### Dependencies
<!-- Required imports/packages -->

)";
    }
    if (file_type == "supercollider") {
        return R"(
## SuperCollider-Specific

### SynthDef Structure
<!-- Key UGen patterns, signal flow -->

### Bus Reads
<!-- Required control buses -->

### Post-Chain
<!-- ~ensure2ch, ~multiFilter, ~envVCA patterns -->

)";
    }
    if (file_type == "javascript" || file_type == "typescript") {
        std::string title = file_type == "javascript" ? "JavaScript" : "TypeScript";
        std::string middle = file_type == "javascript"
            ? "### Component Structure\n<!-- For React/Vue, component patterns -->\n"
            : "### Types/Interfaces\n<!-- Key type definitions -->\n";
        return "\n## " + title + "-Specific\n\n"
               "### Exports\n<!-- Module exports that form the interface -->\n\n" +
               middle +
               "\n### Dependencies\n<!-- Required imports/packages -->\n\n";
    }
    if (file_type == "c" || file_type == "cpp") {
        return R"(
## C/C++-Specific

### Public Headers
<!-- Types and functions declared for callers -->

### Ownership
<!-- Who allocates and who frees -->

### Dependencies
<!-- Required libraries/headers -->

)";
    }
    return "";
}

std::string patterns_template(const std::string& file_type, const std::string& source_name,
                              const std::string& hash, const std::string& timestamp) {
    std::string list = "- \n- \n- \n";
    return "# Reference: " + source_name + "\n\n"
           "> Captured: " + timestamp + "  \n"
           "> Hash: " + short_hash(hash) + "\n\n"
           "## Purpose\n\n"
           "<!-- What does this reference file do? Why is it the reference? -->\n\n\n"
           "## Key Patterns to Preserve\n\n"
           "<!-- What structural patterns should new code follow? -->\n\n" + list + "\n"
           "## Required Elements\n\n"
           "<!-- Classes, methods, functions that must exist in derived code -->\n\n" + list + "\n"
           "## Allowed Deviations\n\n"
           "<!-- What can/should differ in the new code? -->\n\n" + list + "\n"
           "## Notes\n\n"
           "<!-- Any additional context for implementation -->\n\n" +
           type_specific_section(file_type);
}

std::string elements_summary(const SourceStructure& s, const std::string& source_name) {
    const std::string& snapshot = s.snapshot_path;
    return "# Source Reference: " + source_name + "\n\n"
           "| Property | Value |\n"
           "|----------|-------|\n"
           "| Type | " + s.file_type + " |\n"
           "| Original | `" + s.original_path + "` |\n"
           "| Hash | `" + short_hash(s.hash) + "` |\n"
           "| Size | " + std::to_string(s.size_bytes) + " bytes |\n"
           "| Lines | " + std::to_string(s.line_count) + " |\n"
           "| Captured | " + s.captured_at + " |\n\n"
           "## Files\n\n"
           "- `" + snapshot + "` - Frozen snapshot of reference\n"
           "- `structure.json` - Metadata\n"
           "- `PATTERNS.md` - Pattern documentation (fill in)\n\n"
           "## Next Steps\n\n"
           "1. Review `" + snapshot + "` to understand the reference\n"
           "2. Fill in `PATTERNS.md` with patterns to preserve\n"
           "3. Write contract based on documented patterns\n"
           "4. Implement against contract\n";
}

} // namespace

// ============================================================================
// File Classification
// ============================================================================

std::optional<std::string> source_file_type(const std::string& path) {
    const auto& extensions = source_extensions();
    auto it = extensions.find(lower_extension(path));
    if (it == extensions.end()) return std::nullopt;
    return it->second;
}

bool is_source_file(const std::string& path) {
    return source_file_type(path).has_value();
}

int count_lines(const std::string& path) {
    auto content = read_file(path);
    if (!content || content->empty()) return 0;

    int lines = static_cast<int>(std::count(content->begin(), content->end(), '\n'));
    if (content->back() != '\n') ++lines;
    return lines;
}

// ============================================================================
// Capture
// ============================================================================

Result<SourceAnalysis> analyze_source(const std::string& source_path,
                                      const std::string& output_dir) {
    std::error_code ec;
    if (!fs::is_regular_file(source_path, ec)) {
        return Result<SourceAnalysis>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "Source file not found: " + source_path));
    }

    auto file_type = source_file_type(source_path);
    if (!file_type) {
        return Result<SourceAnalysis>::err(Error(ErrorCode::UNSUPPORTED_FEATURE,
            "Unsupported source type: " + fs::path(source_path).extension().string()));
    }

    auto digest = compute_sha256_file(source_path);
    if (!digest.ok) {
        return Result<SourceAnalysis>::err(Error(ErrorCode::IO_ERROR, digest.error));
    }

    SourceStructure structure;
    structure.original_path = source_path;
    structure.hash = digest.hex_digest;
    structure.captured_at = get_current_timestamp();
    structure.file_type = *file_type;
    structure.line_count = count_lines(source_path);
    structure.size_bytes = fs::file_size(source_path, ec);
    if (ec) {
        return Result<SourceAnalysis>::err(Error(ErrorCode::IO_ERROR,
            "cannot stat " + source_path + ": " + ec.message()));
    }

    fs::path out(output_dir);
    fs::create_directories(out, ec);
    if (ec) {
        return Result<SourceAnalysis>::err(Error(ErrorCode::IO_ERROR,
            "cannot create " + output_dir + ": " + ec.message()));
    }

    structure.snapshot_path = "source" + fs::path(source_path).extension().string();
    fs::copy_file(source_path, out / structure.snapshot_path,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<SourceAnalysis>::err(Error(ErrorCode::IO_ERROR,
            "cannot snapshot " + source_path + ": " + ec.message()));
    }

    std::string source_name = fs::path(source_path).filename().string();
    const std::pair<const char*, std::string> documents[] = {
        {kStructureFile, source_structure_to_json(structure).dump(2) + "\n"},
        {kPatternsFile, patterns_template(structure.file_type, source_name, structure.hash,
                                          structure.captured_at)},
        {kElementsFile, elements_summary(structure, source_name)},
    };
    for (const auto& [name, content] : documents) {
        if (!write_file((out / name).string(), content)) {
            return Result<SourceAnalysis>::err(
                Error(ErrorCode::IO_ERROR, "cannot write " + (out / name).string()));
        }
    }

    SourceAnalysis analysis;
    analysis.source_name = source_name;
    analysis.output_dir = output_dir;
    analysis.files = {structure.snapshot_path, kStructureFile, kPatternsFile, kElementsFile};
    analysis.structure = std::move(structure);
    return Result<SourceAnalysis>::ok(std::move(analysis));
}

Result<SourceStructure> load_source_structure(const std::string& path) {
    std::error_code ec;
    fs::path structure_path = fs::is_directory(path, ec) ? fs::path(path) / kStructureFile
                                                         : fs::path(path);

    auto text = read_file(structure_path.string());
    if (!text) {
        return Result<SourceStructure>::err(Error(ErrorCode::FILE_NOT_FOUND,
            "No structure.json at " + structure_path.string()));
    }

    nlohmann::json doc = nlohmann::json::parse(*text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<SourceStructure>::err(Error(ErrorCode::PARSE_ERROR,
            "Invalid structure document: " + structure_path.string()));
    }
    if (doc.value("type", "") != "source_reference") {
        return Result<SourceStructure>::err(Error(ErrorCode::INVALID_CONTRACT,
            structure_path.string() + " is not a source reference"));
    }

    SourceStructure s;
    s.original_path = doc.value("original_path", "");
    s.snapshot_path = doc.value("snapshot_path", "");
    s.hash = doc.value("hash", "");
    s.captured_at = doc.value("captured_at", "");
    s.file_type = doc.value("file_type", "");
    s.size_bytes = doc.value("size_bytes", std::uintmax_t{0});
    s.line_count = doc.value("line_count", 0);
    return Result<SourceStructure>::ok(std::move(s));
}

// ============================================================================
// Serialization + Comparison
// ============================================================================

nlohmann::json source_structure_to_json(const SourceStructure& s) {
    return {
        {"type", s.type},
        {"original_path", s.original_path},
        {"snapshot_path", s.snapshot_path},
        {"hash", s.hash},
        {"captured_at", s.captured_at},
        {"file_type", s.file_type},
        {"size_bytes", s.size_bytes},
        {"line_count", s.line_count},
    };
}

nlohmann::json source_analysis_to_json(const SourceAnalysis& a) {
    return {
        {"type", a.structure.type},
        {"source_name", a.source_name},
        {"file_type", a.structure.file_type},
        {"hash", a.structure.hash},
        {"line_count", a.structure.line_count},
        {"size_bytes", a.structure.size_bytes},
        {"output_dir", a.output_dir},
        {"files", a.files},
    };
}

nlohmann::json compare_source_analyses(const SourceStructure& original,
                                       const SourceStructure& generated) {
    bool match = original.hash == generated.hash;
    nlohmann::json result = {
        {"type", "source_reference"},
        {"match", match},
        {"original_hash", original.hash},
        {"generated_hash", generated.hash},
        {"file_type_match", original.file_type == generated.file_type},
        {"original_type", original.file_type},
        {"generated_type", generated.file_type},
        {"original_lines", original.line_count},
        {"generated_lines", generated.line_count},
    };

    if (match) {
        result["summary"] = "Files are identical";
        return result;
    }

    int line_diff = generated.line_count - original.line_count;
    std::string detail;
    if (line_diff > 0) {
        detail = "+" + std::to_string(line_diff) + " lines";
    } else if (line_diff < 0) {
        detail = std::to_string(line_diff) + " lines";
    } else {
        detail = "same line count";
    }
    result["summary"] = "Files differ (" + detail +
                        ") - use contracts to verify structural requirements";
    return result;
}

} // namespace cdd
