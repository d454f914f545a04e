#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace fix_memory {

enum class IssueType {
    FORMATTING,
    TYPE_ERROR,
    SECURITY,
    TEST_FAILURE,
    IMPORT_ERROR,
    COMPLEXITY,
    DEAD_CODE,
    DEPENDENCY,
    DRY_VIOLATION,
    PERFORMANCE,
    DOCUMENTATION,
    TEST_ORGANIZATION,
    COVERAGE_IMPROVEMENT,
    REGEX_VALIDATION,
    SEMANTIC_CONTEXT,
    WARNING,
    REFURB
};

// Wire names are the lower-case tags the issue parsers emit ("type_error", ...)
std::string to_string(IssueType type);
std::optional<IssueType> issue_type_from_string(const std::string& name);

// One finding reported by a lint/type/test/security stage. Immutable once built.
struct Issue {
    IssueType type = IssueType::FORMATTING;
    std::string message;
    std::optional<std::string> file_path;
    std::optional<int> line_number;
    std::string stage;
};

struct FixResult {
    bool success = false;
    double confidence = 0.0;
};

void to_json(nlohmann::json& j, const Issue& issue);
void from_json(const nlohmann::json& j, Issue& issue);
void to_json(nlohmann::json& j, const FixResult& result);
void from_json(const nlohmann::json& j, FixResult& result);

} // namespace fix_memory
