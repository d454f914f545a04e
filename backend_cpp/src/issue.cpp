#include "issue.hpp"
#include <array>
#include <utility>
#include <stdexcept>

namespace fix_memory {

using json = nlohmann::json;

namespace {

const std::array<std::pair<IssueType, const char*>, 17> kIssueTypeNames = {{
    {IssueType::FORMATTING, "formatting"},
    {IssueType::TYPE_ERROR, "type_error"},
    {IssueType::SECURITY, "security"},
    {IssueType::TEST_FAILURE, "test_failure"},
    {IssueType::IMPORT_ERROR, "import_error"},
    {IssueType::COMPLEXITY, "complexity"},
    {IssueType::DEAD_CODE, "dead_code"},
    {IssueType::DEPENDENCY, "dependency"},
    {IssueType::DRY_VIOLATION, "dry_violation"},
    {IssueType::PERFORMANCE, "performance"},
    {IssueType::DOCUMENTATION, "documentation"},
    {IssueType::TEST_ORGANIZATION, "test_organization"},
    {IssueType::COVERAGE_IMPROVEMENT, "coverage_improvement"},
    {IssueType::REGEX_VALIDATION, "regex_validation"},
    {IssueType::SEMANTIC_CONTEXT, "semantic_context"},
    {IssueType::WARNING, "warning"},
    {IssueType::REFURB, "refurb"},
}};

} // namespace

std::string to_string(IssueType type) {
    for (const auto& [value, name] : kIssueTypeNames) {
        if (value == type) return name;
    }
    return "unknown";
}

std::optional<IssueType> issue_type_from_string(const std::string& name) {
    for (const auto& [value, wire_name] : kIssueTypeNames) {
        if (name == wire_name) return value;
    }
    return std::nullopt;
}

void to_json(json& j, const Issue& issue) {
    j = json{
        {"type", to_string(issue.type)},
        {"message", issue.message},
        {"stage", issue.stage}
    };
    j["file_path"] = issue.file_path ? json(*issue.file_path) : json(nullptr);
    j["line_number"] = issue.line_number ? json(*issue.line_number) : json(nullptr);
}

void from_json(const json& j, Issue& issue) {
    std::string type_name = j.at("type").get<std::string>();
    auto type = issue_type_from_string(type_name);
    if (!type) {
        throw std::invalid_argument("Unknown issue type: " + type_name);
    }
    issue.type = *type;
    issue.message = j.at("message").get<std::string>();
    issue.stage = j.value("stage", "");

    issue.file_path.reset();
    if (j.contains("file_path") && j["file_path"].is_string()) {
        issue.file_path = j["file_path"].get<std::string>();
    }
    issue.line_number.reset();
    if (j.contains("line_number") && j["line_number"].is_number_integer()) {
        issue.line_number = j["line_number"].get<int>();
    }
}

void to_json(json& j, const FixResult& result) {
    j = json{{"success", result.success}, {"confidence", result.confidence}};
}

void from_json(const json& j, FixResult& result) {
    result.success = j.at("success").get<bool>();
    result.confidence = j.value("confidence", 0.0);
    if (result.confidence < 0.0 || result.confidence > 1.0) {
        throw std::invalid_argument("FixResult confidence must lie in [0, 1]");
    }
}

} // namespace fix_memory
