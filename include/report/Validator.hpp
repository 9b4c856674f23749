#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "report/Models.hpp"

namespace report {

struct FieldViolation {
    std::string path;       // dotted, e.g. healthAndSafetyPerformance.incidentSummary.ltifr
    std::string message;
};

struct ValidationResult {
    bool pass = true;
    std::vector<FieldViolation> violations;
    std::optional<Report> report;   // set only when pass
};

// Checks every field rule of the OHS report schema against an untyped record
// and collects all violations in schema order. Minimum lengths count the raw
// value in UTF-16 code units; surrounding whitespace is not trimmed.
ValidationResult validate_report(const nlohmann::json& candidate);

void write_validation_report(const std::filesystem::path& path, const ValidationResult& res);

}  // namespace report
