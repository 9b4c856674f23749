#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "report/Validator.hpp"
#include "store/ReportStore.hpp"

namespace store {

struct EditResult {
    bool found = false;
    report::ValidationResult validation;   // of the merged record; empty when !found
    bool saved = false;
};

// Applies changes to the stored record with this id: top-level keys of
// changes replace the stored ones ("id" is ignored), the merged record is
// validated, and only a passing record is written back. An optional
// top-level field absent from the merged record is cleared in the store.
// Throws std::invalid_argument when changes is not a JSON object.
EditResult edit_report(ReportStore& reports, const std::string& id, const nlohmann::json& changes);

} // namespace store
