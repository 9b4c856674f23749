#include "store/ReportEdit.hpp"

#include "io/JsonIO.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace store {

EditResult edit_report(ReportStore& reports, const std::string& id, const json& changes) {
    if (!changes.is_object()) throw std::invalid_argument("report edit must be a JSON object");

    EditResult out;
    auto existing = reports.find(id);
    if (!existing) return out;
    out.found = true;

    // Validate the record as it will be stored, not just the changed keys.
    json merged = *existing;
    for (auto it = changes.begin(); it != changes.end(); ++it) {
        if (it.key() != "id") merged[it.key()] = it.value();
    }

    out.validation = report::validate_report(merged);
    if (!out.validation.pass) return out;

    // update() merges, so a cleared top-level optional is sent as null to
    // remove the stored value.
    json record = io::reportToJson(*out.validation.report);
    if (!record.contains("appendices")) record["appendices"] = nullptr;

    out.saved = reports.update(id, record);
    return out;
}

} // namespace store
