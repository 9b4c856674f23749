#include "report/Validator.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace report {

static void add_violation(ValidationResult& res, const std::string& path, const std::string& msg) {
    res.pass = false;
    FieldViolation v;
    v.path = path;
    v.message = msg;
    res.violations.push_back(std::move(v));
}

// Length in UTF-16 code units: a 4-byte UTF-8 sequence is a surrogate pair.
static size_t utf16_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) == 0x80) continue;
        n += (c >> 3) == 0x1E ? 2 : 1;
    }
    return n;
}

// A position in the candidate record. A missing object is walked as if it were
// empty so every required leaf below it reports at its own path; an object of
// the wrong type is reported once and its leaves are skipped.
class FieldScope {
public:
    FieldScope(ValidationResult& res, const json* node, std::string path, bool skip = false)
        : res_(res), node_(node), path_(std::move(path)), skip_(skip) {}

    FieldScope object(const char* key) const {
        const std::string path = join(key);
        if (skip_) return FieldScope(res_, nullptr, path, true);

        const json* v = child(key);
        if (!v || v->is_null()) return FieldScope(res_, nullptr, path);
        if (!v->is_object()) {
            add_violation(res_, path, "Expected object.");
            return FieldScope(res_, nullptr, path, true);
        }
        return FieldScope(res_, v, path);
    }

    std::string text(const char* key, size_t min_len, const char* message) const {
        if (skip_) return {};
        const std::string path = join(key);

        const json* v = child(key);
        if (!v || v->is_null()) {
            add_violation(res_, path, "Required.");
            return {};
        }
        if (!v->is_string()) {
            add_violation(res_, path, "Expected string.");
            return {};
        }

        std::string s = v->get<std::string>();
        if (utf16_length(s) < min_len) add_violation(res_, path, message);
        return s;
    }

    std::optional<std::string> optional_text(const char* key) const {
        if (skip_) return std::nullopt;

        const json* v = child(key);
        if (!v || v->is_null()) return std::nullopt;
        if (!v->is_string()) {
            add_violation(res_, join(key), "Expected string.");
            return std::nullopt;
        }
        return v->get<std::string>();
    }

    Date date(const char* key) const {
        if (skip_) return {};
        const std::string path = join(key);

        const json* v = child(key);
        if (!v || v->is_null()) {
            add_violation(res_, path, "A date is required.");
            return {};
        }
        if (!v->is_string()) {
            add_violation(res_, path, "Expected date.");
            return {};
        }

        const auto d = parse_date(v->get<std::string>());
        if (!d) {
            add_violation(res_, path, "Invalid date.");
            return {};
        }
        return *d;
    }

private:
    const json* child(const char* key) const {
        if (!node_) return nullptr;
        auto it = node_->find(key);
        if (it == node_->end()) return nullptr;
        return &*it;
    }

    std::string join(const char* key) const {
        return path_.empty() ? std::string(key) : path_ + "." + key;
    }

    ValidationResult& res_;
    const json* node_;
    std::string path_;
    bool skip_;
};

static const char* const kRequired = "Required.";
static const char* const kAtLeast2 = "At least 2 characters.";
static const char* const kMustBeAtLeast2 = "Must be at least 2 characters.";

static ExecutiveSummary check_executive_summary(const FieldScope& s) {
    ExecutiveSummary out;
    out.purpose_of_report = s.text("purposeOfReport", 10, "Provide an overview (at least 10 characters).");

    const FieldScope kh = s.object("keyHighlights");
    out.key_highlights.injury_reduction           = kh.text("injuryReduction", 1, kRequired);
    out.key_highlights.safety_training            = kh.text("safetyTraining", 1, kRequired);
    out.key_highlights.emergency_drills           = kh.text("emergencyDrills", 1, kRequired);
    out.key_highlights.risk_assessment_completion = kh.text("riskAssessmentCompletion", 1, kRequired);
    return out;
}

static HealthAndSafetyPerformance check_performance(const FieldScope& s) {
    HealthAndSafetyPerformance out;

    const FieldScope is = s.object("incidentSummary");
    out.incident_summary.total_incidents = is.text("totalIncidents", 1, kRequired);
    out.incident_summary.minor_injuries  = is.text("minorInjuries", 1, kRequired);
    out.incident_summary.major_accidents = is.text("majorAccidents", 1, kRequired);
    out.incident_summary.ltifr           = is.text("ltifr", 1, kRequired);
    out.incident_summary.trir            = is.text("trir", 1, kRequired);

    out.year_on_year_comparison = s.optional_text("yearOnYearComparison");
    out.leading_indicators      = s.optional_text("leadingIndicators");
    return out;
}

static SafetyTraining check_safety_training(const FieldScope& s) {
    SafetyTraining out;

    const FieldScope ti = s.object("trainingInitiatives");
    out.training_initiatives.employees_trained    = ti.text("employeesTrained", 1, kRequired);
    out.training_initiatives.topics_covered       = ti.text("topicsCovered", 2, kAtLeast2);
    out.training_initiatives.specialized_training = ti.text("specializedTraining", 2, kAtLeast2);

    out.new_hire_orientation = s.text("newHireOrientation", 2, kAtLeast2);
    out.refresher_courses    = s.text("refresherCourses", 2, kAtLeast2);
    return out;
}

static HazardIdentification check_hazards(const FieldScope& s) {
    HazardIdentification out;

    const FieldScope ra = s.object("riskAssessments");
    out.risk_assessments.completion_rate = ra.text("completionRate", 1, kRequired);
    out.risk_assessments.methodology     = ra.text("methodology", 2, kAtLeast2);

    out.top_hazards      = s.text("topHazards", 2, kAtLeast2);
    out.control_measures = s.text("controlMeasures", 2, kAtLeast2);
    return out;
}

static IncidentInvestigations check_investigations(const FieldScope& s) {
    IncidentInvestigations out;
    out.total_investigated     = s.text("totalInvestigated", 1, kRequired);
    out.root_causes            = s.text("rootCauses", 2, kAtLeast2);
    out.corrective_actions     = s.text("correctiveActions", 2, kAtLeast2);
    out.follow_up_verification = s.text("followUpVerification", 2, kAtLeast2);
    return out;
}

static EmergencyPreparedness check_emergency(const FieldScope& s) {
    EmergencyPreparedness out;

    const FieldScope dr = s.object("drills");
    out.drills.drills_conducted        = dr.text("drillsConducted", 1, kRequired);
    out.drills.participation_rate      = dr.text("participationRate", 1, kRequired);
    out.drills.evacuation_success_rate = dr.text("evacuationSuccessRate", 1, kRequired);

    out.first_aid_capabilities   = s.text("firstAidCapabilities", 2, kMustBeAtLeast2);
    out.emergency_response_plans = s.text("emergencyResponsePlans", 2, kMustBeAtLeast2);
    return out;
}

static PpeAndEquipment check_ppe(const FieldScope& s) {
    PpeAndEquipment out;

    const FieldScope pc = s.object("ppeCompliance");
    out.ppe_compliance.compliance_rate = pc.text("complianceRate", 1, kRequired);
    out.ppe_compliance.ppe_types       = pc.text("ppeTypes", 2, kAtLeast2);

    out.equipment_inspections = s.text("equipmentInspections", 2, kAtLeast2);
    return out;
}

ValidationResult validate_report(const json& candidate) {
    ValidationResult res;

    if (!candidate.is_object()) {
        add_violation(res, "(root)", "Expected object.");
        return res;
    }

    const FieldScope root(res, &candidate, "");
    Report r;

    if (candidate.contains("id") && candidate["id"].is_string()) {
        r.id = candidate["id"].get<std::string>();
    }

    r.depot_location   = root.text("depotLocation", 2, "Depot location must be at least 2 characters.");
    r.reporting_period = root.text("reportingPeriod", 2, "Reporting period must be at least 2 characters.");
    r.prepared_by      = root.text("preparedBy", 2, "Prepared by must be at least 2 characters.");
    r.date             = root.date("date");

    r.executive_summary = check_executive_summary(root.object("executiveSummary"));
    r.policy_statement  = root.text("policyStatement", 10, "Policy statement must be at least 10 characters.");
    r.health_and_safety_performance = check_performance(root.object("healthAndSafetyPerformance"));
    r.safety_training         = check_safety_training(root.object("safetyTraining"));
    r.hazard_identification   = check_hazards(root.object("hazardIdentification"));
    r.incident_investigations = check_investigations(root.object("incidentInvestigations"));
    r.emergency_preparedness  = check_emergency(root.object("emergencyPreparedness"));
    r.ppe_and_equipment       = check_ppe(root.object("ppeAndEquipment"));

    const FieldScope eh = root.object("employeeHealth");
    r.employee_health.wellness_initiatives    = eh.text("wellnessInitiatives", 2, kAtLeast2);
    r.employee_health.campaigns_and_awareness = eh.text("campaignsAndAwareness", 2, kAtLeast2);

    const FieldScope ch = root.object("challenges");
    r.challenges.key_challenges        = ch.text("keyChallenges", 2, kAtLeast2);
    r.challenges.proposed_improvements = ch.text("proposedImprovements", 2, kAtLeast2);

    r.recommendations = root.text("recommendations", 2, kAtLeast2);

    const FieldScope so = root.object("signOff");
    r.sign_off.inspector_name      = so.text("inspectorName", 2, "Inspector name must be at least 2 characters.");
    r.sign_off.inspector_signature = so.optional_text("inspectorSignature");

    r.appendices = root.optional_text("appendices");

    if (res.pass) res.report = std::move(r);
    return res;
}

void write_validation_report(const fs::path& path, const ValidationResult& res) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    json j;
    j["pass"] = res.pass;
    j["violations"] = json::array();

    for (const auto& v : res.violations) {
        json vj;
        vj["path"] = v.path;
        vj["message"] = v.message;
        j["violations"].push_back(vj);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace report
