#include "io/JsonIO.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace io {

static void set_optional(json& j, const char* key, const std::optional<std::string>& v) {
    if (v) j[key] = *v;
}

static double get_double_or(const json& j, const char* key, double def) {
    if (!j.contains(key)) return def;
    if (!j[key].is_number()) return def;
    return j[key].get<double>();
}

json readJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON " + path.string() + ": " + e.what());
    }
    return j;
}

void writeJsonFile(const std::filesystem::path& path, const json& j) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

json reportToJson(const report::Report& r) {
    json j;
    if (!r.id.empty()) j["id"] = r.id;

    j["depotLocation"] = r.depot_location;
    j["reportingPeriod"] = r.reporting_period;
    j["preparedBy"] = r.prepared_by;
    j["date"] = report::format_date(r.date);

    const auto& es = r.executive_summary;
    j["executiveSummary"] = {
        {"purposeOfReport", es.purpose_of_report},
        {"keyHighlights", {
            {"injuryReduction", es.key_highlights.injury_reduction},
            {"safetyTraining", es.key_highlights.safety_training},
            {"emergencyDrills", es.key_highlights.emergency_drills},
            {"riskAssessmentCompletion", es.key_highlights.risk_assessment_completion},
        }},
    };

    j["policyStatement"] = r.policy_statement;

    const auto& hp = r.health_and_safety_performance;
    json perf;
    perf["incidentSummary"] = {
        {"totalIncidents", hp.incident_summary.total_incidents},
        {"minorInjuries", hp.incident_summary.minor_injuries},
        {"majorAccidents", hp.incident_summary.major_accidents},
        {"ltifr", hp.incident_summary.ltifr},
        {"trir", hp.incident_summary.trir},
    };
    set_optional(perf, "yearOnYearComparison", hp.year_on_year_comparison);
    set_optional(perf, "leadingIndicators", hp.leading_indicators);
    j["healthAndSafetyPerformance"] = perf;

    const auto& st = r.safety_training;
    j["safetyTraining"] = {
        {"trainingInitiatives", {
            {"employeesTrained", st.training_initiatives.employees_trained},
            {"topicsCovered", st.training_initiatives.topics_covered},
            {"specializedTraining", st.training_initiatives.specialized_training},
        }},
        {"newHireOrientation", st.new_hire_orientation},
        {"refresherCourses", st.refresher_courses},
    };

    const auto& hz = r.hazard_identification;
    j["hazardIdentification"] = {
        {"riskAssessments", {
            {"completionRate", hz.risk_assessments.completion_rate},
            {"methodology", hz.risk_assessments.methodology},
        }},
        {"topHazards", hz.top_hazards},
        {"controlMeasures", hz.control_measures},
    };

    const auto& ii = r.incident_investigations;
    j["incidentInvestigations"] = {
        {"totalInvestigated", ii.total_investigated},
        {"rootCauses", ii.root_causes},
        {"correctiveActions", ii.corrective_actions},
        {"followUpVerification", ii.follow_up_verification},
    };

    const auto& ep = r.emergency_preparedness;
    j["emergencyPreparedness"] = {
        {"drills", {
            {"drillsConducted", ep.drills.drills_conducted},
            {"participationRate", ep.drills.participation_rate},
            {"evacuationSuccessRate", ep.drills.evacuation_success_rate},
        }},
        {"firstAidCapabilities", ep.first_aid_capabilities},
        {"emergencyResponsePlans", ep.emergency_response_plans},
    };

    const auto& pe = r.ppe_and_equipment;
    j["ppeAndEquipment"] = {
        {"ppeCompliance", {
            {"complianceRate", pe.ppe_compliance.compliance_rate},
            {"ppeTypes", pe.ppe_compliance.ppe_types},
        }},
        {"equipmentInspections", pe.equipment_inspections},
    };

    j["employeeHealth"] = {
        {"wellnessInitiatives", r.employee_health.wellness_initiatives},
        {"campaignsAndAwareness", r.employee_health.campaigns_and_awareness},
    };

    j["challenges"] = {
        {"keyChallenges", r.challenges.key_challenges},
        {"proposedImprovements", r.challenges.proposed_improvements},
    };

    j["recommendations"] = r.recommendations;

    json sign_off;
    sign_off["inspectorName"] = r.sign_off.inspector_name;
    set_optional(sign_off, "inspectorSignature", r.sign_off.inspector_signature);
    j["signOff"] = sign_off;

    set_optional(j, "appendices", r.appendices);
    return j;
}

json pagesToJson(const std::vector<layout::Page>& pages) {
    json arr = json::array();
    for (const auto& page : pages) {
        json runs = json::array();
        for (const auto& run : page.runs) {
            runs.push_back({
                {"x", run.x},
                {"y", run.y},
                {"font", layout::font_style_name(run.style)},
                {"size", run.size},
                {"text", run.text},
            });
        }
        arr.push_back({{"runs", runs}});
    }

    json j;
    j["pages"] = arr;
    return j;
}

RenderConfig renderConfigFromJson(const json& j) {
    RenderConfig cfg;
    if (!j.is_object()) return cfg;

    layout::PageGeometry& g = cfg.geometry;
    g.page_width   = get_double_or(j, "page_width", g.page_width);
    g.page_height  = get_double_or(j, "page_height", g.page_height);
    g.top_margin   = get_double_or(j, "top_margin", g.top_margin);
    g.left_margin  = get_double_or(j, "left_margin", g.left_margin);
    g.right_margin = get_double_or(j, "right_margin", g.right_margin);
    g.line_height  = get_double_or(j, "line_height", g.line_height);
    g.page_break_y = get_double_or(j, "page_break_y", g.page_break_y);
    g.value_indent = get_double_or(j, "value_indent", g.value_indent);

    if (j.contains("compress") && j["compress"].is_boolean()) {
        cfg.compress = j["compress"].get<bool>();
    }
    return cfg;
}

RenderConfig loadRenderConfig(const std::filesystem::path& path) {
    return renderConfigFromJson(readJsonFile(path));
}

}  // namespace io
