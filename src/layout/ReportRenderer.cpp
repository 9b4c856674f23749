#include "layout/ReportRenderer.hpp"

#include "layout/PageComposer.hpp"

namespace layout {

static void render_header(PageComposer& pc, const report::Report& r) {
    pc.add_title("Annual Occupational Health and Safety Report");

    pc.add_field("Depot Location", r.depot_location);
    pc.add_field("Reporting Period", r.reporting_period);
    pc.add_field("Prepared By", r.prepared_by);
    pc.add_field("Date", report::format_date(r.date));
    pc.add_spacing(1.0);
}

static void render_executive_summary(PageComposer& pc, const report::ExecutiveSummary& s) {
    pc.add_section_title("1. EXECUTIVE SUMMARY");
    pc.add_sub_section_title("1.1 Purpose of the Report");
    pc.add_field("", s.purpose_of_report);

    pc.add_sub_section_title("1.2 Key Highlights");
    pc.add_field("Reduction in Workplace Injuries", s.key_highlights.injury_reduction);
    pc.add_field("Safety Training", s.key_highlights.safety_training);
    pc.add_field("Emergency Drills", s.key_highlights.emergency_drills);
    pc.add_field("Risk Assessment Completion", s.key_highlights.risk_assessment_completion);
}

static void render_performance(PageComposer& pc, const report::HealthAndSafetyPerformance& p) {
    pc.add_section_title("3. HEALTH AND SAFETY PERFORMANCE INDICATORS");
    pc.add_sub_section_title("3.1 Incident Summary");
    pc.add_field("Total Number of Incidents", p.incident_summary.total_incidents);
    pc.add_field("Minor Injuries", p.incident_summary.minor_injuries);
    pc.add_field("Major Accidents/Fatalities", p.incident_summary.major_accidents);
    pc.add_field("Lost Time Injury Frequency Rate (LTIFR)", p.incident_summary.ltifr);
    pc.add_field("Total Recordable Incident Rate (TRIR)", p.incident_summary.trir);

    pc.add_sub_section_title("3.2 Year-on-Year Comparison");
    pc.add_field("", p.year_on_year_comparison);
    pc.add_sub_section_title("3.3 Leading Indicators");
    pc.add_field("", p.leading_indicators);
}

static void render_safety_training(PageComposer& pc, const report::SafetyTraining& t) {
    pc.add_section_title("4. SAFETY TRAINING AND EDUCATION");
    pc.add_sub_section_title("4.1 Training Initiatives");
    pc.add_field("Number of Employees Trained", t.training_initiatives.employees_trained);
    pc.add_field("Topics Covered", t.training_initiatives.topics_covered);
    pc.add_field("Specialized Training", t.training_initiatives.specialized_training);

    pc.add_sub_section_title("4.2 New Hire Orientation");
    pc.add_field("", t.new_hire_orientation);
    pc.add_sub_section_title("4.3 Refresher Courses");
    pc.add_field("", t.refresher_courses);
}

static void render_hazards(PageComposer& pc, const report::HazardIdentification& h) {
    pc.add_section_title("5. HAZARD IDENTIFICATION AND RISK ASSESSMENT");
    pc.add_sub_section_title("5.1 Risk Assessments");
    pc.add_field("Completion Rate", h.risk_assessments.completion_rate);
    pc.add_field("Methodology Used", h.risk_assessments.methodology);

    pc.add_sub_section_title("5.2 Top Hazards Identified");
    pc.add_field("", h.top_hazards);
    pc.add_sub_section_title("5.3 Control Measures Implemented");
    pc.add_field("", h.control_measures);
}

static void render_investigations(PageComposer& pc, const report::IncidentInvestigations& i) {
    pc.add_section_title("6. INCIDENT INVESTIGATIONS AND CORRECTIVE ACTIONS");
    pc.add_field("Total Incidents Investigated", i.total_investigated);
    pc.add_field("Root Causes Identified", i.root_causes);
    pc.add_field("Corrective Actions Taken", i.corrective_actions);
    pc.add_field("Follow-Up and Verification", i.follow_up_verification);
}

static void render_emergency(PageComposer& pc, const report::EmergencyPreparedness& e) {
    pc.add_section_title("7. EMERGENCY PREPAREDNESS");
    pc.add_sub_section_title("7.1 Emergency Drills");
    pc.add_field("Drills Conducted", e.drills.drills_conducted);
    pc.add_field("Participation Rate", e.drills.participation_rate);
    pc.add_field("Evacuation Success Rate", e.drills.evacuation_success_rate);

    pc.add_sub_section_title("7.2 First Aid and Response Capabilities");
    pc.add_field("", e.first_aid_capabilities);
    pc.add_sub_section_title("7.3 Emergency Response Plans");
    pc.add_field("", e.emergency_response_plans);
}

static void render_ppe(PageComposer& pc, const report::PpeAndEquipment& p) {
    pc.add_section_title("8. PPE AND EQUIPMENT MANAGEMENT");
    pc.add_sub_section_title("8.1 PPE Compliance");
    pc.add_field("Compliance Rate", p.ppe_compliance.compliance_rate);
    pc.add_field("Types of PPE Issued", p.ppe_compliance.ppe_types);

    pc.add_sub_section_title("8.2 Equipment Inspections");
    pc.add_field("", p.equipment_inspections);
}

std::vector<Page> render_report(const report::Report& r,
                                const TextMeasurer& measurer,
                                const PageGeometry& geometry) {
    PageComposer pc(measurer, geometry);

    render_header(pc, r);

    render_executive_summary(pc, r.executive_summary);

    pc.add_section_title("2. HEALTH AND SAFETY POLICY STATEMENT");
    pc.add_field("", r.policy_statement);

    render_performance(pc, r.health_and_safety_performance);
    render_safety_training(pc, r.safety_training);
    render_hazards(pc, r.hazard_identification);
    render_investigations(pc, r.incident_investigations);
    render_emergency(pc, r.emergency_preparedness);
    render_ppe(pc, r.ppe_and_equipment);

    pc.add_section_title("9. EMPLOYEE HEALTH AND WELLNESS PROGRAMS");
    pc.add_sub_section_title("9.1 Wellness Initiatives");
    pc.add_field("", r.employee_health.wellness_initiatives);
    pc.add_sub_section_title("9.2 Campaigns and Awareness");
    pc.add_field("", r.employee_health.campaigns_and_awareness);

    pc.add_section_title("10. CHALLENGES AND AREAS FOR IMPROVEMENT");
    pc.add_sub_section_title("10.1 Key Challenges");
    pc.add_field("", r.challenges.key_challenges);
    pc.add_sub_section_title("10.2 Proposed Improvements");
    pc.add_field("", r.challenges.proposed_improvements);

    pc.add_section_title("11. RECOMMENDATIONS");
    pc.add_field("", r.recommendations);

    pc.add_section_title("12. SIGN-OFF AND COMPLIANCE STATEMENT");
    pc.add_field("Name of OHS Inspector/Auditor", r.sign_off.inspector_name);
    pc.add_field("Inspector Signature", r.sign_off.inspector_signature, false);

    if (r.appendices && !r.appendices->empty()) {
        pc.add_section_title("ADDITIONAL NOTES / APPENDICES");
        pc.add_field("Appendices / References", r.appendices);
    }

    pc.add_closing_note("End of Report");
    return pc.finish();
}

}  // namespace layout
