#pragma once
#include <optional>
#include <string>

#include "report/Date.hpp"

namespace report {

// 1.2
struct KeyHighlights {
    std::string injury_reduction;
    std::string safety_training;
    std::string emergency_drills;
    std::string risk_assessment_completion;
};

// 1
struct ExecutiveSummary {
    std::string purpose_of_report;
    KeyHighlights key_highlights;
};

// 3.1
struct IncidentSummary {
    std::string total_incidents;
    std::string minor_injuries;
    std::string major_accidents;
    std::string ltifr;                  // lost-time injuries per 1,000,000 hours worked
    std::string trir;                   // recordable incidents per 100 full-time employees
};

// 3
struct HealthAndSafetyPerformance {
    IncidentSummary incident_summary;
    std::optional<std::string> year_on_year_comparison;
    std::optional<std::string> leading_indicators;
};

// 4.1
struct TrainingInitiatives {
    std::string employees_trained;
    std::string topics_covered;
    std::string specialized_training;
};

// 4
struct SafetyTraining {
    TrainingInitiatives training_initiatives;
    std::string new_hire_orientation;
    std::string refresher_courses;
};

// 5.1
struct RiskAssessments {
    std::string completion_rate;
    std::string methodology;
};

// 5
struct HazardIdentification {
    RiskAssessments risk_assessments;
    std::string top_hazards;
    std::string control_measures;
};

// 6
struct IncidentInvestigations {
    std::string total_investigated;
    std::string root_causes;
    std::string corrective_actions;
    std::string follow_up_verification;
};

// 7.1
struct EmergencyDrills {
    std::string drills_conducted;
    std::string participation_rate;
    std::string evacuation_success_rate;
};

// 7
struct EmergencyPreparedness {
    EmergencyDrills drills;
    std::string first_aid_capabilities;
    std::string emergency_response_plans;
};

// 8.1
struct PpeCompliance {
    std::string compliance_rate;
    std::string ppe_types;
};

// 8
struct PpeAndEquipment {
    PpeCompliance ppe_compliance;
    std::string equipment_inspections;
};

// 9
struct EmployeeHealth {
    std::string wellness_initiatives;
    std::string campaigns_and_awareness;
};

// 10
struct Challenges {
    std::string key_challenges;
    std::string proposed_improvements;
};

// 12
struct SignOff {
    std::string inspector_name;
    std::optional<std::string> inspector_signature;
};

// One annual OHS submission. Sections are declared in document order.
struct Report {
    std::string id;                     // assigned by the store, empty until persisted

    std::string depot_location;
    std::string reporting_period;
    std::string prepared_by;
    Date date;

    ExecutiveSummary executive_summary;
    std::string policy_statement;
    HealthAndSafetyPerformance health_and_safety_performance;
    SafetyTraining safety_training;
    HazardIdentification hazard_identification;
    IncidentInvestigations incident_investigations;
    EmergencyPreparedness emergency_preparedness;
    PpeAndEquipment ppe_and_equipment;
    EmployeeHealth employee_health;
    Challenges challenges;
    std::string recommendations;
    SignOff sign_off;

    std::optional<std::string> appendices;
};

}  // namespace report
