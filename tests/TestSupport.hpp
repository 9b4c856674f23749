#pragma once

#include "layout/TextMeasurer.hpp"

#include <nlohmann/json.hpp>

#include <string>

// Every character advances char_width points regardless of font and size, so
// wrap points are easy to predict.
class FixedWidthMeasurer final : public layout::TextMeasurer {
public:
    explicit FixedWidthMeasurer(double char_width = 5.0) : char_width_(char_width) {}

    double text_width(const std::string& text, layout::FontStyle, double) const override {
        return static_cast<double>(text.size()) * char_width_;
    }

private:
    double char_width_;
};

// Passes every rule; healthAndSafetyPerformance.yearOnYearComparison is absent.
inline nlohmann::json valid_report_json() {
    return nlohmann::json::parse(R"({
      "depotLocation": "Pinetown",
      "reportingPeriod": "2024",
      "preparedBy": "J. Smith",
      "date": "2024-01-01",
      "executiveSummary": {
        "purposeOfReport": "Annual review of depot safety.",
        "keyHighlights": {
          "injuryReduction": "12%",
          "safetyTraining": "40 staff",
          "emergencyDrills": "4",
          "riskAssessmentCompletion": "100%"
        }
      },
      "policyStatement": "Safety first, always.",
      "healthAndSafetyPerformance": {
        "incidentSummary": {
          "totalIncidents": "7",
          "minorInjuries": "6",
          "majorAccidents": "1",
          "ltifr": "1.2",
          "trir": "3.5"
        },
        "leadingIndicators": "Near-miss reports up 20%"
      },
      "safetyTraining": {
        "trainingInitiatives": {
          "employeesTrained": "40",
          "topicsCovered": "Fire safety",
          "specializedTraining": "Forklift"
        },
        "newHireOrientation": "All hires inducted",
        "refresherCourses": "Quarterly"
      },
      "hazardIdentification": {
        "riskAssessments": {
          "completionRate": "95%",
          "methodology": "HIRA"
        },
        "topHazards": "Slips",
        "controlMeasures": "Mats"
      },
      "incidentInvestigations": {
        "totalInvestigated": "7",
        "rootCauses": "Wet floors",
        "correctiveActions": "Signage",
        "followUpVerification": "Audited"
      },
      "emergencyPreparedness": {
        "drills": {
          "drillsConducted": "4",
          "participationRate": "98%",
          "evacuationSuccessRate": "100%"
        },
        "firstAidCapabilities": "Two kits",
        "emergencyResponsePlans": "Updated"
      },
      "ppeAndEquipment": {
        "ppeCompliance": {
          "complianceRate": "97%",
          "ppeTypes": "Boots, vests"
        },
        "equipmentInspections": "Monthly"
      },
      "employeeHealth": {
        "wellnessInitiatives": "Gym",
        "campaignsAndAwareness": "Heat"
      },
      "challenges": {
        "keyChallenges": "Turnover",
        "proposedImprovements": "Mentoring"
      },
      "recommendations": "Hire a coordinator",
      "signOff": {
        "inspectorName": "A. Inspector"
      }
    })");
}
