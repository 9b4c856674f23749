#include "layout/ReportRenderer.hpp"
#include "report/Validator.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <string>
#include <vector>

using layout::FontStyle;
using layout::Page;
using layout::TextRun;

static report::Report make_report(const nlohmann::json& j) {
    const report::ValidationResult res = report::validate_report(j);
    assert(res.pass);
    return *res.report;
}

static std::vector<TextRun> flatten(const std::vector<Page>& pages) {
    std::vector<TextRun> out;
    for (const auto& p : pages) out.insert(out.end(), p.runs.begin(), p.runs.end());
    return out;
}

static size_t index_of(const std::vector<TextRun>& runs, const std::string& text) {
    for (size_t i = 0; i < runs.size(); ++i) {
        if (runs[i].text == text) return i;
    }
    return runs.size();
}

static bool page_has(const Page& page, const std::string& text) {
    for (const auto& r : page.runs) {
        if (r.text == text) return true;
    }
    return false;
}

static void test_document_opening() {
    FixedWidthMeasurer m;
    const auto pages = layout::render_report(make_report(valid_report_json()), m);
    assert(!pages.empty());

    const TextRun& title = pages[0].runs.front();
    assert(title.text == "Annual Occupational Health and Safety Report");
    assert(title.style == FontStyle::Bold && title.size == 18.0);
    assert(title.x == 40.0 && title.y == 40.0);

    assert(page_has(pages[0], "1. EXECUTIVE SUMMARY"));

    const auto runs = flatten(pages);
    const size_t date = index_of(runs, "Date:");
    assert(date < runs.size());
    assert(runs[date + 1].text == "2024-01-01");

    const size_t depot = index_of(runs, "Depot Location:");
    assert(runs[depot + 1].text == "Pinetown");
}

static void test_absent_comparison_renders_placeholder() {
    FixedWidthMeasurer m;
    const auto runs = flatten(layout::render_report(make_report(valid_report_json()), m));

    const size_t i = index_of(runs, "3.2 Year-on-Year Comparison");
    assert(i < runs.size());
    assert(runs[i + 1].text == "N/A");
    assert(runs[i + 2].text == "3.3 Leading Indicators");
    assert(runs[i + 3].text == "Near-miss reports up 20%");
}

static void test_sections_in_order() {
    FixedWidthMeasurer m;
    const auto runs = flatten(layout::render_report(make_report(valid_report_json()), m));

    const std::vector<std::string> sections = {
        "1. EXECUTIVE SUMMARY",
        "2. HEALTH AND SAFETY POLICY STATEMENT",
        "3. HEALTH AND SAFETY PERFORMANCE INDICATORS",
        "4. SAFETY TRAINING AND EDUCATION",
        "5. HAZARD IDENTIFICATION AND RISK ASSESSMENT",
        "6. INCIDENT INVESTIGATIONS AND CORRECTIVE ACTIONS",
        "7. EMERGENCY PREPAREDNESS",
        "8. PPE AND EQUIPMENT MANAGEMENT",
        "9. EMPLOYEE HEALTH AND WELLNESS PROGRAMS",
        "10. CHALLENGES AND AREAS FOR IMPROVEMENT",
        "11. RECOMMENDATIONS",
        "12. SIGN-OFF AND COMPLIANCE STATEMENT",
    };

    size_t prev = 0;
    for (const auto& s : sections) {
        const size_t i = index_of(runs, s);
        assert(i < runs.size());
        assert(i > prev);
        assert(runs[i].style == FontStyle::Bold && runs[i].size == 14.0);
        prev = i;
    }

    assert(index_of(runs, "ADDITIONAL NOTES / APPENDICES") == runs.size());

    const TextRun& last = runs.back();
    assert(last.text == "End of Report");
    assert(last.style == FontStyle::Italic && last.size == 10.0);
}

static void test_signature_label_is_regular_weight() {
    FixedWidthMeasurer m;
    const auto runs = flatten(layout::render_report(make_report(valid_report_json()), m));

    const size_t name = index_of(runs, "Name of OHS Inspector/Auditor:");
    assert(runs[name].style == FontStyle::Bold);
    assert(runs[name + 1].text == "A. Inspector");

    const size_t sig = index_of(runs, "Inspector Signature:");
    assert(sig < runs.size());
    assert(runs[sig].style == FontStyle::Normal);
    assert(runs[sig + 1].text == "N/A");
}

static void test_appendices_block() {
    FixedWidthMeasurer m;

    nlohmann::json j = valid_report_json();
    j["appendices"] = "See checklist A.";
    auto runs = flatten(layout::render_report(make_report(j), m));

    const size_t block = index_of(runs, "ADDITIONAL NOTES / APPENDICES");
    assert(block < runs.size());
    assert(block > index_of(runs, "12. SIGN-OFF AND COMPLIANCE STATEMENT"));
    assert(runs[block + 1].text == "Appendices / References:");
    assert(runs[block + 2].text == "See checklist A.");
    assert(runs[block + 3].text == "End of Report");

    j["appendices"] = "";
    runs = flatten(layout::render_report(make_report(j), m));
    assert(index_of(runs, "ADDITIONAL NOTES / APPENDICES") == runs.size());
}

static void test_rendering_is_deterministic() {
    FixedWidthMeasurer m;
    const report::Report r = make_report(valid_report_json());
    assert(layout::render_report(r, m) == layout::render_report(r, m));
}

static void test_long_text_stays_inside_pages() {
    FixedWidthMeasurer m;
    const layout::PageGeometry g;

    nlohmann::json j = valid_report_json();
    std::string policy;
    for (int i = 0; i < 400; ++i) policy += "Every worker goes home safe. ";
    j["policyStatement"] = policy;

    const auto short_pages = layout::render_report(make_report(valid_report_json()), m);
    const auto pages = layout::render_report(make_report(j), m);
    assert(pages.size() > short_pages.size());

    for (const auto& p : pages) {
        assert(!p.runs.empty());
        for (const auto& r : p.runs) {
            assert(r.y >= g.top_margin);
            assert(r.y <= g.page_break_y);
            assert(r.x == g.left_margin || r.x == g.left_margin + g.value_indent);
            if (r.x == g.left_margin + g.value_indent) {
                assert(m.text_width(r.text, r.style, r.size) <= g.wrap_width());
            }
        }
    }
}

static void test_helvetica_rendering() {
    layout::HelveticaMeasurer m;
    const auto pages = layout::render_report(make_report(valid_report_json()), m);
    assert(pages.size() >= 2);
    assert(flatten(pages).back().text == "End of Report");
}

int main() {
    test_document_opening();
    test_absent_comparison_renders_placeholder();
    test_sections_in_order();
    test_signature_label_is_regular_weight();
    test_appendices_block();
    test_rendering_is_deterministic();
    test_long_text_stays_inside_pages();
    test_helvetica_rendering();
    return 0;
}
