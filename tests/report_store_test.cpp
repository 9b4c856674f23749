#include "store/JsonFileReportStore.hpp"
#include "store/ReportEdit.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using nlohmann::json;

static fs::path fresh_store_path(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / "ohs_report_store_test" / name;
    fs::remove_all(dir);
    return dir / "data" / "ohs_reports.json";
}

static void test_missing_file_is_empty() {
    store::JsonFileReportStore reports(fresh_store_path("empty"));
    assert(reports.list().empty());
    assert(!reports.find("123").has_value());
    assert(!reports.update("123", json::object()));
    assert(!reports.remove("123"));
    assert(!fs::exists(reports.path()));
}

static void test_create_assigns_unique_ids() {
    const fs::path path = fresh_store_path("create");
    store::JsonFileReportStore reports(path);

    json record = valid_report_json();
    record["id"] = "client-chosen";

    const std::string a = reports.create(record);
    const std::string b = reports.create(valid_report_json());
    assert(!a.empty() && !b.empty());
    assert(a != b);
    assert(a != "client-chosen");
    assert(a.find_first_not_of("0123456789") == std::string::npos);

    const auto all = reports.list();
    assert(all.size() == 2);
    assert(all[0]["id"] == a);
    assert(all[1]["id"] == b);

    // Records survive a new store instance on the same file.
    store::JsonFileReportStore reopened(path);
    const auto found = reopened.find(a);
    assert(found.has_value());
    assert((*found)["depotLocation"] == "Pinetown");
}

static void test_update_merges_top_level_fields() {
    store::JsonFileReportStore reports(fresh_store_path("update"));
    const std::string id = reports.create(valid_report_json());

    json partial;
    partial["depotLocation"] = "Durban";
    partial["signOff"] = {{"inspectorName", "B. Auditor"}};
    partial["appendices"] = "Annex B";
    partial["id"] = "hijack";
    assert(reports.update(id, partial));

    const auto rec = reports.find(id);
    assert(rec.has_value());
    assert((*rec)["id"] == id);
    assert((*rec)["depotLocation"] == "Durban");
    assert((*rec)["signOff"] == (json{{"inspectorName", "B. Auditor"}}));
    assert((*rec)["appendices"] == "Annex B");
    assert((*rec)["policyStatement"] == "Safety first, always.");
    assert(!reports.find("hijack").has_value());
}

static void test_remove() {
    store::JsonFileReportStore reports(fresh_store_path("remove"));
    const std::string a = reports.create(valid_report_json());
    const std::string b = reports.create(valid_report_json());

    assert(reports.remove(a));
    assert(!reports.remove(a));
    assert(!reports.find(a).has_value());

    const auto all = reports.list();
    assert(all.size() == 1);
    assert(all[0]["id"] == b);
}

static void test_null_in_update_removes_key() {
    store::JsonFileReportStore reports(fresh_store_path("update_null"));
    json record = valid_report_json();
    record["appendices"] = "Annex A";
    const std::string id = reports.create(record);

    assert(reports.update(id, json{{"appendices", nullptr}}));
    const auto rec = reports.find(id);
    assert(!rec->contains("appendices"));
    assert((*rec)["depotLocation"] == "Pinetown");
}

static void test_edit_rejects_invalid_merge_and_leaves_store_unchanged() {
    store::JsonFileReportStore reports(fresh_store_path("edit_invalid"));
    const std::string id = reports.create(valid_report_json());
    const auto before = reports.list();

    const store::EditResult res =
        store::edit_report(reports, id, json{{"policyStatement", "short"}, {"depotLocation", "Durban"}});
    assert(res.found);
    assert(!res.validation.pass);
    assert(!res.saved);
    assert(res.validation.violations.size() == 1);
    assert(res.validation.violations[0].path == "policyStatement");

    assert(reports.list() == before);
}

static void test_edit_applies_changes_and_keeps_id() {
    store::JsonFileReportStore reports(fresh_store_path("edit_id"));
    json record = valid_report_json();
    record["appendices"] = "Annex A";
    const std::string id = reports.create(record);

    const store::EditResult res =
        store::edit_report(reports, id, json{{"id", "other"}, {"depotLocation", "Durban"}});
    assert(res.found && res.validation.pass && res.saved);
    assert(res.validation.report->id == id);

    const auto rec = reports.find(id);
    assert(rec.has_value());
    assert((*rec)["id"] == id);
    assert((*rec)["depotLocation"] == "Durban");
    assert((*rec)["appendices"] == "Annex A");   // untouched keys survive
    assert(!reports.find("other").has_value());
    assert(reports.list().size() == 1);
}

static void test_edit_clears_appendices() {
    store::JsonFileReportStore reports(fresh_store_path("edit_clear"));
    json record = valid_report_json();
    record["appendices"] = "Annex A";
    const std::string id = reports.create(record);

    const store::EditResult res = store::edit_report(reports, id, json{{"appendices", nullptr}});
    assert(res.saved);
    assert(!res.validation.report->appendices.has_value());

    const auto rec = reports.find(id);
    assert(!rec->contains("appendices"));
    assert(report::validate_report(*rec).pass);
}

static void test_edit_unknown_id() {
    store::JsonFileReportStore reports(fresh_store_path("edit_unknown"));
    reports.create(valid_report_json());

    const store::EditResult res = store::edit_report(reports, "123", json{{"depotLocation", "Durban"}});
    assert(!res.found);
    assert(!res.saved);

    bool threw = false;
    try {
        store::edit_report(reports, "123", json::array());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_rejects_non_objects() {
    store::JsonFileReportStore reports(fresh_store_path("reject"));

    bool threw = false;
    try {
        reports.create(json::array());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(reports.list().empty());
}

static void test_malformed_file_throws() {
    const fs::path path = fresh_store_path("malformed");
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << "{\"not\": \"an array\"}";
    }

    store::JsonFileReportStore reports(path);
    bool threw = false;
    try {
        reports.list();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_missing_file_is_empty();
    test_create_assigns_unique_ids();
    test_update_merges_top_level_fields();
    test_remove();
    test_null_in_update_removes_key();
    test_edit_rejects_invalid_merge_and_leaves_store_unchanged();
    test_edit_applies_changes_and_keeps_id();
    test_edit_clears_appendices();
    test_edit_unknown_id();
    test_rejects_non_objects();
    test_malformed_file_throws();
    fs::remove_all(fs::temp_directory_path() / "ohs_report_store_test");
    return 0;
}
