#include "commands/edit.hpp"

#include "commands/CliArgs.hpp"
#include "commands/validate.hpp"
#include "io/JsonIO.hpp"
#include "store/JsonFileReportStore.hpp"
#include "store/ReportEdit.hpp"

#include <iostream>
#include <string>

static int edit_usage() {
    std::cerr
        << "usage:\n"
        << "  ohs-report edit --id <id> --input <path> [--store <path>]\n";
    return 1;
}

int cmd_edit(int argc, char** argv) {
    const std::string id         = get_arg(argc, argv, "--id", "");
    const std::string input_path = get_arg(argc, argv, "--input", "");
    const std::string store_path = get_arg(argc, argv, "--store", kDefaultStorePath);

    if (id.empty() || input_path.empty()) {
        std::cerr << "error: missing --id or --input\n";
        return edit_usage();
    }

    try {
        const nlohmann::json changes = io::readJsonFile(input_path);
        if (!changes.is_object()) {
            std::cerr << "[error] edit input must be a JSON object: " << input_path << "\n";
            return 1;
        }

        store::JsonFileReportStore reports(store_path);
        const store::EditResult res = store::edit_report(reports, id, changes);

        if (!res.found) {
            std::cerr << "[error] report not found: " << id << "\n";
            return 1;
        }
        if (!res.validation.pass) {
            std::cerr << "validation failed: report " << id << " not updated\n";
            print_violations(res.validation);
            return 1;
        }
        if (!res.saved) {
            std::cerr << "[error] report not found: " << id << "\n";
            return 1;
        }

        std::cout << "Report updated\n";
        std::cout << "REPORT_ID: " << id << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
