#include "commands/submit.hpp"

#include "commands/CliArgs.hpp"
#include "commands/validate.hpp"
#include "io/JsonIO.hpp"
#include "report/Validator.hpp"
#include "store/JsonFileReportStore.hpp"

#include <iostream>
#include <string>

static int submit_usage() {
    std::cerr
        << "usage:\n"
        << "  ohs-report submit --input <path> [--store <path>]\n";
    return 1;
}

int cmd_submit(int argc, char** argv) {
    const std::string input_path = get_arg(argc, argv, "--input", "");
    const std::string store_path = get_arg(argc, argv, "--store", kDefaultStorePath);

    if (input_path.empty()) {
        std::cerr << "error: missing --input\n";
        return submit_usage();
    }

    try {
        const report::ValidationResult res = report::validate_report(io::readJsonFile(input_path));
        if (!res.pass) {
            std::cerr << "validation failed: report not submitted\n";
            print_violations(res);
            return 1;
        }

        store::JsonFileReportStore reports(store_path);
        const std::string id = reports.create(io::reportToJson(*res.report));

        std::cout << "Report submitted (ID: " << id << ")\n";
        std::cout << "REPORT_ID: " << id << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
