#include "commands/validate.hpp"

#include "commands/CliArgs.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  ohs-report validate --input <path> [--out <path>]\n";
    return 1;
}

void print_violations(const report::ValidationResult& res) {
    for (const auto& v : res.violations) {
        std::cerr << "- " << v.path << ": " << v.message << "\n";
    }
}

int cmd_validate(int argc, char** argv) {
    const std::string input_path = get_arg(argc, argv, "--input", "");
    const std::string out_path   = get_arg(argc, argv, "--out", "");

    if (input_path.empty()) {
        std::cerr << "error: missing --input\n";
        return validate_usage();
    }

    nlohmann::json candidate;
    try {
        candidate = io::readJsonFile(input_path);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    const report::ValidationResult res = report::validate_report(candidate);

    if (!out_path.empty()) {
        try {
            report::write_validation_report(fs::path(out_path), res);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
        std::cout << "OUT_VALIDATE: " << out_path << "\n";
    }

    if (!res.pass) {
        std::cerr << "validation failed: " << res.violations.size() << " violation(s)\n";
        print_violations(res);
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    return 0;
}
