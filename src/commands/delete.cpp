#include "commands/delete.hpp"

#include "commands/CliArgs.hpp"
#include "store/JsonFileReportStore.hpp"

#include <iostream>
#include <string>

int cmd_delete(int argc, char** argv) {
    const std::string id         = get_arg(argc, argv, "--id", "");
    const std::string store_path = get_arg(argc, argv, "--store", kDefaultStorePath);

    if (id.empty()) {
        std::cerr << "error: missing --id\n"
                  << "usage:\n"
                  << "  ohs-report delete --id <id> [--store <path>]\n";
        return 1;
    }

    bool removed = false;
    try {
        store::JsonFileReportStore reports(store_path);
        removed = reports.remove(id);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    if (!removed) {
        std::cerr << "[error] failed to delete report: no report with id " << id << "\n";
        return 1;
    }

    std::cout << "DELETED: " << id << "\n";
    return 0;
}
