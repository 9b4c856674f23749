#include "commands/list.hpp"

#include "commands/CliArgs.hpp"
#include "store/JsonFileReportStore.hpp"

#include <iostream>
#include <string>

static std::string string_or(const nlohmann::json& j, const char* key, const std::string& def) {
    if (!j.contains(key) || !j[key].is_string()) return def;
    return j[key].get<std::string>();
}

int cmd_list(int argc, char** argv) {
    const std::string store_path = get_arg(argc, argv, "--store", kDefaultStorePath);

    std::vector<nlohmann::json> records;
    try {
        store::JsonFileReportStore reports(store_path);
        records = reports.list();
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to fetch reports: " << e.what() << "\n";
        return 1;
    }

    if (records.empty()) {
        std::cout << "No reports submitted yet.\n";
        return 0;
    }

    std::cout << "ID\tDepot Location\tReporting Period\tPrepared By\tDate\n";
    for (const auto& r : records) {
        std::string date = string_or(r, "date", "");
        if (date.size() > 10) date = date.substr(0, 10);

        std::cout << string_or(r, "id", "?") << "\t"
                  << string_or(r, "depotLocation", "") << "\t"
                  << string_or(r, "reportingPeriod", "") << "\t"
                  << string_or(r, "preparedBy", "") << "\t"
                  << date << "\n";
    }
    std::cout << "REPORTS: " << records.size() << "\n";
    return 0;
}
