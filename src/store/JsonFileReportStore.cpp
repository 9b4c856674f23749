#include "store/JsonFileReportStore.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace store {

JsonFileReportStore::JsonFileReportStore(const fs::path& path) : path_(path) {}

json JsonFileReportStore::load() const {
    if (!fs::exists(path_)) return json::array();

    std::ifstream in(path_);
    if (!in) throw std::runtime_error("failed to open report store: " + path_.string());

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse report store " + path_.string() + ": " + e.what());
    }

    if (!j.is_array()) throw std::runtime_error("report store must hold a JSON array: " + path_.string());
    return j;
}

void JsonFileReportStore::save(const json& records) const {
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to write report store: " + path_.string());
    out << records.dump(2) << "\n";
    if (!out) throw std::runtime_error("failed to write report store: " + path_.string());
}

static std::string record_id(const json& record) {
    if (!record.is_object()) return {};
    auto it = record.find("id");
    if (it == record.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string JsonFileReportStore::create(const json& record) {
    if (!record.is_object()) throw std::invalid_argument("report record must be a JSON object");

    json records = load();

    std::unordered_set<std::string> taken;
    for (const auto& r : records) taken.insert(record_id(r));

    // Epoch milliseconds, bumped past any id already in use.
    long long stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
    std::string id = std::to_string(stamp);
    while (taken.count(id)) id = std::to_string(++stamp);

    json stored = record;
    stored["id"] = id;
    records.push_back(stored);
    save(records);
    return id;
}

std::vector<json> JsonFileReportStore::list() {
    const json records = load();
    return std::vector<json>(records.begin(), records.end());
}

std::optional<json> JsonFileReportStore::find(const std::string& id) {
    for (const auto& r : load()) {
        if (record_id(r) == id) return r;
    }
    return std::nullopt;
}

bool JsonFileReportStore::update(const std::string& id, const json& partial) {
    if (!partial.is_object()) throw std::invalid_argument("report update must be a JSON object");

    json records = load();
    for (auto& r : records) {
        if (record_id(r) != id) continue;

        for (auto it = partial.begin(); it != partial.end(); ++it) {
            if (it.key() == "id") continue;
            if (it.value().is_null()) {
                r.erase(it.key());
            } else {
                r[it.key()] = it.value();
            }
        }
        save(records);
        return true;
    }
    return false;
}

bool JsonFileReportStore::remove(const std::string& id) {
    json records = load();

    json kept = json::array();
    bool found = false;
    for (const auto& r : records) {
        if (record_id(r) == id) {
            found = true;
            continue;
        }
        kept.push_back(r);
    }

    if (!found) return false;
    save(kept);
    return true;
}

} // namespace store
