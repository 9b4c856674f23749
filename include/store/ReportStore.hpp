#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace store {

// Persisted records are JSON objects: the report fields plus a string "id".
class ReportStore {
public:
    virtual ~ReportStore() = default;

    // Stores a copy of record under a fresh id and returns that id. Any "id"
    // already in record is replaced.
    virtual std::string create(const nlohmann::json& record) = 0;

    virtual std::vector<nlohmann::json> list() = 0;
    virtual std::optional<nlohmann::json> find(const std::string& id) = 0;

    // Shallow-merges partial into the stored record: a null value removes the
    // key, "id" is never changed. Returns false when no record has this id.
    virtual bool update(const std::string& id, const nlohmann::json& partial) = 0;

    // Returns false when no record has this id.
    virtual bool remove(const std::string& id) = 0;
};

} // namespace store
