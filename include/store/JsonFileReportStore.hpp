#pragma once

#include "store/ReportStore.hpp"

#include <filesystem>

namespace store {

// Keeps every record in one JSON array file. A missing file is an empty
// collection; unreadable or malformed files throw std::runtime_error.
class JsonFileReportStore final : public ReportStore {
    std::filesystem::path path_;

public:
    explicit JsonFileReportStore(const std::filesystem::path& path);

    std::string create(const nlohmann::json& record) override;
    std::vector<nlohmann::json> list() override;
    std::optional<nlohmann::json> find(const std::string& id) override;
    bool update(const std::string& id, const nlohmann::json& partial) override;
    bool remove(const std::string& id) override;

    const std::filesystem::path& path() const { return path_; }

private:
    nlohmann::json load() const;
    void save(const nlohmann::json& records) const;
};

} // namespace store
