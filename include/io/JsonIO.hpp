#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "layout/Page.hpp"
#include "report/Models.hpp"

namespace io {

struct RenderConfig {
    layout::PageGeometry geometry;
    bool compress = true;
};

// Throws std::runtime_error when the file cannot be opened or parsed.
nlohmann::json readJsonFile(const std::filesystem::path& path);
void writeJsonFile(const std::filesystem::path& path, const nlohmann::json& j);

// Wire form of a report, the shape the store persists. Absent optional fields
// are omitted; "id" is written only once assigned.
nlohmann::json reportToJson(const report::Report& r);

// {"pages":[{"runs":[{"x","y","font","size","text"}]}]}
nlohmann::json pagesToJson(const std::vector<layout::Page>& pages);

// Overrides defaults with any recognised keys; wrongly typed values are ignored.
RenderConfig renderConfigFromJson(const nlohmann::json& j);
RenderConfig loadRenderConfig(const std::filesystem::path& path);

}  // namespace io
