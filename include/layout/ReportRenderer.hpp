#pragma once

#include <vector>

#include "layout/Page.hpp"
#include "layout/TextMeasurer.hpp"
#include "report/Models.hpp"

namespace layout {

// Lays a validated report out as the printed OHS document: title, header
// fields, sections 1-12 in order and, when present, the appendices block.
std::vector<Page> render_report(const report::Report& r,
                                const TextMeasurer& measurer,
                                const PageGeometry& geometry = PageGeometry{});

}  // namespace layout
