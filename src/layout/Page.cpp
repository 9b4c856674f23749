#include "layout/Page.hpp"

#include <stdexcept>

namespace layout {

const char* font_style_name(FontStyle style) {
    switch (style) {
        case FontStyle::Normal: return "normal";
        case FontStyle::Bold:   return "bold";
        case FontStyle::Italic: return "italic";
    }
    return "normal";
}

void check_geometry(const PageGeometry& g) {
    if (g.page_width <= 0.0 || g.page_height <= 0.0) {
        throw std::invalid_argument("page size must be positive");
    }
    if (g.line_height <= 0.0) {
        throw std::invalid_argument("line_height must be positive");
    }
    if (g.page_break_y <= g.top_margin || g.page_break_y >= g.page_height) {
        throw std::invalid_argument("page_break_y must lie between top_margin and page_height");
    }
    if (g.wrap_width() <= 0.0) {
        throw std::invalid_argument("right_margin leaves no room for wrapped text");
    }
}

}  // namespace layout
