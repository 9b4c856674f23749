#pragma once

#include <string>
#include <vector>

namespace layout {

enum class FontStyle { Normal, Bold, Italic };

const char* font_style_name(FontStyle style);   // "normal", "bold", "italic"

// One positioned draw instruction. y is the text baseline in points measured
// downward from the top edge of the page.
struct TextRun {
    double x = 0.0;
    double y = 0.0;
    FontStyle style = FontStyle::Normal;
    double size = 0.0;
    std::string text;
};

inline bool operator==(const TextRun& a, const TextRun& b) {
    return a.x == b.x && a.y == b.y && a.style == b.style && a.size == b.size && a.text == b.text;
}

struct Page {
    std::vector<TextRun> runs;
};

inline bool operator==(const Page& a, const Page& b) { return a.runs == b.runs; }

// A4 in points with the margins and spacing of the printed OHS report.
struct PageGeometry {
    double page_width = 595.28;
    double page_height = 841.89;
    double top_margin = 40.0;
    double left_margin = 40.0;
    double right_margin = 555.0;    // x of the right text edge
    double line_height = 16.0;
    double page_break_y = 780.0;    // a cursor strictly below this starts a new page
    double value_indent = 20.0;

    double wrap_width() const { return right_margin - left_margin - value_indent; }
};

// Throws std::invalid_argument when the geometry cannot hold a single line.
void check_geometry(const PageGeometry& g);

}  // namespace layout
