#pragma once

#include <optional>
#include <string>
#include <vector>

#include "layout/Page.hpp"
#include "layout/TextMeasurer.hpp"

namespace layout {

// Placeholder drawn for an absent or empty field value.
inline constexpr const char* kNotAvailable = "N/A";

struct FontSizes {
    double title = 18.0;
    double section = 14.0;
    double sub_section = 12.0;
    double field = 10.0;
};

// Lays text out top to bottom on fixed-size pages. Every primitive checks the
// cursor against geometry.page_break_y before it draws and opens a new page at
// the top margin when the cursor has passed it. Fields check before each
// wrapped line, so a long value continues on the next page mid-field.
//
// One composer produces one document; finish() hands the pages over.
class PageComposer {
public:
    PageComposer(const TextMeasurer& measurer, const PageGeometry& geometry,
                 const FontSizes& fonts = FontSizes{});

    void add_title(const std::string& text);
    void add_section_title(const std::string& text);
    void add_sub_section_title(const std::string& text);

    // "<label>:" at the left margin (skipped when label is empty), then the
    // wrapped value one line below, indented. Absent or empty values render
    // as kNotAvailable.
    void add_field(const std::string& label, const std::optional<std::string>& value,
                   bool bold_label = true);

    void add_spacing(double lines);

    // Italic line placed gap points below the cursor.
    void add_closing_note(const std::string& text, double gap = 30.0);

    double cursor_y() const { return cursor_y_; }
    size_t page_count() const { return pages_.size() + 1; }

    std::vector<Page> finish();

private:
    void break_if_needed();
    void start_new_page();
    void draw(double x, FontStyle style, double size, const std::string& text);

    const TextMeasurer& measurer_;
    PageGeometry geometry_;
    FontSizes fonts_;

    double cursor_y_;
    Page current_;
    std::vector<Page> pages_;
};

}  // namespace layout
