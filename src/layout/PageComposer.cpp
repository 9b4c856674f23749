#include "layout/PageComposer.hpp"

#include <utility>

namespace layout {

PageComposer::PageComposer(const TextMeasurer& measurer, const PageGeometry& geometry,
                           const FontSizes& fonts)
    : measurer_(measurer), geometry_(geometry), fonts_(fonts), cursor_y_(geometry.top_margin) {
    check_geometry(geometry_);
}

void PageComposer::start_new_page() {
    pages_.push_back(std::move(current_));
    current_ = Page{};
    cursor_y_ = geometry_.top_margin;
}

void PageComposer::break_if_needed() {
    if (cursor_y_ > geometry_.page_break_y) start_new_page();
}

void PageComposer::draw(double x, FontStyle style, double size, const std::string& text) {
    TextRun run;
    run.x = x;
    run.y = cursor_y_;
    run.style = style;
    run.size = size;
    run.text = text;
    current_.runs.push_back(std::move(run));
}

void PageComposer::add_title(const std::string& text) {
    break_if_needed();
    draw(geometry_.left_margin, FontStyle::Bold, fonts_.title, text);
    cursor_y_ += geometry_.line_height * 2.0;
}

void PageComposer::add_section_title(const std::string& text) {
    break_if_needed();
    draw(geometry_.left_margin, FontStyle::Bold, fonts_.section, text);
    cursor_y_ += geometry_.line_height * 1.5;
}

void PageComposer::add_sub_section_title(const std::string& text) {
    break_if_needed();
    draw(geometry_.left_margin, FontStyle::Bold, fonts_.sub_section, text);
    cursor_y_ += geometry_.line_height;
}

void PageComposer::add_field(const std::string& label, const std::optional<std::string>& value,
                             bool bold_label) {
    break_if_needed();
    if (!label.empty()) {
        draw(geometry_.left_margin, bold_label ? FontStyle::Bold : FontStyle::Normal, fonts_.field,
             label + ":");
    }

    const std::string text = (value && !value->empty()) ? *value : std::string(kNotAvailable);
    const auto lines = measurer_.split_to_width(text, geometry_.wrap_width(), FontStyle::Normal, fonts_.field);

    const double x = geometry_.left_margin + geometry_.value_indent;
    for (const auto& line : lines) {
        cursor_y_ += geometry_.line_height;
        break_if_needed();
        draw(x, FontStyle::Normal, fonts_.field, line);
    }
    cursor_y_ += geometry_.line_height;
}

void PageComposer::add_spacing(double lines) {
    cursor_y_ += geometry_.line_height * lines;
}

void PageComposer::add_closing_note(const std::string& text, double gap) {
    cursor_y_ += gap;
    break_if_needed();
    draw(geometry_.left_margin, FontStyle::Italic, fonts_.field, text);
}

std::vector<Page> PageComposer::finish() {
    if (!current_.runs.empty() || pages_.empty()) {
        pages_.push_back(std::move(current_));
        current_ = Page{};
    }
    cursor_y_ = geometry_.top_margin;

    std::vector<Page> out;
    out.swap(pages_);
    return out;
}

}  // namespace layout
