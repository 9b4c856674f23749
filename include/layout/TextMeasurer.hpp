#pragma once
#include <string>
#include <vector>

#include "layout/Page.hpp"

namespace layout {

class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    // Advance width of text in points.
    virtual double text_width(const std::string& text, FontStyle style, double size) const = 0;

    // Wraps text into lines no wider than max_width. Explicit newlines always
    // break; lines break at single spaces and keep any other spacing as
    // written; a word wider than max_width is split between characters.
    // Never returns an empty vector.
    virtual std::vector<std::string> split_to_width(const std::string& text,
                                                    double max_width,
                                                    FontStyle style,
                                                    double size) const;
};

// Adobe core-14 Helvetica metrics, the fonts the PDF encoder references.
class HelveticaMeasurer final : public TextMeasurer {
public:
    double text_width(const std::string& text, FontStyle style, double size) const override;
};

} // namespace layout
