#include "layout/TextMeasurer.hpp"

#include <cstdint>

namespace layout {

// Advance widths in 1/1000 em for codes 32..126 (WinAnsiEncoding).
static const int kHelveticaWidths[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,   //  !"#$%&'()*+,-./
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,   // 0-9 :;<=>?
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,  // @A-O
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,   // P-Z [\]^_
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,   // `a-o
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584,        // p-z {|}~
};

static const int kHelveticaBoldWidths[95] = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,
    975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,
    333, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,
    611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584,
};

static const int kFallbackWidth = 556;

static uint32_t next_codepoint(const std::string& s, size_t& i) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    uint32_t cp = lead;
    if ((lead >> 5) == 0x6) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead >> 4) == 0xE) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead >> 3) == 0x1E) {
        len = 4;
        cp = lead & 0x07;
    }
    if (len > 1) {
        if (i + len > s.size()) {
            i = s.size();
            return 0xFFFD;
        }
        for (size_t k = 1; k < len; ++k) cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
    }
    i += len;
    return cp;
}

double HelveticaMeasurer::text_width(const std::string& text, FontStyle style, double size) const {
    // Helvetica-Oblique shares the regular widths.
    const int* table = style == FontStyle::Bold ? kHelveticaBoldWidths : kHelveticaWidths;

    long units = 0;
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = next_codepoint(text, i);
        if (cp == '\t') cp = ' ';
        if (cp == '\n' || cp == '\r') continue;
        units += (cp >= 32 && cp <= 126) ? table[cp - 32] : kFallbackWidth;
    }
    return static_cast<double>(units) * size / 1000.0;
}

} // namespace layout
