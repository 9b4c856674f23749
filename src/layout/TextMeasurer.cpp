#include "layout/TextMeasurer.hpp"

namespace layout {

// Byte length of the UTF-8 sequence starting with lead.
static size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

static std::vector<std::string> split_paragraphs(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : text) {
        if (c == '\r') continue;
        if (c == '\n') {
            out.push_back(cur);
            cur.clear();
            continue;
        }
        cur += c;
    }
    out.push_back(cur);
    return out;
}

// Splits on single spaces and keeps empty tokens, so joining the words of a
// line with ' ' reproduces its original spacing.
static std::vector<std::string> split_words(const std::string& paragraph) {
    std::vector<std::string> words;
    size_t start = 0;
    while (true) {
        const size_t space = paragraph.find(' ', start);
        if (space == std::string::npos) {
            words.push_back(paragraph.substr(start));
            return words;
        }
        words.push_back(paragraph.substr(start, space - start));
        start = space + 1;
    }
}

std::vector<std::string> TextMeasurer::split_to_width(const std::string& text,
                                                      double max_width,
                                                      FontStyle style,
                                                      double size) const {
    std::vector<std::string> lines;

    for (const auto& paragraph : split_paragraphs(text)) {
        std::string line;
        bool open = false;   // line holds at least one word, possibly an empty one

        for (const auto& word : split_words(paragraph)) {
            const std::string candidate = open ? line + " " + word : word;
            if (text_width(candidate, style, size) <= max_width) {
                line = candidate;
                open = true;
                continue;
            }

            if (open) {
                lines.push_back(line);
                line.clear();
                open = false;
            }

            if (text_width(word, style, size) <= max_width) {
                line = word;
                open = true;
                continue;
            }

            // Word alone is too wide: cut it between code points, keeping at
            // least one code point per line.
            size_t i = 0;
            while (i < word.size()) {
                const size_t n = utf8_sequence_length(static_cast<unsigned char>(word[i]));
                const std::string cp = word.substr(i, n);
                if (!line.empty() && text_width(line + cp, style, size) > max_width) {
                    lines.push_back(line);
                    line.clear();
                }
                line += cp;
                i += n;
            }
            open = true;
        }

        lines.push_back(line);
    }

    return lines;
}

} // namespace layout
