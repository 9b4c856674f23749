#include "pdf/PdfText.hpp"

#include <cstdint>
#include <cstdio>

namespace pdf {

static unsigned char win_ansi_byte(uint32_t codepoint) {
    if (codepoint <= 0x7F) return static_cast<unsigned char>(codepoint);
    if (codepoint >= 0xA0 && codepoint <= 0xFF) return static_cast<unsigned char>(codepoint);

    // Code points WinAnsi places in 0x80..0x9F.
    switch (codepoint) {
        case 0x20AC: return 0x80;  // euro
        case 0x201A: return 0x82;
        case 0x0192: return 0x83;
        case 0x201E: return 0x84;
        case 0x2026: return 0x85;  // ellipsis
        case 0x2020: return 0x86;
        case 0x2021: return 0x87;
        case 0x02C6: return 0x88;
        case 0x2030: return 0x89;
        case 0x0160: return 0x8A;
        case 0x2039: return 0x8B;
        case 0x0152: return 0x8C;
        case 0x017D: return 0x8E;
        case 0x2018: return 0x91;
        case 0x2019: return 0x92;
        case 0x201C: return 0x93;
        case 0x201D: return 0x94;
        case 0x2022: return 0x95;  // bullet
        case 0x2013: return 0x96;  // en dash
        case 0x2014: return 0x97;  // em dash
        case 0x02DC: return 0x98;
        case 0x2122: return 0x99;
        case 0x0161: return 0x9A;
        case 0x203A: return 0x9B;
        case 0x0153: return 0x9C;
        case 0x017E: return 0x9E;
        case 0x0178: return 0x9F;
        default:     return '?';
    }
}

std::string encode_win_ansi(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        const unsigned char lead = static_cast<unsigned char>(utf8[i]);
        uint32_t codepoint = 0;
        size_t length = 0;

        if (lead < 0x80) {
            codepoint = lead;
            length = 1;
        } else if ((lead >> 5) == 0x6 && i + 1 < utf8.size()) {
            codepoint = ((lead & 0x1Fu) << 6) |
                        (static_cast<unsigned char>(utf8[i + 1]) & 0x3Fu);
            length = 2;
        } else if ((lead >> 4) == 0xE && i + 2 < utf8.size()) {
            codepoint = ((lead & 0x0Fu) << 12) |
                        ((static_cast<unsigned char>(utf8[i + 1]) & 0x3Fu) << 6) |
                        (static_cast<unsigned char>(utf8[i + 2]) & 0x3Fu);
            length = 3;
        } else if ((lead >> 3) == 0x1E && i + 3 < utf8.size()) {
            codepoint = ((lead & 0x07u) << 18) |
                        ((static_cast<unsigned char>(utf8[i + 1]) & 0x3Fu) << 12) |
                        ((static_cast<unsigned char>(utf8[i + 2]) & 0x3Fu) << 6) |
                        (static_cast<unsigned char>(utf8[i + 3]) & 0x3Fu);
            length = 4;
        } else {
            out.push_back('?');
            ++i;
            continue;
        }

        out.push_back(static_cast<char>(win_ansi_byte(codepoint)));
        i += length;
    }
    return out;
}

std::string escape_pdf_string(const std::string& bytes) {
    std::string escaped;
    escaped.reserve(bytes.size() + 8);

    for (unsigned char ch : bytes) {
        switch (ch) {
            case '(':
            case ')':
            case '\\':
                escaped.push_back('\\');
                escaped.push_back(static_cast<char>(ch));
                break;
            case '\n': escaped.append("\\n"); break;
            case '\r': escaped.append("\\r"); break;
            case '\t': escaped.append("\\t"); break;
            default:
                if (ch < 0x20 || ch > 0x7E) {
                    char buf[5] = {};
                    std::snprintf(buf, sizeof(buf), "\\%03o", ch);
                    escaped.append(buf);
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

}  // namespace pdf
