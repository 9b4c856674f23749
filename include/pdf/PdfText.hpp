#pragma once

#include <string>

namespace pdf {

// UTF-8 to WinAnsiEncoding bytes; unmappable characters become '?'.
std::string encode_win_ansi(const std::string& utf8);

// Escapes a byte string for use inside a PDF literal string "( ... )".
std::string escape_pdf_string(const std::string& bytes);

}  // namespace pdf
