#include "layout/TextMeasurer.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <cmath>
#include <string>
#include <vector>

using layout::FontStyle;
using Lines = std::vector<std::string>;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static void test_helvetica_widths() {
    layout::HelveticaMeasurer m;
    assert(near(m.text_width("Hello", FontStyle::Normal, 10.0), 22.78));
    assert(near(m.text_width("A", FontStyle::Bold, 12.0), 8.664));
    assert(near(m.text_width("Hello", FontStyle::Italic, 10.0), 22.78));
    assert(m.text_width("Hello", FontStyle::Bold, 10.0) > m.text_width("Hello", FontStyle::Normal, 10.0));
    assert(m.text_width("", FontStyle::Normal, 10.0) == 0.0);

    // Characters outside the table use the fallback width.
    assert(near(m.text_width("\xE2\x82\xAC", FontStyle::Normal, 10.0), 5.56));
}

static void test_short_text_is_one_line() {
    FixedWidthMeasurer m;
    assert(m.split_to_width("a b c", 100.0, FontStyle::Normal, 10.0) == Lines{"a b c"});
}

static void test_spacing_is_kept() {
    FixedWidthMeasurer m;
    assert(m.split_to_width("a   b", 100.0, FontStyle::Normal, 10.0) == Lines{"a   b"});
    assert(m.split_to_width("   ", 100.0, FontStyle::Normal, 10.0) == Lines{"   "});
    assert(m.split_to_width("  indented", 100.0, FontStyle::Normal, 10.0) == Lines{"  indented"});
    assert(m.split_to_width("Step 1:    wait", 100.0, FontStyle::Normal, 10.0) == Lines{"Step 1:    wait"});

    // The space a line breaks on is dropped; the others stay.
    assert((m.split_to_width("aaaa bb  cc", 35.0, FontStyle::Normal, 10.0) == Lines{"aaaa bb", " cc"}));
}

static void test_breaks_between_words() {
    FixedWidthMeasurer m;
    assert((m.split_to_width("aaaa bbbb", 30.0, FontStyle::Normal, 10.0) == Lines{"aaaa", "bbbb"}));
    assert((m.split_to_width("aa bb cc dd", 25.0, FontStyle::Normal, 10.0) == Lines{"aa bb", "cc dd"}));
}

static void test_splits_overlong_word() {
    FixedWidthMeasurer m;
    assert((m.split_to_width("abcdefghij", 20.0, FontStyle::Normal, 10.0) == Lines{"abcd", "efgh", "ij"}));
    assert((m.split_to_width("x abcdefgh", 20.0, FontStyle::Normal, 10.0) == Lines{"x", "abcd", "efgh"}));
    assert((m.split_to_width("abcdef gh", 20.0, FontStyle::Normal, 10.0) == Lines{"abcd", "ef", "gh"}));
    assert((m.split_to_width("abcdef g", 20.0, FontStyle::Normal, 10.0) == Lines{"abcd", "ef g"}));

    // Multi-byte characters are never cut apart.
    assert((m.split_to_width("\xC3\xA9\xC3\xA9\xC3\xA9", 10.0, FontStyle::Normal, 10.0)
            == Lines{"\xC3\xA9", "\xC3\xA9", "\xC3\xA9"}));
}

static void test_explicit_newlines() {
    FixedWidthMeasurer m;
    assert((m.split_to_width("one\n\nthree", 100.0, FontStyle::Normal, 10.0) == Lines{"one", "", "three"}));
    assert((m.split_to_width("a\r\nb", 100.0, FontStyle::Normal, 10.0) == Lines{"a", "b"}));
}

static void test_empty_text_is_one_empty_line() {
    FixedWidthMeasurer m;
    assert(m.split_to_width("", 100.0, FontStyle::Normal, 10.0) == Lines{""});
}

int main() {
    test_helvetica_widths();
    test_short_text_is_one_line();
    test_spacing_is_kept();
    test_breaks_between_words();
    test_splits_overlong_word();
    test_explicit_newlines();
    test_empty_text_is_one_empty_line();
    return 0;
}
