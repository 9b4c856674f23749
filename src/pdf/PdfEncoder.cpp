#include "pdf/PdfEncoder.hpp"

#include "pdf/PdfText.hpp"
#include "pdf/PdfWriter.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pdf {

static std::string fmt(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    return ss.str();
}

// Font resource names, objects 1..3.
static const char* font_key(layout::FontStyle style) {
    switch (style) {
        case layout::FontStyle::Normal: return "F1";
        case layout::FontStyle::Bold:   return "F2";
        case layout::FontStyle::Italic: return "F3";
    }
    return "F1";
}

static std::string page_content(const layout::Page& page, const layout::PageGeometry& g) {
    std::ostringstream content;
    for (const auto& run : page.runs) {
        // Runs are positioned from the top edge; PDF user space starts bottom-left.
        content << "BT\n/" << font_key(run.style) << ' ' << fmt(run.size) << " Tf\n"
                << fmt(run.x) << ' ' << fmt(g.page_height - run.y) << " Td\n("
                << escape_pdf_string(encode_win_ansi(run.text)) << ") Tj\nET\n";
    }
    return content.str();
}

std::string encode_pdf(const std::vector<layout::Page>& pages,
                       const layout::PageGeometry& geometry,
                       const PdfOptions& options) {
    std::vector<PdfObject> objects;

    objects.push_back({"<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"});
    objects.push_back({"<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>"});
    objects.push_back({"<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Oblique /Encoding /WinAnsiEncoding >>"});

    // An empty document still gets one blank page.
    const size_t page_total = pages.empty() ? 1 : pages.size();

    // Objects 4.. hold (content, page) pairs, then the page tree and catalog.
    const size_t pages_number = objects.size() + page_total * 2 + 1;
    const size_t catalog_number = pages_number + 1;

    const std::string media_box = "[0 0 " + fmt(geometry.page_width) + " " + fmt(geometry.page_height) + "]";
    const std::string resources = "<< /Font << /F1 1 0 R /F2 2 0 R /F3 3 0 R >> >>";

    std::vector<size_t> page_numbers;
    page_numbers.reserve(page_total);

    for (size_t i = 0; i < page_total; ++i) {
        const std::string raw = pages.empty() ? std::string() : page_content(pages[i], geometry);

        std::ostringstream content_obj;
        if (options.compress && !raw.empty()) {
            std::string packed;
            std::string error;
            if (!deflate_stream(raw, packed, error)) {
                throw std::runtime_error("failed to compress page " + std::to_string(i + 1) + ": " + error);
            }
            content_obj << "<< /Length " << packed.size() << " /Filter /FlateDecode >>\nstream\n"
                        << packed << "\nendstream";
        } else {
            content_obj << "<< /Length " << raw.size() << " >>\nstream\n" << raw << "\nendstream";
        }
        objects.push_back({content_obj.str()});
        const size_t content_number = objects.size();

        std::ostringstream page_obj;
        page_obj << "<< /Type /Page /Parent " << pages_number << " 0 R /MediaBox " << media_box
                 << " /Resources " << resources << " /Contents " << content_number << " 0 R >>";
        objects.push_back({page_obj.str()});
        page_numbers.push_back(objects.size());
    }

    std::ostringstream kids;
    for (size_t i = 0; i < page_numbers.size(); ++i) {
        if (i) kids << ' ';
        kids << page_numbers[i] << " 0 R";
    }
    objects.push_back({"<< /Type /Pages /Kids [" + kids.str() + "] /Count " +
                       std::to_string(page_numbers.size()) + " >>"});
    objects.push_back({"<< /Type /Catalog /Pages " + std::to_string(pages_number) + " 0 R >>"});

    size_t info_number = 0;
    if (!options.title.empty()) {
        objects.push_back({"<< /Title (" + escape_pdf_string(encode_win_ansi(options.title)) +
                           ") /Producer (ohs-report) >>"});
        info_number = objects.size();
    }

    return serialize_pdf_document(objects, catalog_number, info_number);
}

bool write_pdf(const std::filesystem::path& output_path,
               const std::vector<layout::Page>& pages,
               const layout::PageGeometry& geometry,
               const PdfOptions& options,
               std::string& error) {
    std::string bytes;
    try {
        bytes = encode_pdf(pages, geometry, options);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    return write_pdf_file(output_path, bytes, error);
}

}  // namespace pdf
