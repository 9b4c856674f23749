#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "layout/Page.hpp"

namespace pdf {

struct PdfOptions {
    bool compress = true;       // Flate-encode page content streams
    std::string title;          // document info /Title, omitted when empty
};

// Encodes rendered pages as a PDF 1.4 document using the core Helvetica
// fonts. Throws std::runtime_error when a content stream cannot be compressed.
std::string encode_pdf(const std::vector<layout::Page>& pages,
                       const layout::PageGeometry& geometry,
                       const PdfOptions& options = PdfOptions{});

// Encodes and writes the document. Returns false and fills error on failure.
bool write_pdf(const std::filesystem::path& output_path,
               const std::vector<layout::Page>& pages,
               const layout::PageGeometry& geometry,
               const PdfOptions& options,
               std::string& error);

}  // namespace pdf
