#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pdf {

// Body of one indirect object; its object number is its position + 1.
struct PdfObject {
    std::string body;
};

// Serializes objects with header, xref table and trailer.
std::string serialize_pdf_document(const std::vector<PdfObject>& objects,
                                   size_t catalog_object_number,
                                   size_t info_object_number = 0);

// zlib-compresses a content stream for /FlateDecode.
bool deflate_stream(const std::string& input, std::string& output, std::string& error);

bool write_pdf_file(const std::filesystem::path& output_path, const std::string& bytes,
                    std::string& error);

}  // namespace pdf
