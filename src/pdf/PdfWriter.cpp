#include "pdf/PdfWriter.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace pdf {

std::string serialize_pdf_document(const std::vector<PdfObject>& objects,
                                   size_t catalog_object_number,
                                   size_t info_object_number) {
    std::ostringstream out;

    // The binary comment line marks the file as 8-bit for transfer tools.
    out << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

    std::vector<long> offsets;
    offsets.reserve(objects.size());
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(static_cast<long>(out.tellp()));
        out << (i + 1) << " 0 obj\n" << objects[i].body << "\nendobj\n";
    }

    const long xref_pos = static_cast<long>(out.tellp());
    out << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
    for (long off : offsets) {
        out << std::setw(10) << std::setfill('0') << off << " 00000 n \n";
    }

    out << "trailer\n<< /Size " << (objects.size() + 1) << " /Root " << catalog_object_number << " 0 R";
    if (info_object_number != 0) out << " /Info " << info_object_number << " 0 R";
    out << " >>\nstartxref\n" << xref_pos << "\n%%EOF\n";

    return out.str();
}

bool deflate_stream(const std::string& input, std::string& output, std::string& error) {
    if (input.empty()) {
        output.clear();
        return true;
    }

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::string compressed;
    compressed.resize(bound);

    const int zres = compress2(reinterpret_cast<Bytef*>(&compressed[0]), &bound,
                               reinterpret_cast<const Bytef*>(input.data()),
                               static_cast<uLong>(input.size()), Z_BEST_SPEED);
    if (zres != Z_OK) {
        error = "compress2 failed with code " + std::to_string(zres);
        return false;
    }

    compressed.resize(bound);
    output.swap(compressed);
    return true;
}

bool write_pdf_file(const std::filesystem::path& output_path, const std::string& bytes,
                    std::string& error) {
    std::error_code ec;
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            error = "Unable to create output directory: " + ec.message();
            return false;
        }
    }

    std::ofstream file(output_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = "Unable to open the destination file for writing: " + output_path.string();
        return false;
    }

    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        error = "Failed to write PDF content to " + output_path.string();
        return false;
    }
    return true;
}

}  // namespace pdf
