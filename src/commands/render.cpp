#include "commands/render.hpp"

#include "commands/CliArgs.hpp"
#include "commands/validate.hpp"
#include "io/JsonIO.hpp"
#include "layout/ReportRenderer.hpp"
#include "layout/TextMeasurer.hpp"
#include "pdf/PdfEncoder.hpp"
#include "report/Validator.hpp"
#include "store/JsonFileReportStore.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int render_usage() {
    std::cerr
        << "usage:\n"
        << "  ohs-report render (--id <id> | --input <path>) [options]\n"
        << "\n"
        << "options:\n"
        << "  --store <path>               default: data/ohs_reports.json\n"
        << "  --out <path>                 default: OHS_Report_<id>.pdf\n"
        << "  --pages <path>               also write the laid-out pages as JSON\n"
        << "  --config <path>              page geometry overrides (JSON)\n"
        << "  --no-compress                leave page content streams uncompressed\n";
    return 1;
}

int cmd_render(int argc, char** argv) {
    const std::string id          = get_arg(argc, argv, "--id", "");
    const std::string input_path  = get_arg(argc, argv, "--input", "");
    const std::string store_path  = get_arg(argc, argv, "--store", kDefaultStorePath);
    const std::string pages_path  = get_arg(argc, argv, "--pages", "");
    const std::string config_path = get_arg(argc, argv, "--config", "");

    if (id.empty() == input_path.empty()) {
        std::cerr << "error: give exactly one of --id or --input\n";
        return render_usage();
    }

    try {
        nlohmann::json record;
        if (!id.empty()) {
            store::JsonFileReportStore reports(store_path);
            auto found = reports.find(id);
            if (!found) {
                std::cerr << "[error] report not found: " << id << "\n";
                return 1;
            }
            record = *found;
        } else {
            record = io::readJsonFile(input_path);
        }

        // The renderer only accepts validated reports.
        const report::ValidationResult res = report::validate_report(record);
        if (!res.pass) {
            std::cerr << "validation failed: report not rendered\n";
            print_violations(res);
            return 1;
        }
        const report::Report& r = *res.report;

        io::RenderConfig cfg;
        if (!config_path.empty()) cfg = io::loadRenderConfig(config_path);
        if (has_flag(argc, argv, "--no-compress")) cfg.compress = false;

        layout::HelveticaMeasurer measurer;
        const std::vector<layout::Page> pages = layout::render_report(r, measurer, cfg.geometry);

        const std::string default_out = r.id.empty() ? "OHS_Report.pdf" : "OHS_Report_" + r.id + ".pdf";
        const std::string out_path = get_arg(argc, argv, "--out", default_out);

        pdf::PdfOptions opts;
        opts.compress = cfg.compress;
        opts.title = "Annual Occupational Health and Safety Report - " + r.depot_location;

        std::string error;
        if (!pdf::write_pdf(fs::path(out_path), pages, cfg.geometry, opts, error)) {
            std::cerr << "[error] " << error << "\n";
            return 1;
        }

        if (!pages_path.empty()) {
            io::writeJsonFile(fs::path(pages_path), io::pagesToJson(pages));
            std::cout << "OUT_PAGES: " << pages_path << "\n";
        }

        std::cout << "PAGES: " << pages.size() << "\n";
        std::cout << "OUT_PDF: " << out_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
