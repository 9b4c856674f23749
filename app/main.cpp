#include "commands/delete.hpp"
#include "commands/edit.hpp"
#include "commands/list.hpp"
#include "commands/render.hpp"
#include "commands/submit.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  ohs-report validate --input <path> [--out <path>]\n"
        << "  ohs-report submit --input <path> [--store <path>]\n"
        << "  ohs-report edit --id <id> --input <path> [--store <path>]\n"
        << "  ohs-report list [--store <path>]\n"
        << "  ohs-report delete --id <id> [--store <path>]\n"
        << "  ohs-report render (--id <id> | --input <path>) [args]\n"
        << "  ohs-report help\n";
    return 1;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  ohs-report render (--id <id> | --input <path>) [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --id <id>                    render a stored report\n"
        << "  --input <path>               render a report JSON file\n"
        << "  --store <path>               default: data/ohs_reports.json\n"
        << "  --out <path>                 default: OHS_Report_<id>.pdf\n"
        << "  --pages <path>               optional: laid-out pages as JSON\n"
        << "\n"
        << "layout:\n"
        << "  --config <path>              JSON with page_width, page_height, top_margin,\n"
        << "                               left_margin, right_margin, line_height,\n"
        << "                               page_break_y, value_indent, compress\n"
        << "  --no-compress                write uncompressed content streams\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    if (cmd == "render" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_render_help();

    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "submit")   return cmd_submit(argc - 1, argv + 1);
    if (cmd == "edit")     return cmd_edit(argc - 1, argv + 1);
    if (cmd == "list")     return cmd_list(argc - 1, argv + 1);
    if (cmd == "delete")   return cmd_delete(argc - 1, argv + 1);
    if (cmd == "render")   return cmd_render(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
