#include "document.h"
#include "json_export.h"
#include "json_import.h"
#include "writer.h"

#include <fstream>
#include <iostream>
#include <map>
#include <string>

static void print_help() {
    std::cout << "Usage: kicad-sexpr [options] <input>\n"
              << "\n"
              << "Read a KiCad S-expression file and write it back out.\n"
              << "\n"
              << "Supported input formats:\n"
              << "  .kicad_sym          Symbol libraries\n"
              << "  .kicad_mod          Footprints (including legacy 'module' files)\n"
              << "  .kicad_sch          Schematics\n"
              << "  .kicad_pcb          Boards\n"
              << "  .json               JSON tree (with --import-json)\n"
              << "\n"
              << "Options:\n"
              << "  -o, --output <file>       Output file (default: stdout)\n"
              << "  --check                   Print diagnostics; exit 1 if there are errors\n"
              << "  --info                    Print document kind, header and bounding box\n"
              << "  --reformat                Ignore the input's line breaks\n"
              << "  --indent <tab|N>          Indent with a tab or N spaces\n"
              << "  --export-json             Write the tree as JSON to stdout\n"
              << "  --import-json             Read the input as JSON (output of --export-json)\n"
              << "  --verbose                 Verbose output\n"
              << "  -h, --help                Show help\n";
}

static void print_info(const kisexpr::Document& doc) {
    const auto& h = doc.header();
    std::cout << "Kind: " << kisexpr::kind_name(doc.kind()) << " (" << doc.root().tag() << ")\n";
    if (h.name.is_explicit()) std::cout << "Name: " << *h.name << "\n";
    if (h.version.is_explicit()) std::cout << "Version: " << *h.version << "\n";
    if (h.generator.is_explicit()) {
        std::cout << "Generator: " << *h.generator;
        if (h.generator_version.is_explicit()) std::cout << " " << *h.generator_version;
        std::cout << "\n";
    }
    if (h.uuid.is_explicit()) std::cout << "UUID: " << *h.uuid << "\n";

    std::map<std::string, int> counts;
    for (const auto& c : doc.root().children()) {
        if (c.is_list()) counts[c.tag()]++;
    }
    std::cout << "Top-level items:\n";
    for (const auto& entry : counts) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }

    kisexpr::Box box = doc.bounds();
    if (box.empty) {
        std::cout << "Bounds: (none)\n";
    } else {
        std::cout << "Bounds: (" << box.min.x.to_string() << ", " << box.min.y.to_string()
                  << ") - (" << box.max.x.to_string() << ", " << box.max.y.to_string()
                  << ") mm, " << box.width().to_string() << " x " << box.height().to_string()
                  << " mm\n";
    }
    std::cout << "Diagnostics: " << doc.diagnostics().size()
              << (doc.has_errors() ? " (with errors)" : "") << "\n";
}

int main(int argc, char* argv[]) {
    std::string input_file;
    std::string output_file;
    std::string indent;
    bool check = false;
    bool info = false;
    bool reformat = false;
    bool export_json = false;
    bool import_json = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -o requires an argument\n";
                return 1;
            }
            output_file = argv[++i];
        } else if (arg == "--indent") {
            if (i + 1 >= argc || !kisexpr::parse_indent(argv[i + 1], indent)) {
                std::cerr << "Error: --indent requires 'tab' or 1 to 99 spaces\n";
                return 1;
            }
            i++;
        } else if (arg == "--check") {
            check = true;
        } else if (arg == "--info") {
            info = true;
        } else if (arg == "--reformat") {
            reformat = true;
        } else if (arg == "--export-json") {
            export_json = true;
        } else if (arg == "--import-json") {
            import_json = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            print_help();
            return 1;
        } else {
            input_file = arg;
        }
    }

    if (input_file.empty()) {
        std::cerr << "Error: no input file specified\n";
        print_help();
        return 1;
    }

    kisexpr::DocumentOptions doc_opts;
    doc_opts.verbose = verbose;
    kisexpr::Document doc(doc_opts);

    if (import_json) {
        if (verbose) {
            std::cerr << "Importing from JSON\n";
        }

        std::ifstream json_file(input_file);
        if (!json_file.is_open()) {
            std::cerr << "Error: cannot open " << input_file << "\n";
            return 1;
        }

        kisexpr::Node root;
        if (!kisexpr::read_json(json_file, root)) {
            std::cerr << "Error: failed to parse JSON from " << input_file << "\n";
            return 1;
        }
        doc.set_root(root);
    } else {
        bool loaded = doc.load_file(input_file);
        if (!loaded && !check && !info) {
            std::cerr << "Error: failed to read " << input_file << "\n";
            for (auto& d : doc.diagnostics()) {
                if (d.severity == kisexpr::Severity::Error) {
                    std::cerr << "  " << d.to_string() << "\n";
                }
            }
            return 1;
        }
    }

    // Handle --check
    if (check) {
        for (auto& d : doc.diagnostics()) {
            std::cout << input_file << ":" << d.to_string() << "\n";
        }
        if (doc.has_errors()) return 1;
        std::cout << input_file << ": OK (" << kisexpr::kind_name(doc.kind()) << ")\n";
        return 0;
    }

    // Handle --info
    if (info) {
        print_info(doc);
        return doc.has_errors() ? 1 : 0;
    }

    // Handle --export-json
    if (export_json) {
        kisexpr::write_json(std::cout, doc);
        return 0;
    }

    kisexpr::WriterOptions writer_opts = doc.writer_options();
    if (!indent.empty()) writer_opts.indent = indent;
    if (reformat || import_json) writer_opts.use_layout_hints = false;
    writer_opts.verbose = verbose;

    kisexpr::Writer writer(writer_opts);
    if (output_file.empty()) {
        if (!writer.write(std::cout, doc.to_tree())) return 1;
        return 0;
    }

    if (!writer.write(output_file, doc.to_tree())) {
        std::cerr << "Error: failed to write " << output_file << "\n";
        return 1;
    }

    std::cout << "Wrote " << input_file << " -> " << output_file
              << " (" << kisexpr::kind_name(doc.kind()) << ")\n";
    return 0;
}
