#include "document.h"
#include "utils.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>

namespace kisexpr {

const char* kind_name(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::SymbolLibrary: return "symbol library";
        case DocumentKind::Footprint:     return "footprint";
        case DocumentKind::Schematic:     return "schematic";
        case DocumentKind::Board:         return "board";
        case DocumentKind::Unknown:       break;
    }
    return "unknown";
}

DocumentKind kind_from_tag(const std::string& tag) {
    static const std::map<std::string, DocumentKind> kinds = {
        {"kicad_symbol_lib", DocumentKind::SymbolLibrary},
        {"footprint",        DocumentKind::Footprint},
        {"module",           DocumentKind::Footprint},
        {"kicad_sch",        DocumentKind::Schematic},
        {"kicad_pcb",        DocumentKind::Board},
    };
    auto it = kinds.find(tag);
    return it != kinds.end() ? it->second : DocumentKind::Unknown;
}

const char* canonical_tag(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::SymbolLibrary: return "kicad_symbol_lib";
        case DocumentKind::Footprint:     return "footprint";
        case DocumentKind::Schematic:     return "kicad_sch";
        case DocumentKind::Board:         return "kicad_pcb";
        case DocumentKind::Unknown:       break;
    }
    return "";
}

static std::optional<HeaderField> classify_header(const Node& n) {
    const std::string& tag = n.tag();
    if (tag == "version") return HeaderField::Version;
    if (tag == "generator") return HeaderField::Generator;
    if (tag == "generator_version") return HeaderField::GeneratorVersion;
    if (tag == "uuid" || tag == "tstamp") return HeaderField::Uuid;
    return std::nullopt;
}

Document::Document(const DocumentOptions& opts)
    : opts_(opts) {}

Document Document::create(DocumentKind kind, const DocumentOptions& opts) {
    Document doc(opts);
    doc.kind_ = kind;
    doc.root_ = Node::list(canonical_tag(kind));
    doc.header_.token = EncodedValue<std::string>(canonical_tag(kind));
    doc.header_.version = EncodedValue<int>(CANONICAL_VERSION);
    doc.header_.generator = EncodedValue<std::string>(GENERATOR_NAME);
    doc.header_.generator_version = EncodedValue<std::string>(GENERATOR_VERSION);
    if (kind == DocumentKind::Schematic) {
        doc.header_.uuid = EncodedValue<std::string>(generate_uuid());
    }
    doc.log(std::string("Created empty ") + kind_name(kind));
    return doc;
}

// --- Loading ---

bool Document::load(std::istream& in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        diagnostics_.clear();
        warnings_.clear();
        error("failed reading input stream");
        return false;
    }
    return load_string(text);
}

bool Document::load_string(std::string_view text) {
    diagnostics_.clear();
    warnings_.clear();

    ParseResult result = Parser(opts_.parser).parse(text);
    diagnostics_ = std::move(result.diagnostics);
    style_ = result.style;
    root_ = std::move(result.root);
    log("Parsed " + std::to_string(text.size()) + " bytes, root '" + root_.tag() + "'");

    map_header();
    check_version();

    for (const auto& d : diagnostics_) {
        if (d.severity == Severity::Error) {
            warn(d.to_string());
        } else {
            log(d.to_string());
        }
    }
    return !has_errors();
}

bool Document::load_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        diagnostics_.clear();
        warnings_.clear();
        error("cannot open input file: " + path);
        return false;
    }
    log("Loading " + path);
    return load(in);
}

std::future<bool> Document::load_file_async(const std::string& path,
                                            const std::atomic<bool>* cancel) {
    return std::async(std::launch::async, [this, path, cancel]() {
        if (cancel && cancel->load()) {
            error("load of " + path + " cancelled");
            return false;
        }
        return load_file(path);
    });
}

void Document::set_root(const Node& root) {
    root_ = root;
    map_header();
}

void Document::map_header() {
    header_ = FileHeader();
    sections_.clear();

    kind_ = kind_from_tag(root_.tag());
    if (kind_ == DocumentKind::Unknown && root_.has_tag()) {
        diagnostics_.push_back({Severity::Warning,
                                "unknown document type '" + root_.tag() + "'", Location()});
    }

    SourceFormat token_format;
    token_format.explicit_value = true;
    token_format.is_symbol = true;
    token_format.token = root_.tag();
    header_.token = EncodedValue<std::string>::from_source(root_.tag(), token_format);

    if (kind_ == DocumentKind::Footprint) {
        header_.name = read_atom_text(root_, 0);
    }
    header_.version = read_number<int>(root_, "version");
    header_.generator = read_text(root_, "generator");
    header_.generator_version = read_text(root_, "generator_version");
    header_.uuid = read_text(root_, "uuid", {"tstamp"});

    // Only the node each field was read from is mapped; repeats stay raw
    const Node* uuid = root_.child("uuid");
    const Node* mapped[] = {
        root_.child("version"), root_.child("generator"),
        root_.child("generator_version"), uuid ? uuid : root_.child("tstamp"),
    };
    sections_ = split_sections<HeaderField>(root_, [&](const Node& n) {
        std::optional<HeaderField> field = classify_header(n);
        if (field && &n != mapped[static_cast<int>(*field)]) return std::optional<HeaderField>();
        return field;
    });
}

void Document::check_version() {
    if (kind_ == DocumentKind::Unknown) return;
    if (!header_.version.is_explicit()) {
        diagnostics_.push_back({Severity::Info, "document has no version", Location()});
        return;
    }
    // Compare the written number; the mapped int saturates
    double version = *header_.version;
    std::string text = std::to_string(*header_.version);
    if (const auto& source = header_.version.format().source) {
        if (auto d = source->get_double(0)) version = *d;
        if (const Node* a = source->atom(0)) text = a->text();
    }
    if (version > NEWEST_TESTED_VERSION) {
        diagnostics_.push_back({Severity::Warning,
                                "file version " + text +
                                " is newer than the newest tested version " +
                                std::to_string(NEWEST_TESTED_VERSION),
                                Location()});
    }
}

// --- Saving ---

bool Document::header_field_present(HeaderField field) const {
    for (const auto& s : sections_) {
        if (s.index() == 0 && std::get<0>(s) == field) return true;
    }
    return false;
}

void Document::write_header_field(Builder& b, HeaderField field) const {
    switch (field) {
        case HeaderField::Version:
            write_number(b, "version", header_.version);
            break;
        case HeaderField::Generator:
            write_text(b, "generator", header_.generator, TextStyle::Quoted);
            break;
        case HeaderField::GeneratorVersion:
            write_text(b, "generator_version", header_.generator_version, TextStyle::Quoted);
            break;
        case HeaderField::Uuid:
            write_text(b, "uuid", header_.uuid, TextStyle::Quoted);
            break;
    }
}

Node Document::to_tree() const {
    std::string tag = header_.token.is_explicit() ? *header_.token : root_.tag();
    if (tag.empty()) return root_;
    Builder b(tag);
    b.keep_layout(root_);

    static const HeaderField order[] = {
        HeaderField::Version, HeaderField::Generator,
        HeaderField::GeneratorVersion, HeaderField::Uuid,
    };

    // Fields the file did not have go after the last one it had, or
    // straight after the footprint name
    size_t insert_at = 0;
    bool has_atom = false;
    for (size_t i = 0; i < sections_.size(); i++) {
        if (sections_[i].index() == 0) {
            insert_at = i + 1;
        } else if (!has_atom && std::get<1>(sections_[i]).is_atom()) {
            has_atom = true;
            if (kind_ == DocumentKind::Footprint && insert_at == 0) insert_at = i + 1;
        }
    }

    auto write_missing = [&]() {
        for (HeaderField f : order) {
            if (!header_field_present(f)) write_header_field(b, f);
        }
    };

    bool name_written = false;
    if (kind_ == DocumentKind::Footprint && !has_atom) {
        write_atom_text(b, header_.name, TextStyle::Quoted);
        name_written = true;
    }

    for (size_t i = 0; i < sections_.size(); i++) {
        if (i == insert_at) write_missing();
        const auto& section = sections_[i];
        if (section.index() == 0) {
            write_header_field(b, std::get<0>(section));
            continue;
        }
        const Node& node = std::get<1>(section);
        if (kind_ == DocumentKind::Footprint && !name_written && node.is_atom()) {
            write_atom_text(b, header_.name, TextStyle::Quoted);
            name_written = true;
            continue;
        }
        b.add_child(node);
    }
    if (insert_at >= sections_.size()) write_missing();

    return b.build();
}

WriterOptions Document::writer_options() const {
    WriterOptions w = WriterOptions::for_style(style_);
    w.verbose = opts_.verbose;
    return w;
}

std::string Document::to_string() const {
    return Writer(writer_options()).to_string(to_tree());
}

bool Document::save(std::ostream& out) {
    Writer writer(writer_options());
    if (!writer.write(out, to_tree())) {
        error("failed writing document");
        return false;
    }
    return true;
}

bool Document::save_file(const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        error("cannot open output file: " + path);
        return false;
    }
    bool ok = save(out);
    out.close();
    if (ok && out.fail()) {
        error("failed writing output file: " + path);
        return false;
    }
    if (ok) log("Saved " + path);
    return ok;
}

std::future<bool> Document::save_file_async(const std::string& path,
                                            const std::atomic<bool>* cancel) {
    std::string text = to_string();
    return std::async(std::launch::async, [this, path, cancel, text]() {
        if (cancel && cancel->load()) {
            error("save of " + path + " cancelled");
            return false;
        }
        std::ofstream out(path, std::ios::binary);
        if (!out.is_open()) {
            error("cannot open output file: " + path);
            return false;
        }
        out << text;
        out.close();
        if (out.fail()) {
            error("failed writing output file: " + path);
            return false;
        }
        log("Saved " + path);
        return true;
    });
}

Box Document::bounds() const {
    return compute_bounds(to_tree());
}

// --- Reporting ---

void Document::error(const std::string& msg) {
    diagnostics_.push_back({Severity::Error, msg, Location()});
    warn(msg);
}

void Document::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cout << "[kicad-sexpr] " << msg << std::endl;
    }
}

void Document::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace kisexpr
