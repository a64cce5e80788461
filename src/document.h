#pragma once

#include "diagnostic.h"
#include "fidelity.h"
#include "geometry.h"
#include "parser.h"
#include "sexpr.h"
#include "writer.h"
#include <atomic>
#include <future>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace kisexpr {

enum class DocumentKind {
    Unknown,
    SymbolLibrary,   // kicad_symbol_lib
    Footprint,       // footprint, legacy module
    Schematic,       // kicad_sch
    Board            // kicad_pcb
};

// Newest file format version the library has been tested against
constexpr int NEWEST_TESTED_VERSION = 20241229;
// Version written into freshly created documents
constexpr int CANONICAL_VERSION = 20231120;

constexpr const char* GENERATOR_NAME = "kicad-sexpr";
constexpr const char* GENERATOR_VERSION = "1.0";

const char* kind_name(DocumentKind kind);
DocumentKind kind_from_tag(const std::string& tag);
// Root tag written for a freshly created document
const char* canonical_tag(DocumentKind kind);

enum class HeaderField {
    Version,
    Generator,
    GeneratorVersion,
    Uuid
};

// Top-level identity fields shared by all document kinds
struct FileHeader {
    EncodedValue<std::string> token;   // root tag (footprint / module ...)
    EncodedValue<std::string> name;    // footprints only: first atom
    EncodedValue<int> version;
    EncodedValue<std::string> generator;
    EncodedValue<std::string> generator_version;
    EncodedValue<std::string> uuid;    // schematics; legacy spelling tstamp
};

struct DocumentOptions {
    bool verbose = false;
    ParserOptions parser;
};

// A KiCad file: its tree, the diagnostics from reading it, the formatting
// it was written with and its mapped header.
//
// Unmodified documents save byte-for-byte as they were loaded. Header
// fields edited through header() are written in the encoding the file
// already used; everything the header mapper does not model is carried
// through untouched.
//
// A Document is not safe for concurrent use. The async operations run on
// another thread; the document must outlive the returned future and must
// not be touched until it is ready.
class Document {
public:
    explicit Document(const DocumentOptions& opts = {});

    // Empty document with a canonical header
    static Document create(DocumentKind kind, const DocumentOptions& opts = {});

    // Loading replaces the current contents. Returns false if the input
    // could not be read or parsing produced errors; the best-effort tree
    // and all diagnostics are kept either way.
    bool load(std::istream& in);
    bool load_string(std::string_view text);
    bool load_file(const std::string& path);

    bool save(std::ostream& out);
    bool save_file(const std::string& path);
    std::string to_string() const;

    // cancel is checked once before any work is done
    std::future<bool> load_file_async(const std::string& path,
                                      const std::atomic<bool>* cancel = nullptr);
    // Formats immediately; only the file write happens on the other thread
    std::future<bool> save_file_async(const std::string& path,
                                      const std::atomic<bool>* cancel = nullptr);

    // Root rebuilt with the current header values
    Node to_tree() const;

    DocumentKind kind() const { return kind_; }
    const FileHeader& header() const { return header_; }
    FileHeader& header() { return header_; }

    const Node& root() const { return root_; }
    // Replace the tree and map its header again
    void set_root(const Node& root);

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    bool has_errors() const { return kisexpr::has_errors(diagnostics_); }
    const std::vector<std::string>& warnings() const { return warnings_; }

    const SourceStyle& style() const { return style_; }
    WriterOptions writer_options() const;

    Box bounds() const;

private:
    DocumentOptions opts_;
    DocumentKind kind_ = DocumentKind::Unknown;
    Node root_;
    FileHeader header_;
    std::vector<Section<HeaderField>> sections_;
    std::vector<Diagnostic> diagnostics_;
    std::vector<std::string> warnings_;
    SourceStyle style_;

    void map_header();
    void check_version();
    void write_header_field(Builder& b, HeaderField field) const;
    bool header_field_present(HeaderField field) const;

    void error(const std::string& msg);
    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace kisexpr
