#include "writer.h"
#include "utils.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace kisexpr {

WriterOptions WriterOptions::for_style(const SourceStyle& style) {
    WriterOptions opts;
    opts.indent = style.indent;
    opts.newline = style.newline;
    return opts;
}

bool parse_indent(const std::string& arg, std::string& indent) {
    if (arg == "tab") {
        indent = "\t";
        return true;
    }
    if (arg.empty() || arg.size() > 2) return false;
    for (char c : arg) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    int width = std::stoi(arg);
    if (width == 0) return false;
    indent = std::string(width, ' ');
    return true;
}

std::string format_atom(const Node& atom) {
    switch (atom.kind()) {
        case Node::Kind::Symbol:
            return atom.text();
        case Node::Kind::Number:
            if (atom.text().empty()) return format_number(atom.number_value());
            return atom.text();
        case Node::Kind::String:
            if (atom.raw()) return "\"" + *atom.raw() + "\"";
            return quote_string(atom.text());
        case Node::Kind::List:
            break;
    }
    return {};
}

Writer::Writer(const WriterOptions& opts)
    : opts_(opts) {}

bool Writer::write(const std::string& filename, const Node& root) {
    std::ofstream out(filename, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "Error: cannot open output file: " << filename << std::endl;
        return false;
    }
    bool ok = write(out, root);
    out.close();
    if (ok && out.fail()) {
        std::cerr << "Error: failed writing output file: " << filename << std::endl;
        return false;
    }
    if (ok) log("Wrote " + filename);
    return ok;
}

bool Writer::write(std::ostream& out, const Node& root) {
    if (!root.is_list()) {
        std::cerr << "Error: document root must be a list" << std::endl;
        return false;
    }
    write_tree(out, root);
    out << opts_.newline;
    if (!out) {
        std::cerr << "Error: output stream failed" << std::endl;
        return false;
    }
    log("Formatted '" + root.tag() + "' with " + std::to_string(root.size()) + " top-level children");
    return true;
}

std::string Writer::to_string(const Node& root) const {
    std::ostringstream out;
    if (root.is_list()) {
        write_tree(out, root);
    } else {
        write_atom(out, root);
    }
    out << opts_.newline;
    return out.str();
}

void Writer::newline(std::ostream& out, int depth, int blank_lines) const {
    for (int i = 0; i < blank_lines; i++) out << opts_.newline;
    out << opts_.newline;
    for (int i = 0; i < depth; i++) out << opts_.indent;
}

void Writer::write_atom(std::ostream& out, const Node& atom) const {
    out << format_atom(atom);
}

// Lists are written with an explicit stack so deep trees cannot exhaust
// the call stack.
void Writer::write_tree(std::ostream& out, const Node& root) const {
    struct Frame {
        const Node* list;
        size_t next = 0;
        int depth = 0;
        bool broke = false;      // some child started on a new line
        bool seen_list = false;  // a list child has been written
    };

    std::vector<Frame> stack;
    out << "(" << root.tag();
    stack.push_back({&root, 0, 0, false, false});

    while (!stack.empty()) {
        Frame& f = stack.back();
        const Node& list = *f.list;

        if (f.next == list.size()) {
            bool close_break = f.broke;
            int blank_lines = 0;
            if (opts_.use_layout_hints && list.layout().break_before_close) {
                close_break = *list.layout().break_before_close;
                blank_lines = list.layout().blank_lines_before_close;
            }
            if (close_break) newline(out, f.depth, blank_lines);
            out << ")";
            stack.pop_back();
            continue;
        }

        size_t index = f.next++;
        const Node& child = list[index];
        bool first_untagged = index == 0 && !list.has_tag();

        bool brk = !first_untagged && (child.is_list() || f.seen_list);
        int blank_lines = 0;
        if (opts_.use_layout_hints && child.layout().break_before) {
            brk = *child.layout().break_before;
            blank_lines = child.layout().blank_lines_before;
        }

        if (brk) {
            newline(out, f.depth + 1, blank_lines);
            f.broke = true;
        } else if (!first_untagged) {
            out << " ";
        }

        if (child.is_list()) {
            f.seen_list = true;
            int depth = f.depth + 1;
            out << "(" << child.tag();
            // f is invalidated by the push
            stack.push_back({&child, 0, depth, false, false});
        } else {
            write_atom(out, child);
        }
    }
}

void Writer::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cout << "[kicad-sexpr] " << msg << std::endl;
    }
}

std::string write(const Node& root, const WriterOptions& opts) {
    return Writer(opts).to_string(root);
}

} // namespace kisexpr
