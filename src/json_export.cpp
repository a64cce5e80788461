#include "json_export.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kisexpr {

static json node_json(const Node& node) {
    switch (node.kind()) {
        case Node::Kind::Symbol:
            return {{"symbol", node.text()}};
        case Node::Kind::String: {
            json j = {{"string", node.text()}};
            if (node.raw()) j["raw"] = *node.raw();
            return j;
        }
        case Node::Kind::Number:
            return {{"number", node.number_value()}, {"text", node.text()}};
        case Node::Kind::List:
            break;
    }
    json children = json::array();
    for (const auto& c : node.children()) {
        children.push_back(node_json(c));
    }
    return {{"tag", node.tag()}, {"children", std::move(children)}};
}

static json diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
    json arr = json::array();
    for (const auto& d : diagnostics) {
        arr.push_back({
            {"severity", severity_name(d.severity)},
            {"message", d.message},
            {"line", d.location.line},
            {"column", d.location.column},
            {"offset", d.location.offset},
        });
    }
    return arr;
}

void write_json(std::ostream& out, const Node& root) {
    out << node_json(root).dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
}

void write_json_diagnostics(std::ostream& out, const std::vector<Diagnostic>& diagnostics) {
    out << diagnostics_json(diagnostics).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

void write_json(std::ostream& out, const Document& doc) {
    const FileHeader& h = doc.header();
    json j;
    j["kind"] = kind_name(doc.kind());
    j["version"] = h.version.is_explicit() ? json(*h.version) : json(nullptr);
    j["generator"] = h.generator.is_explicit() ? json(*h.generator) : json(nullptr);
    j["generator_version"] = h.generator_version.is_explicit() ? json(*h.generator_version)
                                                               : json(nullptr);
    if (h.name.is_explicit()) j["name"] = *h.name;
    if (h.uuid.is_explicit()) j["uuid"] = *h.uuid;
    j["has_errors"] = doc.has_errors();
    j["diagnostics"] = diagnostics_json(doc.diagnostics());
    j["root"] = node_json(doc.to_tree());
    out << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
}

} // namespace kisexpr
