#include "json_import.h"
#include "utils.h"

#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace kisexpr {

static bool read_node(const json& j, Node& out, std::string& error) {
    if (!j.is_object()) {
        error = "node is not an object";
        return false;
    }

    if (j.contains("symbol")) {
        std::string name = j["symbol"].get<std::string>();
        if (!is_safe_symbol(name)) {
            error = "symbol '" + name + "' cannot be written bare";
            return false;
        }
        out = Node::symbol(name);
        return true;
    }

    if (j.contains("string")) {
        std::string value = j["string"].get<std::string>();
        if (j.contains("raw")) {
            out = Node::string(value, j["raw"].get<std::string>());
        } else {
            out = Node::string(value);
        }
        return true;
    }

    if (j.contains("number")) {
        double value = j["number"].get<double>();
        std::string text = j.value("text", std::string());
        if (!text.empty() && !is_number_text(text)) {
            error = "'" + text + "' is not a number";
            return false;
        }
        out = text.empty() ? Node::number(value) : Node::number(value, text);
        return true;
    }

    if (j.contains("tag")) {
        std::string tag = j["tag"].get<std::string>();
        if (!tag.empty() && !is_safe_symbol(tag)) {
            error = "invalid list tag '" + tag + "'";
            return false;
        }
        std::vector<Node> children;
        if (j.contains("children")) {
            const json& arr = j["children"];
            if (!arr.is_array()) {
                error = "children of '" + tag + "' is not an array";
                return false;
            }
            for (const auto& c : arr) {
                Node child;
                if (!read_node(c, child, error)) return false;
                children.push_back(std::move(child));
            }
        }
        out = Node::list(tag, std::move(children));
        return true;
    }

    error = "object is not a tree node";
    return false;
}

bool read_json(std::istream& in, Node& root) {
    try {
        json j = json::parse(in);

        std::string error;
        Node node;
        if (!read_node(j, node, error)) {
            std::cerr << "Error: invalid tree JSON: " << error << "\n";
            return false;
        }
        if (!node.is_list()) {
            std::cerr << "Error: invalid tree JSON: root is not a list\n";
            return false;
        }
        root = std::move(node);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_json(const std::string& json_text, Node& root) {
    std::istringstream iss(json_text);
    return read_json(iss, root);
}

} // namespace kisexpr
