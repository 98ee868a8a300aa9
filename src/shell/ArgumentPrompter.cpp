#include "ArgumentPrompter.hpp"
#include <algorithm>
#include <cctype>

namespace mcp_inspector {

namespace {

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string type_of(const json& property) {
    if (property.is_object() && property.contains("type") && property["type"].is_string()) {
        return property["type"].get<std::string>();
    }
    return "";
}

} // namespace

ArgumentPrompter::ArgumentPrompter(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::string ArgumentPrompter::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        return "";
    }
    return trim(line);
}

json ArgumentPrompter::infer_default(const json& property) {
    if (property.is_object() && property.contains("default")) {
        return property["default"];
    }
    std::string type = type_of(property);
    if (type == "integer" || type == "number") {
        return 0;
    }
    if (type == "boolean") {
        return false;
    }
    if (type == "array") {
        return json::array();
    }
    if (type == "object") {
        return json::object();
    }
    return "";
}

json ArgumentPrompter::coerce(const std::string& text, const json& property) {
    if (type_of(property) == "string") {
        return text;
    }

    json parsed = json::parse(text, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }

    std::string type = type_of(property);
    if (type == "integer") {
        try {
            return std::stoll(text);
        } catch (const std::exception&) {
            return 0;
        }
    }
    if (type == "number") {
        try {
            return std::stod(text);
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    if (type == "boolean") {
        std::string value = lower(trim(text));
        return value == "1" || value == "true" || value == "yes" || value == "y";
    }
    return text;
}

json ArgumentPrompter::prompt(const json& schema) {
    json args = json::object();

    json properties = schema.is_object() ? schema.value("properties", json::object()) : json::object();
    json required = schema.is_object() ? schema.value("required", json::array()) : json::array();
    if (!properties.is_object() || properties.empty()) {
        out_ << "Tool has no parameters - calling with empty arguments" << std::endl;
        return args;
    }
    if (!required.is_array()) {
        required = json::array();
    }

    if (required.empty()) {
        out_ << "Tool has optional parameters. Enter values? [y/N]: " << std::flush;
        std::string choice = lower(read_line());
        if (choice != "y" && choice != "yes") {
            out_ << "Using default values for optional parameters" << std::endl;
            for (const auto& [name, property] : properties.items()) {
                args[name] = infer_default(property);
            }
            return args;
        }
    }

    for (const auto& [name, property] : properties.items()) {
        bool is_required = std::find(required.begin(), required.end(), name) != required.end();
        std::string title = name;
        if (property.is_object() && property.contains("title") && property["title"].is_string()) {
            title = property["title"].get<std::string>();
        }
        json default_value = infer_default(property);

        std::string hint;
        std::string type = type_of(property);
        if (!type.empty()) {
            hint = "type=" + type;
        }
        if (!is_required) {
            hint += (hint.empty() ? "" : " ") + std::string("default=") + default_value.dump();
        }

        out_ << "Enter value for " << title << " (" << hint << ") "
             << (is_required ? "[required]" : "[optional]") << ": " << std::flush;
        std::string text = read_line();

        if (text.empty()) {
            if (is_required || (property.is_object() && property.contains("default"))) {
                args[name] = default_value;
            }
            continue;
        }
        args[name] = coerce(text, property);
    }
    return args;
}

} // namespace mcp_inspector
