#pragma once

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

namespace mcp_inspector {

using json = nlohmann::json;

/**
 * @brief Builds tool/prompt arguments interactively from a JSON Schema
 */
class ArgumentPrompter {
public:
    ArgumentPrompter(std::istream& in, std::ostream& out);

    /**
     * @brief Ask for a value per schema property
     *
     * No properties: returns {} without asking. Only optional properties:
     * asks once whether to enter values; if not, fills every property with
     * its default. Otherwise asks for each property in turn.
     *
     * @param schema JSON Schema object with "properties" and "required"
     * @return Argument object
     */
    json prompt(const json& schema);

    /**
     * @brief Explicit "default", else a type-based default (0, false, [], {}, "")
     */
    static json infer_default(const json& property);

    /**
     * @brief Interpret user text according to the property's type
     *
     * Valid JSON is taken as-is; otherwise integers and numbers are parsed
     * (0 on failure), booleans accept 1/true/yes/y, anything else is a string.
     */
    static json coerce(const std::string& text, const json& property);

private:
    std::string read_line();

    std::istream& in_;
    std::ostream& out_;
};

} // namespace mcp_inspector
