#include "FrameCodec.hpp"
#include <cstdint>
#include <limits>

namespace mcp_inspector {

namespace {

ParseError parse_error(const std::string& raw, const std::string& reason) {
    return ParseError{raw, reason};
}

bool is_valid_id(const json& id) {
    return id.is_number_integer() || id.is_string();
}

// JSON-RPC error codes are 32-bit integers
bool fits_int(const json& code) {
    if (code.is_number_unsigned()) {
        return code.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    auto value = code.get<std::int64_t>();
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

} // namespace

std::string FrameCodec::encode(const Message& message) {
    return to_json(message).dump() + "\n";
}

DecodeResult FrameCodec::decode_line(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    if (text.empty()) {
        return parse_error(line, "empty line");
    }

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return parse_error(line, "not valid JSON");
    }
    if (!j.is_object()) {
        return parse_error(line, "not a JSON object");
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() || *version != "2.0") {
        return parse_error(line, "missing or invalid jsonrpc field");
    }

    std::optional<json> params;
    if (j.contains("params")) {
        params = j["params"];
    }

    if (j.contains("method")) {
        if (!j["method"].is_string()) {
            return parse_error(line, "method is not a string");
        }
        std::string method = j["method"];

        if (!j.contains("id")) {
            return Message{Notification{method, params}};
        }
        if (!is_valid_id(j["id"])) {
            return parse_error(line, "request id must be an integer or string");
        }
        return Message{Request{j["id"], method, params}};
    }

    if (!j.contains("id")) {
        return parse_error(line, "neither method nor id present");
    }

    const json& id = j["id"];
    if (!is_valid_id(id) && !id.is_null()) {
        return parse_error(line, "response id must be an integer, string or null");
    }

    bool has_result = j.contains("result");
    bool has_error = j.contains("error");
    if (has_result == has_error) {
        return parse_error(line, "response must carry exactly one of result or error");
    }

    if (has_result) {
        return Message{Response{id, j["result"], std::nullopt}};
    }

    const json& err = j["error"];
    if (!err.is_object() || !err.contains("code") || !err["code"].is_number_integer() ||
        !err.contains("message") || !err["message"].is_string()) {
        return parse_error(line, "malformed error object");
    }
    if (!fits_int(err["code"])) {
        return parse_error(line, "error code out of range");
    }

    RpcError error;
    error.code = err["code"].get<int>();
    error.message = err["message"].get<std::string>();
    if (err.contains("data")) {
        error.data = err["data"];
    }
    return Message{Response{id, std::nullopt, error}};
}

} // namespace mcp_inspector
