#pragma once

#include "core/Message.hpp"
#include <string>
#include <variant>

namespace mcp_inspector {

/**
 * @brief A line that could not be decoded as a JSON-RPC 2.0 message
 *
 * Not an exception: parse errors are routed to raw output by the caller.
 */
struct ParseError {
    std::string raw_text;
    std::string reason;
};

using DecodeResult = std::variant<Message, ParseError>;

/**
 * @brief Newline-delimited JSON-RPC 2.0 framing
 *
 * Each message is one compact JSON object followed by a single '\n'.
 * Decoding is strict about the JSON-RPC envelope and never throws.
 */
class FrameCodec {
public:
    /**
     * @brief Encode a message as one line including the trailing newline
     */
    static std::string encode(const Message& message);

    /**
     * @brief Decode one line (without its terminator)
     *
     * A trailing '\r' is ignored. Anything that is not a JSON object with
     * jsonrpc "2.0" and either a method, or an id with result/error, is a
     * ParseError carrying the original text.
     */
    static DecodeResult decode_line(const std::string& line);
};

} // namespace mcp_inspector
