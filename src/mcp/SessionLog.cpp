#include "SessionLog.hpp"

namespace mcp_inspector {

const char* to_string(StreamKind stream) {
    return stream == StreamKind::Stdout ? "stdout" : "stderr";
}

} // namespace mcp_inspector
