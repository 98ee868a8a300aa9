#pragma once

namespace mcp_inspector {

/**
 * @brief Combine lambdas into one visitor for std::visit
 */
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace mcp_inspector
