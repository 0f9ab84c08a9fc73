#pragma once

namespace courier::core {

/**
 * @brief Builds one visitor out of several lambdas, one per variant alternative.
 *
 * @code
 * std::visit(overload{
 *   [](const persistence::written &evt) { ... },
 *   [](const persistence::stopped &) { ... }
 * }, completion);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace courier::core
