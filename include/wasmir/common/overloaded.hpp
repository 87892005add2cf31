#pragma once

namespace wasmir {

// Lambda set for std::visit. Every alternative of the visited variant needs a
// matching overload, so a new IR node kind fails to compile at each use site
// until it is handled.
//
//   std::visit(Overloaded{
//       [](const Br& br) { ... },
//       [](const auto& other) { ... },
//   }, expr);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace wasmir
