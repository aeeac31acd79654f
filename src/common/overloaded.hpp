#pragma once

namespace polykv {

// Builds a visitor from a set of lambdas, one per variant alternative:
//
//   std::visit(Overloaded{
//       [](const GetCmd& c) { ... },
//       [](const SetCmd& c) { ... },
//   }, cmd);
//
// std::visit fails to compile if an alternative has no matching lambda.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace polykv
