#pragma once

namespace ogmo::core {

// Visitor built from a set of lambdas, for std::visit over the schema variants.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace ogmo::core
