#pragma once

namespace llmchat {

// Builds an overload set out of lambdas, for use with std::visit.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace llmchat
