#pragma once

namespace autograder {

/// Visitor built from a set of lambdas, for use with std::visit
template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

} // namespace autograder
