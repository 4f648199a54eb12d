#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>
#include <fmt/format.h>

#include <optional>
#include <string_view>
#include <type_traits>

namespace autograder {

template <typename Enum>
concept DescribedEnum = std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value;

// See: https://www.boost.org/doc/libs/1_81_0/libs/describe/doc/html/describe.html#example_printing_enums_ct
template <DescribedEnum Enum>
constexpr std::optional<std::string_view> enum_to_string(Enum enumerator) {
    std::optional<std::string_view> res;

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Enum>>([&](auto descriptor) {
        if (enumerator == descriptor.value) {
            res = descriptor.name;
        }
    });

    return res;
}

} // namespace autograder

/// Formats any enum described with BOOST_DESCRIBE_ENUM / BOOST_DEFINE_ENUM_CLASS by its enumerator name
template <autograder::DescribedEnum Enum>
struct fmt::formatter<Enum> : fmt::formatter<std::string_view>
{
    auto format(const Enum& from, fmt::format_context& ctx) const {
        if (auto name = autograder::enum_to_string(from)) {
            return fmt::formatter<std::string_view>::format(*name, ctx);
        }

        return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
    }
};
