#pragma once

#include <cstdio>

namespace autograder {

bool is_color_terminal() noexcept;
bool in_terminal(FILE* file) noexcept;

} // namespace autograder
