#pragma once

#include <autograder/discovery/test_group.hpp>          // IWYU pragma: export
#include <autograder/grading_session.hpp>               // IWYU pragma: export
#include <autograder/logging.hpp>                       // IWYU pragma: export
#include <autograder/project/multi_project.hpp>         // IWYU pragma: export
#include <autograder/project/project.hpp>               // IWYU pragma: export
#include <autograder/test/test_spec.hpp>                // IWYU pragma: export

#include <chrono>  // IWYU pragma: export
#include <memory>  // IWYU pragma: export
#include <string>  // IWYU pragma: export
#include <utility> // IWYU pragma: export
#include <vector>  // IWYU pragma: export

// should always include last, as the macro relies on everything above
#include <autograder/registrars/global_registrar.hpp> // IWYU pragma: export
