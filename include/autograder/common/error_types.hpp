#pragma once

#include <autograder/common/expected.hpp>
#include <autograder/common/formatters/enum.hpp> // IWYU pragma: keep

#include <boost/describe/enum.hpp>
#include <boost/preprocessor/cat.hpp>

namespace autograder {

// NOLINTNEXTLINE
BOOST_DEFINE_ENUM_CLASS(ErrorKind,
                        TimedOut,       // Operation surpassed its (generally specified) timeout
                        SyscallFailure, // A Linux syscall failed
                        ExecFailure,    // The child process could not exec the requested command
                        UnknownError    // As named; use this as little as possible
);

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace autograder

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (ident.has_error()) {                                                                                       \
            using enum ::autograder::ErrorKind;                                                                        \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
