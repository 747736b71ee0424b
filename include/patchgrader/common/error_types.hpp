#pragma once

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>

namespace patchgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Operation surpassed its timeout
    NotFound,       ///< A container, image or file does not exist
    CommandFailed,  ///< An external command ran but exited with a non-zero status
    SyscallFailure, ///< A Linux syscall failed
    BadConfig,      ///< Malformed or missing configuration / input data
    UnknownError,   ///< As named; use this as little as possible
};

PATCHGRADER_ENUM_NAMES(ErrorKind,                              //
                       {ErrorKind::TimedOut, "TimedOut"},       //
                       {ErrorKind::NotFound, "NotFound"},       //
                       {ErrorKind::CommandFailed, "CommandFailed"},
                       {ErrorKind::SyscallFailure, "SyscallFailure"},
                       {ErrorKind::BadConfig, "BadConfig"},
                       {ErrorKind::UnknownError, "UnknownError"});

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace patchgrader

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::patchgrader::ErrorKind;                                                                       \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
