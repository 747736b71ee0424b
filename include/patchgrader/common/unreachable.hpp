#pragma once

#include <utility>

#ifdef __cpp_lib_unreachable
namespace patchgrader {
using std::unreachable;
} // namespace patchgrader
#else

namespace patchgrader {

// Example implemention from cppreference
[[noreturn]] inline void unreachable() {
    __builtin_unreachable();
}

} // namespace patchgrader

#endif
