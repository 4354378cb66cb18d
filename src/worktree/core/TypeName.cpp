#include "worktree/core/TypeName.hpp"

#include <cstdlib>
#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace WT {

auto demangle(char const* mangled) -> std::string {
#if defined(__GNUG__)
    int   status = 0;
    char* dem    = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && dem) {
        std::string out{dem};
        std::free(dem);
        return out;
    }
    if (dem) {
        std::free(dem);
    }
#endif
    return mangled;
}

} // namespace WT
