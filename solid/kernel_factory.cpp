#include "solid_kernel.hpp"
#include "null_kernel.hpp"

#ifdef SPIROB_HAS_OCCT
#include "occt_kernel.hpp"
#endif

namespace spirob {

#ifdef SPIROB_HAS_OCCT

std::unique_ptr<SolidKernel> make_solid_kernel() {
    return std::make_unique<OcctSolidKernel>();
}

bool solid_kernel_available() {
    return true;
}

#else  // SPIROB_HAS_OCCT not defined

std::unique_ptr<SolidKernel> make_solid_kernel() {
    return std::make_unique<NullSolidKernel>();
}

bool solid_kernel_available() {
    return false;
}

#endif  // SPIROB_HAS_OCCT

}  // namespace spirob
