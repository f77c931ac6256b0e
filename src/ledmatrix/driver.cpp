#include <ledmatrix/driver.h>
#include <ledmatrix/matrix-options.h>
#include <ledmatrix/virtual-driver.h>
#include <ytrace/ytrace.hpp>

#ifdef LEDMATRIX_HAS_RGB_MATRIX
#include "rgb-matrix-driver.h"
#endif

namespace ledmatrix {

Result<Driver::Ptr> Driver::create(const MatrixOptions& options,
                                   const RuntimeOptions& runtimeOptions) noexcept {
    const std::string& name = runtimeOptions.driver();
    ydebug("Driver::create: backend '{}'", name);

    if (name == RuntimeOptions::DRIVER_VIRTUAL) {
        auto res = VirtualDriver::create(options, runtimeOptions);
        if (!res) {
            return Err<Ptr>("Failed to create virtual driver", res);
        }
        return Ok(Ptr(*res));
    }

#ifdef LEDMATRIX_HAS_RGB_MATRIX
    if (name == RuntimeOptions::DRIVER_RGB_MATRIX) {
        auto res = RgbMatrixDriver::create(options, runtimeOptions);
        if (!res) {
            return Err<Ptr>("Failed to create rgb-matrix driver", res);
        }
        return Ok(*res);
    }
#endif

    yerror("Driver::create: unknown or unavailable backend '{}'", name);
    return Err<Ptr>("Unknown driver backend: " + name);
}

} // namespace ledmatrix
