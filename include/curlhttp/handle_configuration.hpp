#pragma once

#include "config.hpp"
#include "handle.hpp"
#include "result.hpp"

namespace curlhttp {

    /// @brief Apply every persistent option of @p config to @p handle.
    ///
    /// Defaults are filled via HandleConfiguration::with_defaults() first, so
    /// a handle configured at creation and one reconfigured after reset end
    /// up identical. Each call overwrites every option it touches.
    ///
    /// @return The first failure, as a Configuration error naming the option.
    Result<void> apply_configuration(Handle& handle,
                                     const HandleConfiguration& config);

}  // namespace curlhttp
