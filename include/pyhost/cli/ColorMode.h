#pragma once

namespace pyhost::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace pyhost::cli
