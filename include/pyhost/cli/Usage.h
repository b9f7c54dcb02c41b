#pragma once

#include <string>

namespace pyhost::cli {

    std::string Usage();

} // namespace pyhost::cli
