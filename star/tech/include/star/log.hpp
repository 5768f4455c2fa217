#pragma once

// Logging facade: every module logs through star::log, which is spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace star {

namespace log = spdlog;

}  // namespace star
