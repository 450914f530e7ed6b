#pragma once

/// @file ocs.hpp
/// @brief Umbrella header: version and the Result type.

#include "ocs/core/result.hpp"
#include "ocs/version.hpp"
