#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for the common foundation layer.
///
/// Error codes, AuthError/AuthResult, the injectable clock and
/// YAML configuration management.

#include "ocs/foundation/auth_error.hpp"
#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/foundation/config_manager.hpp"
#include "ocs/foundation/error_code.hpp"
