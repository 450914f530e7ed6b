#pragma once

/// @file logger_adapter.hpp
/// @brief Aggregate header for category-based logging over kcenon's
/// common_system logger interfaces.

#include "ocs/foundation/server_logger.hpp"
