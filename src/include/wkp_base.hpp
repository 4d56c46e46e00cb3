#pragma once
/**
 * @file wkp_base.hpp
 * @brief Layer 1: Basic utilities shared by every pool component.
 *
 * Provides the asynchronous Logger and its LOGGER_* macros, Result<T, E>,
 * backoff strategies and instance id generation.
 * Include this when you need logging or the utility types without the pool.
 */
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
#include "utils/uid_utils.hpp"
