// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <string>

namespace mindcast
{

/// @brief Formats a point in time as a fixed-width, lexically sortable file name component.
///
/// The format is `YYYYMMDD_HHMMSS_ffffff` (local time, microsecond precision).
[[nodiscard]] auto fileTimestamp(std::chrono::system_clock::time_point when) -> std::string;

/// @brief Returns fileTimestamp() for the current time.
[[nodiscard]] auto fileTimestamp() -> std::string;

/// @brief Returns the current local time as `YYYY-MM-DD HH:MM:SS` for log lines.
[[nodiscard]] auto logTimestamp() -> std::string;

} // namespace mindcast
