#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace trivium {
namespace utils {

/// Epoch milliseconds (UTC) -> "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string formatIso8601(int64_t epoch_ms);

/// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" with optional ".fff" and "Z".
/// Offsets other than Z are not supported; calendar-invalid dates (2024-02-31) yield nullopt.
std::optional<int64_t> parseIso8601(const std::string& s);

/// Current wall clock in epoch milliseconds
int64_t nowEpochMs();

} // namespace utils
} // namespace trivium
