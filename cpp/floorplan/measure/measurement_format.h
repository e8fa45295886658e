#pragma once

#include "floorplan/core/util.h"

#include <optional>
#include <string>
#include <string_view>

namespace floorplan {

// Lengths are stored as whole eighths of an inch for display.

// 604 -> 6'3½"   576 -> 6'   4 -> ½"   0 -> 0"
std::string formatEighths(int eighths);

// Accepts feet/inch forms such as 6'3", 6' 3 1/2", 6'3½", 75", 3/4 and 12.5.
// Anything else (including a zero denominator) is nullopt.
std::optional<int> parseToEighths(std::string_view text);

int inchesToEighths(float inches) noexcept;
float eighthsToInches(int eighths) noexcept;

} // namespace floorplan
