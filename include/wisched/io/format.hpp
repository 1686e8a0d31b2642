#pragma once

#include "../scheduler.hpp"
#include <string>

namespace wisched {
namespace io {

std::string format_interval(const Interval& interval);

// One interval per line, path order, trailing newline per line
std::string format_schedule(const Schedule& schedule);

// "Total cost is C, using N interval(s)."
std::string format_summary(const Schedule& schedule);

} // namespace io
} // namespace wisched
