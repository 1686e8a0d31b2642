#include "wisched/io/format.hpp"
#include <sstream>

namespace wisched {
namespace io {

std::string format_interval(const Interval& interval) {
    return interval.to_string();
}

std::string format_schedule(const Schedule& schedule) {
    std::ostringstream oss;
    for (const auto& interval : schedule.intervals) {
        oss << format_interval(interval) << "\n";
    }
    return oss.str();
}

std::string format_summary(const Schedule& schedule) {
    std::ostringstream oss;
    oss << "Total cost is " << schedule.total_cost << ", using " << schedule.size()
        << (schedule.size() == 1 ? " interval." : " intervals.");
    return oss.str();
}

} // namespace io
} // namespace wisched
