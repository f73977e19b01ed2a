#include <plotscale/plottable.hpp>

#include <cmath>
#include <plotscale/errors.hpp>
#include <plotscale/logger.hpp>

namespace plotscale
{

void require_finite(double value, const char* axis, size_t index)
{
    if (std::isfinite(value))
        return;
    PLOTSCALE_LOG_ERROR("engine", "rejecting non-finite {} value at index {}", axis, index);
    throw InvalidValueError(axis, index, value);
}

void require_same_length(size_t x_count, size_t y_count)
{
    if (x_count == y_count)
        return;
    PLOTSCALE_LOG_ERROR("engine", "column length mismatch: {} x values, {} y values", x_count, y_count);
    throw NormalizeError(ErrorCode::InvalidValue,
                         Logger::format_message("x has {} values but y has {}", x_count, y_count));
}

void require_finite_points(std::span<const ProjectedPoint> points)
{
    for (size_t i = 0; i < points.size(); ++i)
    {
        require_finite(points[i].x, "x", i);
        require_finite(points[i].y, "y", i);
    }
}

}   // namespace plotscale
