#include <plotscale/bar_scale.hpp>

#include <algorithm>
#include <cmath>

namespace plotscale
{

SignAwareBarScaler::SignAwareBarScaler(const Extent& y_extent,
                                       double        height,
                                       double        baseline,
                                       double        epsilon)
    : baseline_(baseline)
{
    double above = baseline;
    double below = height - baseline;

    positive_scale_ = above / std::max(y_extent.max, epsilon);
    negative_scale_ = below / std::max(std::abs(y_extent.min), epsilon);
}

BarSpan SignAwareBarScaler::scale(double value) const
{
    BarSpan span;
    if (value >= 0.0)
    {
        span.length    = value * positive_scale_;
        span.direction = BarDirection::Up;
        span.top       = baseline_ - span.length;
        span.bottom    = baseline_;
    }
    else
    {
        span.length    = std::abs(value) * negative_scale_;
        span.direction = BarDirection::Down;
        span.top       = baseline_;
        span.bottom    = baseline_ + span.length;
    }
    return span;
}

}   // namespace plotscale
