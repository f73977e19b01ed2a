#include <plotscale/extent.hpp>

#include <algorithm>
#include <plotscale/errors.hpp>
#include <plotscale/logger.hpp>

namespace plotscale
{

Extent compute_extent(std::span<const double> values)
{
    if (values.empty())
    {
        PLOTSCALE_LOG_ERROR("extent", "compute_extent: empty input");
        throw EmptyDatasetError("compute_extent");
    }

    Extent e{values[0], values[0]};
    for (size_t i = 1; i < values.size(); ++i)
    {
        e.min = std::min(e.min, values[i]);
        e.max = std::max(e.max, values[i]);
    }
    return e;
}

AxisExtents compute_extents(std::span<const ProjectedPoint> points)
{
    if (points.empty())
    {
        PLOTSCALE_LOG_ERROR("extent", "compute_extents: empty input");
        throw EmptyDatasetError("compute_extents");
    }

    AxisExtents e{{points[0].x, points[0].x}, {points[0].y, points[0].y}};
    for (const auto& p : points.subspan(1))
    {
        e.x.min = std::min(e.x.min, p.x);
        e.x.max = std::max(e.x.max, p.x);
        e.y.min = std::min(e.y.min, p.y);
        e.y.max = std::max(e.y.max, p.y);
    }

    if (e.x.degenerate() || e.y.degenerate())
    {
        PLOTSCALE_LOG_DEBUG("extent",
                            "degenerate extent over {} points (x: {}..{}, y: {}..{})",
                            points.size(),
                            e.x.min,
                            e.x.max,
                            e.y.min,
                            e.y.max);
    }
    return e;
}

Extent merge_extents(const Extent& a, const Extent& b)
{
    return {std::min(a.min, b.min), std::max(a.max, b.max)};
}

}   // namespace plotscale
