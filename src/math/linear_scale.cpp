#include <plotscale/linear_scale.hpp>

#include <algorithm>
#include <cmath>

namespace plotscale
{

ScaleDomain floored_domain(const Extent& extent, double epsilon)
{
    ScaleDomain d;
    if (extent.degenerate())
    {
        d.half_range = std::max(epsilon * 0.5, std::abs(extent.min));
        d.half_lo    = extent.min * 0.5 - d.half_range * 0.5;
        return d;
    }

    double half_span = extent.max * 0.5 - extent.min * 0.5;
    d.half_range     = std::max(half_span, epsilon * 0.5);
    d.half_lo        = extent.min * 0.5;
    return d;
}

double normalize_value(double value, const Extent& extent, double epsilon)
{
    ScaleDomain d = floored_domain(extent, epsilon);
    return (value * 0.5 - d.half_lo) / d.half_range;
}

double map_x(double value, const Extent& extent, double width, double epsilon)
{
    return normalize_value(value, extent, epsilon) * width;
}

double map_y(double value, const Extent& extent, double height, double epsilon)
{
    return height - normalize_value(value, extent, epsilon) * height;
}

ScreenPoint data_to_screen(const ProjectedPoint& p,
                           const AxisExtents&    extents,
                           const Geometry&       geometry,
                           double                epsilon)
{
    return {map_x(p.x, extents.x, geometry.width, epsilon),
            map_y(p.y, extents.y, geometry.height, epsilon)};
}

}   // namespace plotscale
