#include <plotscale/baseline.hpp>

#include <algorithm>
#include <plotscale/linear_scale.hpp>

namespace plotscale
{

double baseline_y(const Extent& y_extent, double height, double epsilon)
{
    return std::clamp(map_y(0.0, y_extent, height, epsilon), 0.0, height);
}

double origin_x(const Extent& x_extent, double width, double epsilon)
{
    return std::clamp(map_x(0.0, x_extent, width, epsilon), 0.0, width);
}

}   // namespace plotscale
