#pragma once

#include <plotscale/types.hpp>

namespace plotscale
{

// Coordinate mapping from domain space to screen space.
// Pipeline: domain value → normalized [0, 1] → screen units.
//
//   x: normalized * width            (left to right)
//   y: height - normalized * height  (larger values sit higher on screen)

// Domain window actually used for division.
//
//   min < max:  lo = min, range = max(max - min, epsilon)
//   min == max: centred on the value v, range = max(epsilon, 2|v|), so v
//               lands on the midpoint and 0 on the nearer edge (or the
//               midpoint too when v == 0)
//
// Stored at half scale: any pair of finite bounds gives a finite window.
struct ScaleDomain
{
    double half_lo    = 0.0;
    double half_range = 0.5;

    double lo() const { return half_lo * 2.0; }
    double range() const { return half_range * 2.0; }
};

ScaleDomain floored_domain(const Extent& extent, double epsilon = DEFAULT_EPSILON);

// extent.min → 0 always; extent.max → 1 when max - min >= epsilon;
// a single-valued extent maps its value to 0.5.
double normalize_value(double value, const Extent& extent, double epsilon = DEFAULT_EPSILON);

double map_x(double value, const Extent& extent, double width, double epsilon = DEFAULT_EPSILON);
double map_y(double value, const Extent& extent, double height, double epsilon = DEFAULT_EPSILON);

// Convenience: both axes in one step.
ScreenPoint data_to_screen(const ProjectedPoint& p,
                           const AxisExtents&    extents,
                           const Geometry&       geometry,
                           double                epsilon = DEFAULT_EPSILON);

}   // namespace plotscale
