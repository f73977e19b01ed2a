#pragma once

#include <plotscale/types.hpp>

namespace plotscale
{

// Screen y of domain value 0, using exactly the mapping applied to the data
// points (map_y), clamped into [0, height]. A point with y == 0 always lies
// on it.
//   all-positive extent → height (bottom)
//   all-negative extent → 0 (top), unless max - min < epsilon and the
//                         floored window reaches past 0
//   mixed sign          → proportional position of 0
//   all-zero extent     → height / 2, where the points themselves sit
double baseline_y(const Extent& y_extent, double height, double epsilon = DEFAULT_EPSILON);

// Screen x of domain value 0 (where the vertical axis line goes), clamped
// into [0, width].
double origin_x(const Extent& x_extent, double width, double epsilon = DEFAULT_EPSILON);

}   // namespace plotscale
