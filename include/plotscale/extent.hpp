#pragma once

#include <plotscale/types.hpp>
#include <span>

namespace plotscale
{

// Single O(n) scan; input order is irrelevant.
// Throws EmptyDatasetError on empty input.
[[nodiscard]] Extent compute_extent(std::span<const double> values);

// Both axes in one pass over the points.
[[nodiscard]] AxisExtents compute_extents(std::span<const ProjectedPoint> points);

// Smallest extent containing both a and b.
[[nodiscard]] Extent merge_extents(const Extent& a, const Extent& b);

}   // namespace plotscale
