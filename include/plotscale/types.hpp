#pragma once

#include <cstddef>

namespace plotscale
{

// Default minimum-range floor, in domain units.
inline constexpr double DEFAULT_EPSILON = 1e-3;

// Inclusive [min, max] range of one numeric axis. min == max is a valid,
// degenerate extent; the scale mapper floors its range instead of dividing by 0.
struct Extent
{
    double min = 0.0;
    double max = 0.0;

    bool degenerate() const { return max == min; }

    bool operator==(const Extent&) const = default;
};

struct AxisExtents
{
    Extent x;
    Extent y;

    bool operator==(const AxisExtents&) const = default;
};

// Target drawing area, in screen units.
struct Geometry
{
    double width  = 0.0;
    double height = 0.0;

    bool operator==(const Geometry&) const = default;
};

// Screen space: origin top-left, y grows downward.
struct ScreenPoint
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(const ScreenPoint&) const = default;
};

// A data point after projection: both coordinates are finite doubles.
struct ProjectedPoint
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(const ProjectedPoint&) const = default;
};

enum class ChartKind
{
    Line,
    Point,
    Bar,
    StackedBar,
};

const char* chart_kind_name(ChartKind kind);

}   // namespace plotscale
