#pragma once

#include <cstddef>
#include <plotscale/types.hpp>
#include <variant>
#include <vector>

namespace plotscale
{

// ─── Line / point charts ────────────────────────────────────────────────────

struct ScaleResult
{
    std::vector<ScreenPoint> positions;   // one per input point, input order
    double                   baseline = 0.0;   // screen y of domain 0
    double                   origin_x = 0.0;   // screen x of domain 0
    AxisExtents              extents;
};

// ─── Bar charts ─────────────────────────────────────────────────────────────

enum class BarDirection
{
    Up,     // v >= 0: grows from the baseline toward the top of the area
    Down,   // v <  0: grows from the baseline toward the bottom
};

// One bar measured from the baseline, in screen units.
struct BarSpan
{
    double       length    = 0.0;
    BarDirection direction = BarDirection::Up;
    double       top       = 0.0;   // top <= bottom
    double       bottom    = 0.0;
};

struct BarGeometry
{
    size_t  index = 0;     // source point
    double  value = 0.0;   // y projection
    double  left  = 0.0;   // screen x of the bar's left edge
    double  width = 0.0;
    BarSpan span;

    double center_x() const { return left + width * 0.5; }
};

struct BarResult
{
    std::vector<BarGeometry> bars;   // one per input point, input order
    double                   baseline       = 0.0;
    double                   positive_scale = 0.0;   // screen units per domain unit above 0
    double                   negative_scale = 0.0;   // screen units per domain unit below 0
    AxisExtents              extents;
};

// ─── Stacked bar charts ─────────────────────────────────────────────────────

// One input point's share of a stacked group, in domain units.
// Positive values stack upward from 0, negative values downward from 0,
// so start/end are cumulative positions rather than the raw value.
struct StackSegment
{
    size_t index = 0;
    double value = 0.0;
    double start = 0.0;
    double end   = 0.0;
};

struct StackedGroup
{
    double key = 0.0;   // x projection shared by the group (after quantization)
    double sum = 0.0;   // y values summed in input order

    // Fractions of the x-extent: the slot allotted to this key, and the
    // centre of that slot measured from the left edge.
    double width  = 0.0;
    double offset = 0.0;

    double positive_total = 0.0;
    double negative_total = 0.0;

    std::vector<StackSegment> segments;
};

// Screen rectangle of one segment.
struct SegmentRect
{
    size_t group = 0;   // index into StackedBarResult::groups
    size_t index = 0;   // source point
    double left   = 0.0;
    double width  = 0.0;
    double top    = 0.0;
    double bottom = 0.0;
};

struct StackedBarResult
{
    std::vector<StackedGroup> groups;     // first-seen key order
    std::vector<SegmentRect>  segments;   // group order, then input order
    double                    baseline       = 0.0;
    double                    positive_scale = 0.0;
    double                    negative_scale = 0.0;
    Extent                    stacked_extent;
};

// ─── Any chart ──────────────────────────────────────────────────────────────

struct NormalizedChart
{
    ChartKind                                             kind = ChartKind::Line;
    std::variant<ScaleResult, BarResult, StackedBarResult> data;

    const ScaleResult*      scale() const { return std::get_if<ScaleResult>(&data); }
    const BarResult*        bars() const { return std::get_if<BarResult>(&data); }
    const StackedBarResult* stacked() const { return std::get_if<StackedBarResult>(&data); }

    double baseline() const;
};

}   // namespace plotscale
