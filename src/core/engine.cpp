#include <plotscale/engine.hpp>

#include <algorithm>
#include <cmath>
#include <plotscale/bar_scale.hpp>
#include <plotscale/baseline.hpp>
#include <plotscale/errors.hpp>
#include <plotscale/extent.hpp>
#include <plotscale/linear_scale.hpp>
#include <plotscale/logger.hpp>
#include <plotscale/stack.hpp>

namespace plotscale
{

const char* chart_kind_name(ChartKind kind)
{
    switch (kind)
    {
        case ChartKind::Line:
            return "line";
        case ChartKind::Point:
            return "point";
        case ChartKind::Bar:
            return "bar";
        case ChartKind::StackedBar:
            return "stackedBar";
    }
    return "unknown";
}

double NormalizedChart::baseline() const
{
    return std::visit([](const auto& r) { return r.baseline; }, data);
}

void require_valid_geometry(const Geometry& geometry)
{
    bool ok = std::isfinite(geometry.width) && std::isfinite(geometry.height)
              && geometry.width >= 0.0 && geometry.height >= 0.0;
    if (ok)
        return;
    PLOTSCALE_LOG_ERROR("engine", "invalid geometry {}x{}", geometry.width, geometry.height);
    throw NormalizeError(ErrorCode::InvalidGeometry,
                         Logger::format_message("geometry must be finite and non-negative, got {}x{}",
                                                geometry.width,
                                                geometry.height));
}

NormalizationEngine::NormalizationEngine(NormalizeConfig config) : config_(config)
{
    config_.validate();
}

Geometry NormalizationEngine::inner_geometry(const Geometry& geometry) const
{
    require_valid_geometry(geometry);
    double inset = config_.padding * 2.0;
    return {std::max(geometry.width - inset, 0.0), std::max(geometry.height - inset, 0.0)};
}

// ─── Line / point ───────────────────────────────────────────────────────────

ScaleResult NormalizationEngine::normalize_points(std::span<const ProjectedPoint> points,
                                                  const Geometry&                 geometry) const
{
    Geometry area = inner_geometry(geometry);
    require_finite_points(points);

    ScaleResult result;
    result.extents = compute_extents(points);

    const double eps = config_.epsilon;
    const double pad = config_.padding;

    result.positions.reserve(points.size());
    for (const auto& p : points)
    {
        ScreenPoint s = data_to_screen(p, result.extents, area, eps);
        result.positions.push_back({s.x + pad, s.y + pad});
    }

    result.baseline = baseline_y(result.extents.y, area.height, eps) + pad;
    result.origin_x = origin_x(result.extents.x, area.width, eps) + pad;

    PLOTSCALE_LOG_DEBUG("engine",
                        "points: n={} area={}x{} baseline={} origin_x={}",
                        points.size(),
                        area.width,
                        area.height,
                        result.baseline,
                        result.origin_x);
    return result;
}

// ─── Bars ───────────────────────────────────────────────────────────────────

BarResult NormalizationEngine::normalize_bars(std::span<const ProjectedPoint> points,
                                              const Geometry&                 geometry) const
{
    Geometry area = inner_geometry(geometry);
    require_finite_points(points);

    BarResult result;
    result.extents = compute_extents(points);

    const double eps      = config_.epsilon;
    const double pad      = config_.padding;
    const double baseline = baseline_y(result.extents.y, area.height, eps);

    SignAwareBarScaler scaler(result.extents.y, area.height, baseline, eps);
    result.baseline       = baseline + pad;
    result.positive_scale = scaler.positive_scale();
    result.negative_scale = scaler.negative_scale();

    const double slot_w = area.width / static_cast<double>(points.size());
    const double bar_w  = slot_w * config_.bar_width_ratio;

    result.bars.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i)
    {
        BarGeometry bar;
        bar.index = i;
        bar.value = points[i].y;
        bar.left  = pad + slot_w * static_cast<double>(i) + (slot_w - bar_w) * 0.5;
        bar.width = bar_w;
        bar.span  = scaler.scale(points[i].y);
        bar.span.top += pad;
        bar.span.bottom += pad;
        result.bars.push_back(bar);
    }

    PLOTSCALE_LOG_DEBUG("engine",
                        "bars: n={} baseline={} scale +{} -{}",
                        points.size(),
                        result.baseline,
                        result.positive_scale,
                        result.negative_scale);
    return result;
}

// ─── Stacked bars ───────────────────────────────────────────────────────────

StackedBarResult NormalizationEngine::normalize_stacked(std::span<const ProjectedPoint> points,
                                                        const Geometry&                 geometry,
                                                        std::span<const double> key_weights) const
{
    Geometry area = inner_geometry(geometry);
    require_finite_points(points);

    StackAggregator  aggregator(config_.stack_key_quantum);
    StackedBarResult result;
    result.groups         = aggregator.stack(points, key_weights);
    result.stacked_extent = StackAggregator::stacked_extent(result.groups);

    const double eps      = config_.epsilon;
    const double pad      = config_.padding;
    const double baseline = baseline_y(result.stacked_extent, area.height, eps);

    SignAwareBarScaler scaler(result.stacked_extent, area.height, baseline, eps);
    result.baseline       = baseline + pad;
    result.positive_scale = scaler.positive_scale();
    result.negative_scale = scaler.negative_scale();

    result.segments.reserve(points.size());
    for (size_t g = 0; g < result.groups.size(); ++g)
    {
        const StackedGroup& group  = result.groups[g];
        const double        slot_w = group.width * area.width;
        const double        bar_w  = slot_w * config_.bar_width_ratio;
        const double        left   = pad + group.offset * area.width - bar_w * 0.5;

        for (const auto& seg : group.segments)
        {
            SegmentRect rect;
            rect.group = g;
            rect.index = seg.index;
            rect.left  = left;
            rect.width = bar_w;
            if (seg.value >= 0.0)
            {
                rect.top    = scaler.scale(seg.end).top;
                rect.bottom = scaler.scale(seg.start).top;
            }
            else
            {
                rect.top    = scaler.scale(seg.start).bottom;
                rect.bottom = scaler.scale(seg.end).bottom;
            }
            rect.top += pad;
            rect.bottom += pad;
            result.segments.push_back(rect);
        }
    }

    PLOTSCALE_LOG_DEBUG("engine",
                        "stacked: n={} groups={} extent={}..{} baseline={}",
                        points.size(),
                        result.groups.size(),
                        result.stacked_extent.min,
                        result.stacked_extent.max,
                        result.baseline);
    return result;
}

// ─── Dispatch ───────────────────────────────────────────────────────────────

NormalizedChart NormalizationEngine::normalize(ChartKind                       kind,
                                               std::span<const ProjectedPoint> points,
                                               const Geometry&                 geometry) const
{
    NormalizedChart chart;
    chart.kind = kind;
    switch (kind)
    {
        case ChartKind::Line:
        case ChartKind::Point:
            chart.data = normalize_points(points, geometry);
            break;
        case ChartKind::Bar:
            chart.data = normalize_bars(points, geometry);
            break;
        case ChartKind::StackedBar:
            chart.data = normalize_stacked(points, geometry);
            break;
    }
    return chart;
}

}   // namespace plotscale
