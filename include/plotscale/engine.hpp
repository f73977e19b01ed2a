#pragma once

#include <plotscale/config.hpp>
#include <plotscale/plottable.hpp>
#include <plotscale/results.hpp>
#include <plotscale/types.hpp>
#include <span>
#include <vector>

namespace plotscale
{

// Turns a dataset plus a drawing-area size into screen coordinates for one
// chart kind. Holds only its immutable config, so every call is a pure
// function of its arguments and calls may run concurrently.
//
//   plotscale::NormalizationEngine engine;
//   std::vector<plotscale::DataPoint<double>> pts = {{1, 2}, {2, -1}, {3, 4}};
//   auto chart = engine.normalize(plotscale::ChartKind::Bar, pts, {320, 200});
//   for (const auto& bar : chart.bars()->bars)
//       draw_rect(bar.left, bar.span.top, bar.width, bar.span.length);
//
// Errors: EmptyDatasetError for zero points, InvalidValueError for a NaN or
// infinite projection, NormalizeError(InvalidGeometry) for a negative or
// non-finite size. Nothing is caught internally.
class NormalizationEngine
{
   public:
    // Throws NormalizeError(InvalidConfig) if config.validate() fails.
    explicit NormalizationEngine(NormalizeConfig config = {});

    const NormalizeConfig& config() const { return config_; }

    // Line and point charts.
    [[nodiscard]] ScaleResult normalize_points(std::span<const ProjectedPoint> points,
                                               const Geometry&                 geometry) const;

    // One bar per point, laid out in equal slots by input index.
    [[nodiscard]] BarResult normalize_bars(std::span<const ProjectedPoint> points,
                                           const Geometry&                 geometry) const;

    // Points sharing an x-key stack into one column. key_weights, when
    // given, sets each group's relative slot width (first-seen key order).
    [[nodiscard]] StackedBarResult normalize_stacked(std::span<const ProjectedPoint> points,
                                                     const Geometry&                 geometry,
                                                     std::span<const double> key_weights = {}) const;

    [[nodiscard]] NormalizedChart normalize(ChartKind                       kind,
                                            std::span<const ProjectedPoint> points,
                                            const Geometry&                 geometry) const;

    template <typename X, typename Y>
    [[nodiscard]] NormalizedChart normalize(ChartKind                         kind,
                                            std::span<const DataPoint<X, Y>> points,
                                            const Geometry&                   geometry) const
    {
        auto projected = project_points(points);
        return normalize(kind, std::span<const ProjectedPoint>(projected), geometry);
    }

    template <typename X, typename Y>
    [[nodiscard]] NormalizedChart normalize(ChartKind                           kind,
                                            const std::vector<DataPoint<X, Y>>& points,
                                            const Geometry&                     geometry) const
    {
        return normalize(kind, std::span<const DataPoint<X, Y>>(points), geometry);
    }

   private:
    NormalizeConfig config_;

    // Drawing area after padding; also validates the geometry.
    Geometry inner_geometry(const Geometry& geometry) const;
};

// Throws NormalizeError(InvalidGeometry) for negative or non-finite sizes.
void require_valid_geometry(const Geometry& geometry);

}   // namespace plotscale
