#pragma once

// ─── plotscale ↔ Eigen ──────────────────────────────────────────────────────
//
// Pass Eigen column or row vectors straight to the engine as x and y columns.
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DPLOTSCALE_USE_EIGEN=ON
//
// Usage:
//
//   #include <plotscale/eigen.hpp>
//
//   Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(50, 0.0, 10.0);
//   Eigen::VectorXd y = x.array().sin();
//
//   plotscale::NormalizationEngine engine;
//   auto chart = plotscale::normalize(engine, plotscale::ChartKind::Line, x, y, {640, 480});
//
// ─────────────────────────────────────────────────────────────────────────────

#include <eigen3/Eigen/Core>
#include <plotscale/engine.hpp>
#include <plotscale/plottable.hpp>
#include <type_traits>
#include <vector>

namespace plotscale
{

namespace eigen_detail
{

// Any dense Eigen expression with one compile-time-fixed dimension equal to 1
// and an arithmetic scalar.
template <typename T, typename = void>
struct is_eigen_vector : std::false_type
{
};

template <typename T>
struct is_eigen_vector<
    T,
    std::enable_if_t<std::is_base_of_v<Eigen::DenseBase<std::decay_t<T>>, std::decay_t<T>>
                     && std::is_arithmetic_v<typename std::decay_t<T>::Scalar>
                     && (std::decay_t<T>::ColsAtCompileTime == 1
                         || std::decay_t<T>::RowsAtCompileTime == 1)>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_eigen_vector_v = is_eigen_vector<T>::value;

}   // namespace eigen_detail

// Projects paired Eigen vectors. Lazy expressions are read coefficient by
// coefficient, so strided maps and blocks need no .eval().
template <typename XDerived, typename YDerived>
auto project_eigen(const Eigen::DenseBase<XDerived>& x, const Eigen::DenseBase<YDerived>& y)
    -> std::enable_if_t<eigen_detail::is_eigen_vector_v<XDerived>
                            && eigen_detail::is_eigen_vector_v<YDerived>,
                        std::vector<ProjectedPoint>>
{
    const auto n = static_cast<size_t>(x.size());
    require_same_length(n, static_cast<size_t>(y.size()));

    std::vector<ProjectedPoint> out;
    out.reserve(n);
    for (Eigen::Index i = 0; i < x.size(); ++i)
    {
        double px = static_cast<double>(x.derived().coeff(i));
        double py = static_cast<double>(y.derived().coeff(i));
        require_finite(px, "x", static_cast<size_t>(i));
        require_finite(py, "y", static_cast<size_t>(i));
        out.push_back({px, py});
    }
    return out;
}

template <typename XDerived, typename YDerived>
auto normalize(const NormalizationEngine&        engine,
               ChartKind                         kind,
               const Eigen::DenseBase<XDerived>& x,
               const Eigen::DenseBase<YDerived>& y,
               const Geometry&                   geometry)
    -> std::enable_if_t<eigen_detail::is_eigen_vector_v<XDerived>
                            && eigen_detail::is_eigen_vector_v<YDerived>,
                        NormalizedChart>
{
    auto points = project_eigen(x, y);
    return engine.normalize(kind, std::span<const ProjectedPoint>(points), geometry);
}

}   // namespace plotscale
