#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <plotscale/types.hpp>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace plotscale
{

// ─── Projection traits ──────────────────────────────────────────────────────
//
// Plottable<T>::project(value) maps a domain value onto the real line. The
// only hard requirement is determinism: equal values project equally.
// Specialize for your own domain types:
//
//   template <> struct plotscale::Plottable<Weekday>
//   {
//       static double project(Weekday d) { return static_cast<double>(d); }
//   };

template <typename T, typename = void>
struct Plottable;

template <typename T>
struct Plottable<T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
{
    static double project(T value) { return static_cast<double>(value); }
};

// Dates and times project to seconds since the clock's epoch.
template <typename Clock, typename Duration>
struct Plottable<std::chrono::time_point<Clock, Duration>>
{
    static double project(const std::chrono::time_point<Clock, Duration>& tp)
    {
        return std::chrono::duration<double>(tp.time_since_epoch()).count();
    }
};

// Discrete category on an ordinal axis. The label is carried for the
// rendering layer only; projection uses the ordinal.
struct Category
{
    std::string label;
    int         ordinal = 0;

    bool operator==(const Category&) const = default;
};

template <>
struct Plottable<Category>
{
    static double project(const Category& c) { return static_cast<double>(c.ordinal); }
};

template <typename T, typename = void>
struct is_plottable : std::false_type
{
};

template <typename T>
struct is_plottable<T, std::void_t<decltype(Plottable<T>::project(std::declval<const T&>()))>>
    : std::true_type
{
};

template <typename T>
inline constexpr bool is_plottable_v = is_plottable<T>::value;

template <typename T>
double project(const T& value)
{
    static_assert(is_plottable_v<T>, "type has no plotscale::Plottable specialization");
    return Plottable<T>::project(value);
}

// ─── Data points ────────────────────────────────────────────────────────────

template <typename X, typename Y = X>
struct DataPoint
{
    X                            x{};
    Y                            y{};
    std::optional<std::uint64_t> id;   // only needed to tell overlaid points apart
};

// Throws InvalidValueError when value is NaN or infinite.
void require_finite(double value, const char* axis, size_t index);

// Throws NormalizeError(InvalidValue) when the two columns differ in length.
void require_same_length(size_t x_count, size_t y_count);

// Projects every point, validating finiteness. Input order is preserved.
template <typename X, typename Y>
std::vector<ProjectedPoint> project_points(std::span<const DataPoint<X, Y>> points)
{
    std::vector<ProjectedPoint> out;
    out.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i)
    {
        double px = project(points[i].x);
        double py = project(points[i].y);
        require_finite(px, "x", i);
        require_finite(py, "y", i);
        out.push_back({px, py});
    }
    return out;
}

template <typename X, typename Y>
std::vector<ProjectedPoint> project_points(const std::vector<DataPoint<X, Y>>& points)
{
    return project_points(std::span<const DataPoint<X, Y>>(points));
}

// Column form: xs[i] pairs with ys[i].
template <typename X, typename Y>
std::vector<ProjectedPoint> project_columns(std::span<const X> xs, std::span<const Y> ys)
{
    require_same_length(xs.size(), ys.size());
    std::vector<ProjectedPoint> out;
    out.reserve(xs.size());
    for (size_t i = 0; i < xs.size(); ++i)
    {
        double px = project(xs[i]);
        double py = project(ys[i]);
        require_finite(px, "x", i);
        require_finite(py, "y", i);
        out.push_back({px, py});
    }
    return out;
}

// Already-numeric input still goes through the finiteness check.
void require_finite_points(std::span<const ProjectedPoint> points);

}   // namespace plotscale
