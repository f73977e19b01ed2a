#include <gtest/gtest.h>
#include <plotscale/errors.hpp>
#include <plotscale/extent.hpp>
#include <vector>

using namespace plotscale;

// ─── compute_extent ─────────────────────────────────────────────────────────

TEST(ComputeExtent, Basic)
{
    std::vector<double> v = {3.0, -1.0, 8.0, 2.0};
    auto                e = compute_extent(v);
    EXPECT_DOUBLE_EQ(e.min, -1.0);
    EXPECT_DOUBLE_EQ(e.max, 8.0);
    EXPECT_FALSE(e.degenerate());
}

TEST(ComputeExtent, OrderIndependent)
{
    std::vector<double> a = {1.0, 5.0, 3.0};
    std::vector<double> b = {5.0, 3.0, 1.0};
    EXPECT_EQ(compute_extent(a), compute_extent(b));
}

TEST(ComputeExtent, SingleValueIsDegenerate)
{
    std::vector<double> v = {4.5};
    auto                e = compute_extent(v);
    EXPECT_DOUBLE_EQ(e.min, 4.5);
    EXPECT_DOUBLE_EQ(e.max, 4.5);
    EXPECT_TRUE(e.degenerate());
}

TEST(ComputeExtent, RepeatedValueIsDegenerate)
{
    std::vector<double> v = {2.0, 2.0, 2.0};
    EXPECT_TRUE(compute_extent(v).degenerate());
}

TEST(ComputeExtent, EmptyThrows)
{
    std::vector<double> v;
    EXPECT_THROW((void)compute_extent(v), EmptyDatasetError);
}

TEST(ComputeExtent, EmptyReportsCode)
{
    std::vector<double> v;
    try
    {
        (void)compute_extent(v);
        FAIL() << "expected EmptyDatasetError";
    }
    catch (const NormalizeError& e)
    {
        EXPECT_EQ(e.code(), ErrorCode::EmptyDataset);
    }
}

// ─── compute_extents ────────────────────────────────────────────────────────

TEST(ComputeExtents, BothAxes)
{
    std::vector<ProjectedPoint> pts = {{1.0, -2.0}, {4.0, 6.0}, {-3.0, 0.5}};
    auto                        e   = compute_extents(pts);
    EXPECT_DOUBLE_EQ(e.x.min, -3.0);
    EXPECT_DOUBLE_EQ(e.x.max, 4.0);
    EXPECT_DOUBLE_EQ(e.y.min, -2.0);
    EXPECT_DOUBLE_EQ(e.y.max, 6.0);
}

TEST(ComputeExtents, EmptyThrows)
{
    std::vector<ProjectedPoint> pts;
    EXPECT_THROW((void)compute_extents(pts), EmptyDatasetError);
}

TEST(ComputeExtents, MatchesPerAxisScan)
{
    std::vector<ProjectedPoint> pts = {{0.5, 9.0}, {0.25, -4.0}, {2.0, 1.0}};
    std::vector<double>         xs, ys;
    for (const auto& p : pts)
    {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }
    auto e = compute_extents(pts);
    EXPECT_EQ(e.x, compute_extent(xs));
    EXPECT_EQ(e.y, compute_extent(ys));
}

// ─── merge_extents ──────────────────────────────────────────────────────────

TEST(MergeExtents, Union)
{
    auto e = merge_extents({-1.0, 2.0}, {0.0, 5.0});
    EXPECT_DOUBLE_EQ(e.min, -1.0);
    EXPECT_DOUBLE_EQ(e.max, 5.0);
}

TEST(MergeExtents, DisjointExtents)
{
    auto e = merge_extents({-4.0, -3.0}, {1.0, 2.0});
    EXPECT_EQ(e, (Extent{-4.0, 2.0}));
    EXPECT_FALSE(e.degenerate());
}

TEST(MergeExtents, SameExtentUnchanged)
{
    Extent e{1.5, 1.5};
    EXPECT_EQ(merge_extents(e, e), e);
    EXPECT_TRUE(merge_extents(e, e).degenerate());
}
