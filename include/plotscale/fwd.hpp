#pragma once

namespace plotscale
{

struct Extent;
struct AxisExtents;
struct Geometry;
struct ScreenPoint;
struct ProjectedPoint;
struct Category;

struct ScaleDomain;
class SignAwareBarScaler;
class StackAggregator;

struct NormalizeConfig;
class NormalizationEngine;
class ScaleCache;

struct ScaleResult;
struct BarSpan;
struct BarGeometry;
struct BarResult;
struct StackSegment;
struct StackedGroup;
struct SegmentRect;
struct StackedBarResult;
struct NormalizedChart;

class NormalizeError;
class EmptyDatasetError;
class InvalidValueError;

class Logger;

}   // namespace plotscale
