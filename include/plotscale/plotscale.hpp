#pragma once

#include <plotscale/bar_scale.hpp>
#include <plotscale/baseline.hpp>
#include <plotscale/cache.hpp>
#include <plotscale/config.hpp>
#include <plotscale/engine.hpp>
#include <plotscale/errors.hpp>
#include <plotscale/extent.hpp>
#include <plotscale/fwd.hpp>
#include <plotscale/linear_scale.hpp>
#include <plotscale/logger.hpp>
#include <plotscale/plottable.hpp>
#include <plotscale/results.hpp>
#include <plotscale/stack.hpp>
#include <plotscale/types.hpp>
