/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @file test_GeometryCache.cpp
 * @brief Tests for generation-stamped caching of derived cell geometry
 */

#include <gtest/gtest.h>

#include "Core/GridException.h"
#include "Geometry/GeometryCache.h"

#include <stdexcept>

using namespace vgrid;

namespace {

// Build function producing one single-vertex "cell" at x = value
struct CountingBuilder {
  int calls = 0;
  real_t value = 0.0;

  GeometryCache::BuildFn fn() {
    return [this]() {
      ++calls;
      CellGeometry geom;
      geom.centers.x = {value};
      geom.centers.y = {0.0};
      geom.vertices.offsets = {0, 1};
      geom.vertices.x = {value};
      geom.vertices.y = {0.0};
      return geom;
    };
  }
};

} // namespace

TEST(GeometryCache, RepeatedReadsReuseTheBuild) {
  GeometryCache cache;
  CountingBuilder builder;
  builder.value = 1.0;

  const auto a = cache.cell_centers(0, builder.fn());
  const auto b = cache.cell_centers(0, builder.fn());
  const auto v = cache.cell_vertices(0, builder.fn());

  EXPECT_EQ(builder.calls, 1);
  EXPECT_EQ(a.x, b.x);
  EXPECT_EQ(v.x, (std::vector<real_t>{1.0}));
  EXPECT_EQ(cache.stats().rebuilds, 1u);
  EXPECT_EQ(cache.stats().misses, 1u);
  EXPECT_EQ(cache.stats().hits, 2u);
}

TEST(GeometryCache, NewGenerationRebuildsBothBundles) {
  GeometryCache cache;
  CountingBuilder builder;
  builder.value = 1.0;
  cache.cell_centers(0, builder.fn());
  EXPECT_TRUE(cache.is_current(0));

  builder.value = 2.0;
  EXPECT_FALSE(cache.is_current(1));
  const auto v = cache.cell_vertices(1, builder.fn());
  EXPECT_EQ(builder.calls, 2);
  EXPECT_DOUBLE_EQ(v.x[0], 2.0);
  EXPECT_TRUE(cache.is_current(GeometryKey::CellCenters, 1));
  EXPECT_TRUE(cache.is_current(GeometryKey::XyzGrid, 1));
  EXPECT_FALSE(cache.is_current(GeometryKey::XyzGrid, 0));
  EXPECT_DOUBLE_EQ(cache.cell_centers(1, builder.fn()).x[0], 2.0);
  EXPECT_EQ(builder.calls, 2);
}

TEST(GeometryCache, OwnedCopyIsIndependent) {
  GeometryCache cache;
  CountingBuilder builder;
  builder.value = 3.0;
  auto copy = cache.cell_centers(0, builder.fn());
  copy.x[0] = -1.0;
  EXPECT_DOUBLE_EQ(cache.cell_centers(0, builder.fn()).x[0], 3.0);
}

TEST(GeometryCache, ViewOutlivesRebuild) {
  GeometryCache cache;
  CountingBuilder builder;
  builder.value = 1.0;
  const auto old_view = cache.view_cell_vertices(0, builder.fn());
  ASSERT_TRUE(static_cast<bool>(old_view));
  EXPECT_EQ(old_view.generation(), 0u);

  builder.value = 5.0;
  const auto new_view = cache.view_cell_vertices(1, builder.fn());
  EXPECT_DOUBLE_EQ(old_view->x[0], 1.0);
  EXPECT_DOUBLE_EQ(new_view->x[0], 5.0);
  EXPECT_EQ(new_view.generation(), 1u);
}

TEST(GeometryCache, ViewsShareStorage) {
  GeometryCache cache;
  CountingBuilder builder;
  const auto a = cache.view_cell_centers(7, builder.fn());
  const auto b = cache.view_cell_centers(7, builder.fn());
  EXPECT_EQ(&a.get(), &b.get());
}

TEST(GeometryCache, InvalidateForcesRebuild) {
  GeometryCache cache;
  CountingBuilder builder;
  cache.cell_centers(0, builder.fn());
  cache.invalidate();
  EXPECT_FALSE(cache.is_current(0));
  cache.cell_centers(0, builder.fn());
  EXPECT_EQ(builder.calls, 2);

  cache.reset_stats();
  EXPECT_EQ(cache.stats().rebuilds, 0u);
}

TEST(GeometryCache, FailedBuildKeepsPreviousEntries) {
  GeometryCache cache;
  CountingBuilder builder;
  builder.value = 4.0;
  cache.cell_centers(0, builder.fn());

  GeometryCache::BuildFn failing = []() -> CellGeometry {
    throw std::runtime_error("build failed");
  };
  EXPECT_THROW(cache.cell_centers(1, failing), std::runtime_error);
  EXPECT_TRUE(cache.is_current(0));
  EXPECT_DOUBLE_EQ(cache.cell_centers(0, builder.fn()).x[0], 4.0);
}

TEST(GeometryCache, MissingBuildFunctionIsInternalError) {
  GeometryCache cache;
  EXPECT_THROW(cache.cell_centers(0, GeometryCache::BuildFn{}), InternalConsistencyException);
}

TEST(GeometryCache, KeyNames) {
  EXPECT_STREQ(geometry_key_name(GeometryKey::CellCenters), "cellcenters");
  EXPECT_STREQ(geometry_key_name(GeometryKey::XyzGrid), "xyzgrid");
}
