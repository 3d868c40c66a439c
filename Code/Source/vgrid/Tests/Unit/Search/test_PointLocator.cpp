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
 * @file test_PointLocator.cpp
 * @brief Tests for point-in-cell lookup and the shared-edge tie-break
 */

#include <gtest/gtest.h>

#include "GridFixtures.h"
#include "Core/GridException.h"
#include "Search/PointLocator.h"

#include <cmath>

using namespace vgrid;
using namespace vgrid::test;

namespace {

struct LocatorFixture {
  VertexGrid grid;
  GeometryView<CellVertices> rings;
  LayeredValues top_botm;

  explicit LocatorFixture(const GridInput& input)
      : grid(input), rings(grid.xyzvertices_view()), top_botm(grid.top_botm()) {}

  PointLocator locator() const {
    return PointLocator(*rings, top_botm, grid.frame(), grid.nlay(), grid.ncpl());
  }
};

} // namespace

TEST(PointLocator, SharedEdgeGoesToLowerCell) {
  for (int variant = 0; variant < 4; ++variant) {
    LocatorFixture fx(two_square_input((variant & 1) != 0, (variant & 2) != 0));
    const auto loc = fx.locator().locate(1.0, 0.5);
    EXPECT_TRUE(loc.found) << "variant " << variant;
    EXPECT_EQ(loc.cell, 0) << "variant " << variant;
  }
}

TEST(PointLocator, InteriorPointsPickTheirCell) {
  LocatorFixture fx(two_square_input(false, true));
  const auto locator = fx.locator();
  EXPECT_EQ(locator.locate(0.25, 0.75).cell, 0);
  EXPECT_EQ(locator.locate(1.75, 0.25).cell, 1);
  // Right edge of cell 1 belongs to cell 1 only
  EXPECT_EQ(locator.locate(2.0, 0.5).cell, 1);
}

TEST(PointLocator, FarPointThrowsUnlessForgiven) {
  LocatorFixture fx(two_square_input());
  const auto locator = fx.locator();
  EXPECT_THROW(locator.locate(50.0, 50.0), LocationNotFoundException);

  try {
    locator.locate(50.0, -3.0);
    FAIL() << "expected LocationNotFoundException";
  } catch (const LocationNotFoundException& e) {
    EXPECT_DOUBLE_EQ(e.x(), 50.0);
    EXPECT_DOUBLE_EQ(e.y(), -3.0);
    EXPECT_EQ(e.status(), GridStatus::LocationNotFound);
  }

  LocateOptions opts;
  opts.forgive = true;
  const auto miss = locator.locate(50.0, 50.0, std::nullopt, opts);
  EXPECT_FALSE(miss.found);
  EXPECT_TRUE(std::isnan(miss.cell_or_nan()));
  EXPECT_FALSE(miss.has_layer);
}

TEST(PointLocator, ElevationSelectsLayer) {
  LocatorFixture fx(quad_grid_input(3));
  const auto locator = fx.locator();

  auto loc = locator.locate(1.5, 0.5, 7.0);
  EXPECT_TRUE(loc.found);
  EXPECT_TRUE(loc.has_layer);
  EXPECT_EQ(loc.cell, 1);
  EXPECT_EQ(loc.layer, 0);

  EXPECT_EQ(locator.locate(1.5, 0.5, 2.0).layer, 1);
  EXPECT_EQ(locator.locate(1.5, 0.5, -3.0).layer, 2);
  // Layer boundaries belong to the upper layer
  EXPECT_EQ(locator.locate(1.5, 0.5, 5.0).layer, 0);
  EXPECT_DOUBLE_EQ(locator.locate(0.5, 1.5, -5.0).layer_or_nan(), 2.0);
}

TEST(PointLocator, ElevationOutsideColumnIsMiss) {
  LocatorFixture fx(quad_grid_input(3));
  const auto locator = fx.locator();
  EXPECT_THROW(locator.locate(0.5, 0.5, 20.0), LocationNotFoundException);

  LocateOptions opts;
  opts.forgive = true;
  const auto miss = locator.locate(0.5, 0.5, -20.0, opts);
  EXPECT_FALSE(miss.found);
  EXPECT_TRUE(miss.has_layer);
  EXPECT_TRUE(std::isnan(miss.cell_or_nan()));
  EXPECT_TRUE(std::isnan(miss.layer_or_nan()));
}

TEST(PointLocator, ElevationWithoutTopBotmIsIncomplete) {
  LocatorFixture fx(quad_grid_input(2, false));
  EXPECT_THROW(fx.locator().locate(0.5, 0.5, 1.0), ConstructionIncompleteException);
}

TEST(PointLocator, LocalQueriesUseTheFrame) {
  auto input = quad_grid_input(1);
  input.xoffset = 1000.0;
  input.yoffset = 2000.0;
  input.rotation = ReferenceFrame::degrees_to_radians(30.0);
  LocatorFixture fx(input);
  const auto locator = fx.locator();

  LocateOptions local;
  local.local = true;
  EXPECT_EQ(locator.locate(1.5, 1.5, std::nullopt, local).cell, 3);

  const auto world = CoordinateTransform::to_world(1.5, 1.5, fx.grid.frame());
  EXPECT_EQ(locator.locate(world[0], world[1]).cell, 3);

  // Local coordinates interpreted as world coordinates miss the grid
  local.local = false;
  local.forgive = true;
  EXPECT_FALSE(locator.locate(1.5, 1.5, std::nullopt, local).found);
}

TEST(PointLocator, EveryCenterLocatesToItsCell) {
  auto input = quad_grid_input(1);
  input.xoffset = -40.0;
  input.yoffset = 12.0;
  input.rotation = 1.1;
  LocatorFixture fx(input);
  const auto locator = fx.locator();
  const auto centers = fx.grid.xyzcellcenters();
  for (index_t c = 0; c < fx.grid.ncpl(); ++c) {
    const auto loc = locator.locate(centers.x[static_cast<size_t>(c)],
                                    centers.y[static_cast<size_t>(c)]);
    EXPECT_TRUE(loc.found);
    EXPECT_EQ(loc.cell, c);
  }
}

TEST(PointLocator, ToleranceIsTunable) {
  LocatorFixture fx(two_square_input());
  const auto locator = fx.locator();

  // Without a band the bare winding number puts the shared edge in cell 1
  LocateOptions bare;
  bare.tolerance = 0.0;
  EXPECT_FALSE(locator.cell_contains(0, 1.0, 0.5, 0.0));
  EXPECT_EQ(locator.locate(1.0, 0.5, std::nullopt, bare).cell, 1);

  LocateOptions wide;
  wide.tolerance = 0.1;
  EXPECT_EQ(locator.locate(1.0, 0.5, std::nullopt, wide).cell, 0);
  EXPECT_TRUE(locator.cell_contains(1, 1.0, 0.5, 1e-9));
}
