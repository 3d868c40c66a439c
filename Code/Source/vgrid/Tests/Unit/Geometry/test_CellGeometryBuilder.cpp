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
 * @file test_CellGeometryBuilder.cpp
 * @brief Tests for resolving cell rings and centers into world coordinates
 */

#include <gtest/gtest.h>

#include "GridFixtures.h"
#include "Core/GridException.h"
#include "Geometry/CellGeometryBuilder.h"
#include "Topology/TopologyStore.h"

#include <cmath>

using namespace vgrid;
using namespace vgrid::test;

namespace {

TopologyStore store_from(const GridInput& input) {
  TopologyStore store;
  store.set_vertices(input.vertices);
  if (!input.cell1d.empty()) {
    store.set_cell1d(input.cell1d);
  } else {
    store.set_cell2d(input.cell2d);
  }
  store.set_layering(input.nlay, input.ncpl);
  store.set_elevations(input.top, input.botm);
  return store;
}

} // namespace

TEST(CellGeometryBuilder, IdentityFrameKeepsRecords) {
  const auto store = store_from(quad_grid_input(3));
  const auto geom = CellGeometryBuilder(store, ReferenceFrame{}).build();

  ASSERT_EQ(geom.vertices.n_cells(), 4);
  EXPECT_EQ(geom.centers.x, (std::vector<real_t>{0.5, 1.5, 0.5, 1.5}));
  EXPECT_EQ(geom.centers.y, (std::vector<real_t>{0.5, 0.5, 1.5, 1.5}));

  // Cell 3 = (1,1) (2,1) (2,2) (1,2), in topology order
  EXPECT_EQ(geom.vertices.x_of(3), (std::vector<real_t>{1.0, 2.0, 2.0, 1.0}));
  EXPECT_EQ(geom.vertices.y_of(3), (std::vector<real_t>{1.0, 1.0, 2.0, 2.0}));
  const Ring ring = geom.vertices.ring(3);
  ASSERT_EQ(ring.size(), 4u);
  EXPECT_DOUBLE_EQ(ring[2][0], 2.0);
  EXPECT_DOUBLE_EQ(ring[2][1], 2.0);
}

TEST(CellGeometryBuilder, TwoDimensionalElevations) {
  const auto store = store_from(quad_grid_input(3));
  const auto geom = CellGeometryBuilder(store, ReferenceFrame{}).build();
  EXPECT_EQ(geom.centers.z.nrow, 3);
  EXPECT_DOUBLE_EQ(geom.centers.z.at(1, 0), 2.5);
  EXPECT_EQ(geom.vertices.z_bounds.nrow, 4);
  EXPECT_TRUE(geom.vertices.z.empty());
}

TEST(CellGeometryBuilder, RotatedFrameMapsEverything) {
  const auto store = store_from(quad_grid_input(1));
  const ReferenceFrame frame{10.0, -5.0, std::acos(-1.0) / 2.0};
  const auto geom = CellGeometryBuilder(store, frame).build();

  // Local (0.5, 0.5) -> rotated (-0.5, 0.5) -> shifted (9.5, -4.5)
  EXPECT_NEAR(geom.centers.x[0], 9.5, 1e-12);
  EXPECT_NEAR(geom.centers.y[0], -4.5, 1e-12);

  // Local vertex (2, 0) of cell 1 -> (0, 2) -> (10, -3)
  EXPECT_NEAR(geom.vertices.x_ring(1)[1], 10.0, 1e-12);
  EXPECT_NEAR(geom.vertices.y_ring(1)[1], -3.0, 1e-12);
}

TEST(CellGeometryBuilder, OneDimensionalZFromVertices) {
  const auto store = store_from(line_grid_input());
  const auto geom = CellGeometryBuilder(store, ReferenceFrame{}).build();
  EXPECT_EQ(geom.vertices.z, (std::vector<real_t>{10.0, 9.0, 9.0, 8.0}));
  ASSERT_EQ(geom.centers.z.nrow, 1);
  EXPECT_DOUBLE_EQ(geom.centers.z.at(0, 1), 8.5);
  EXPECT_TRUE(geom.vertices.z_bounds.empty());
}

TEST(CellGeometryBuilder, CustomElevationRoutine) {
  const auto store = store_from(quad_grid_input(3));
  ElevationMidpointFn flat = [](const TopologyStore& s) {
    ElevationMidpoints zm;
    zm.z_centers.nrow = 1;
    zm.z_centers.ncol = s.ncpl();
    zm.z_centers.data.assign(static_cast<size_t>(s.ncpl()), 42.0);
    return zm;
  };
  const auto geom = CellGeometryBuilder(store, ReferenceFrame{}, flat).build();
  EXPECT_DOUBLE_EQ(geom.centers.z.at(0, 3), 42.0);
}

TEST(CellGeometryBuilder, MissingTopologyIsIncomplete) {
  TopologyStore store;
  store.set_vertices(quad_grid_input().vertices);
  EXPECT_THROW(CellGeometryBuilder(store, ReferenceFrame{}).build(), ConstructionIncompleteException);
}

TEST(CellGeometryBuilder, UnknownVertexIdIsIndexError) {
  auto input = two_square_input();
  input.cell2d[1].vertex_ids = {1, 2, 99, 4};
  const auto store = store_from(input);
  EXPECT_THROW(CellGeometryBuilder(store, ReferenceFrame{}).build(), IndexOutOfRangeException);
}
