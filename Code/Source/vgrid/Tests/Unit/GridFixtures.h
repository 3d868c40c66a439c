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

#ifndef VGRID_TEST_GRID_FIXTURES_H
#define VGRID_TEST_GRID_FIXTURES_H

/**
 * @file GridFixtures.h
 * @brief Small grids shared by the vgrid unit tests
 */

#include "Core/VertexGrid.h"

#include <algorithm>
#include <vector>

namespace vgrid {
namespace test {

// ========================================
// 2 x 2 unit-square grid
// ========================================
// Vertex (i, j) has id 3*j + i and sits at (i, j), i, j in 0..2.
// Cell (i, j) has id 2*j + i, a counter-clockwise ring and center
// (i + 0.5, j + 0.5). With elevations: top = 10, botm = 5, 0, -5, ...

inline GridInput quad_grid_input(index_t nlay = 3, bool with_elevations = true) {
  GridInput input;
  for (index_t j = 0; j <= 2; ++j) {
    for (index_t i = 0; i <= 2; ++i) {
      Vertex v;
      v.id = 3 * j + i;
      v.x = static_cast<real_t>(i);
      v.y = static_cast<real_t>(j);
      input.vertices.push_back(v);
    }
  }
  for (index_t j = 0; j < 2; ++j) {
    for (index_t i = 0; i < 2; ++i) {
      Cell2D cell;
      cell.cellid = 2 * j + i;
      cell.xc = i + 0.5;
      cell.yc = j + 0.5;
      cell.vertex_ids = {3 * j + i, 3 * j + i + 1, 3 * (j + 1) + i + 1, 3 * (j + 1) + i};
      input.cell2d.push_back(cell);
    }
  }
  if (with_elevations) {
    input.top.assign(4, 10.0);
    for (index_t lay = 0; lay < nlay; ++lay) {
      input.botm.push_back(std::vector<real_t>(4, 5.0 - 5.0 * lay));
    }
  } else {
    input.nlay = nlay;
    input.ncpl = 4;
  }
  return input;
}

// ========================================
// Two unit squares sharing the edge x = 1
// ========================================
// cell 0 = (0,0) (1,0) (1,1) (0,1), cell 1 = (1,0) (2,0) (2,1) (1,1).
// The flags reverse a cell's ring to make it clockwise.

inline GridInput two_square_input(bool cell0_clockwise = false, bool cell1_clockwise = false) {
  GridInput input;
  const real_t xy[6][2] = {{0, 0}, {1, 0}, {2, 0}, {0, 1}, {1, 1}, {2, 1}};
  for (index_t id = 0; id < 6; ++id) {
    Vertex v;
    v.id = id;
    v.x = xy[id][0];
    v.y = xy[id][1];
    input.vertices.push_back(v);
  }

  Cell2D c0{0, 0.5, 0.5, {0, 1, 4, 3}};
  Cell2D c1{1, 1.5, 0.5, {1, 2, 5, 4}};
  if (cell0_clockwise) {
    std::reverse(c0.vertex_ids.begin(), c0.vertex_ids.end());
  }
  if (cell1_clockwise) {
    std::reverse(c1.vertex_ids.begin(), c1.vertex_ids.end());
  }
  input.cell2d = {c0, c1};
  input.top = {1.0, 1.0};
  input.botm = {{0.0, 0.0}};
  return input;
}

// ========================================
// 1-D chain of two segments
// ========================================

inline GridInput line_grid_input() {
  GridInput input;
  input.vertices = {
    Vertex{0, 0.0, 0.0, 10.0, true},
    Vertex{1, 1.0, 0.0, 9.0, true},
    Vertex{2, 2.0, 1.0, 8.0, true},
  };
  input.cell1d = {
    Cell1D{0, 0.5, 0.0, 9.5, {0, 1}},
    Cell1D{1, 1.5, 0.5, 8.5, {1, 2}},
  };
  return input;
}

} // namespace test
} // namespace vgrid

#endif // VGRID_TEST_GRID_FIXTURES_H
