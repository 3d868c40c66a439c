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
 * @file test_LayerArrayProjector.cpp
 * @brief Tests for LayerArray shapes and per-layer projection
 */

#include <gtest/gtest.h>

#include "Core/GridException.h"
#include "Fields/LayerArray.h"
#include "Fields/LayerArrayProjector.h"

#include <numeric>
#include <vector>

using namespace vgrid;

namespace {

constexpr index_t kNlay = 3;
constexpr index_t kNcpl = 4;

// Node values 0, 1, ..., nlay*ncpl - 1
std::vector<real_t> node_values() {
  std::vector<real_t> v(static_cast<size_t>(kNlay * kNcpl));
  std::iota(v.begin(), v.end(), 0.0);
  return v;
}

} // namespace

// ========================================
// LayerArray
// ========================================

TEST(LayerArray, ShapeMustMatchData) {
  EXPECT_THROW(LayerArray({2, 3}, std::vector<real_t>(5, 0.0)), ShapeMismatchException);
  const LayerArray a({2, 3}, std::vector<real_t>(6, 1.0));
  EXPECT_EQ(a.rank(), 2u);
  EXPECT_EQ(a.size(), 6u);
}

TEST(LayerArray, FromRowsRejectsRaggedInput) {
  const auto a = LayerArray::from_rows({{1.0, 2.0}, {3.0, 4.0}});
  EXPECT_EQ(a.shape(), (LayerArray::Shape{2, 2}));
  EXPECT_THROW(LayerArray::from_rows({{1.0, 2.0}, {3.0}}), InvalidArgumentException);
}

TEST(LayerArray, SqueezeAndTake) {
  const LayerArray a({1, 2, 3}, {0, 1, 2, 3, 4, 5});
  const auto s = a.squeeze(0);
  EXPECT_EQ(s.shape(), (LayerArray::Shape{2, 3}));
  EXPECT_EQ(s.take(1).data(), (std::vector<real_t>{3, 4, 5}));
  EXPECT_THROW(a.squeeze(1), ShapeMismatchException);
  EXPECT_THROW(s.take(2), IndexOutOfRangeException);
}

// ========================================
// LayerArrayProjector
// ========================================

TEST(LayerArrayProjector, SingleLayerArrayIsReturnedForAnyLayer) {
  const LayerArrayProjector proj(kNlay, kNcpl);
  const LayerArray a(std::vector<real_t>{9.0, 8.0, 7.0, 6.0});
  for (index_t lay = 0; lay < kNlay; ++lay) {
    EXPECT_EQ(proj.project(a, lay), a.data());
  }
}

TEST(LayerArrayProjector, FlatNodeArrayMatchesRankTwo) {
  const LayerArrayProjector proj(kNlay, kNcpl);
  const LayerArray flat(node_values());
  const LayerArray table({static_cast<size_t>(kNlay), static_cast<size_t>(kNcpl)}, node_values());
  for (index_t lay = 0; lay < kNlay; ++lay) {
    EXPECT_EQ(proj.project(flat, lay), proj.project(table, lay));
  }
  EXPECT_EQ(proj.project(table, 2), (std::vector<real_t>{8, 9, 10, 11}));
}

TEST(LayerArrayProjector, RankThreeWithUnitAxisIsSqueezed) {
  const LayerArrayProjector proj(kNlay, kNcpl);
  const LayerArray table({3, 4}, node_values());
  const LayerArray leading({1, 3, 4}, node_values());
  const LayerArray middle({3, 1, 4}, node_values());
  for (index_t lay = 0; lay < kNlay; ++lay) {
    EXPECT_EQ(proj.project(leading, lay), proj.project(table, lay));
    EXPECT_EQ(proj.project(middle, lay), proj.project(table, lay));
  }
}

TEST(LayerArrayProjector, AmbiguousRankThreeIsShapeError) {
  const LayerArrayProjector proj(1, kNcpl);
  EXPECT_THROW(proj.project(LayerArray({1, 1, 4}, std::vector<real_t>(4, 0.0)), 0),
               ShapeMismatchException);
  const LayerArrayProjector proj3(kNlay, kNcpl);
  EXPECT_THROW(proj3.project(LayerArray({3, 2, 2}, node_values()), 0), ShapeMismatchException);
}

TEST(LayerArrayProjector, UnsupportedShapesAreRejected) {
  const LayerArrayProjector proj(kNlay, kNcpl);
  EXPECT_THROW(proj.project(LayerArray(std::vector<real_t>(5, 0.0)), 0), ShapeMismatchException);
  EXPECT_THROW(proj.project(LayerArray({1, 3, 1, 4}, node_values()), 0), ShapeMismatchException);
  try {
    proj.project(LayerArray(std::vector<real_t>(7, 0.0)), 0);
    FAIL() << "expected ShapeMismatchException";
  } catch (const ShapeMismatchException& e) {
    EXPECT_EQ(e.shape(), (std::vector<size_t>{7}));
    EXPECT_EQ(e.status(), GridStatus::ShapeMismatch);
  }
}

TEST(LayerArrayProjector, LayerOutsideArrayIsIndexError) {
  const LayerArrayProjector proj(kNlay, kNcpl);
  EXPECT_THROW(proj.project(LayerArray({3, 4}, node_values()), 3), IndexOutOfRangeException);
  EXPECT_THROW(proj.project(LayerArray(node_values()), -1), IndexOutOfRangeException);
}

TEST(LayerArrayProjector, WrongRowLengthIsInternalError) {
  const LayerArrayProjector proj(kNlay, kNcpl);
  EXPECT_THROW(proj.project(LayerArray({2, 6}, node_values()), 0), InternalConsistencyException);
}

TEST(LayerArrayProjector, PlottableLayerCounts) {
  const LayerArrayProjector proj(kNlay, kNcpl);
  EXPECT_EQ(proj.number_plottable_layers(LayerArray(std::vector<real_t>(4, 0.0))), 1);
  EXPECT_EQ(proj.number_plottable_layers(LayerArray(node_values())), 3);
  EXPECT_EQ(proj.number_plottable_layers(LayerArray({3, 1, 4}, node_values())), 3);
  EXPECT_EQ(proj.plottable_layer_shape(), (LayerArray::Shape{4}));
}
