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

#ifndef VGRID_LAYER_ARRAY_H
#define VGRID_LAYER_ARRAY_H

#include "../Core/GridTypes.h"

#include <cstddef>
#include <vector>

namespace vgrid {

/**
 * @brief Dense row-major array of reals with an explicit shape.
 *
 * Carries client data of any rank (per-node values, [nlay][ncpl] tables,
 * [nlay][1][ncpl] stacks, ...) into the LayerArrayProjector. The product of
 * the shape always equals size().
 */
class LayerArray {
public:
  using Shape = std::vector<size_t>;

  LayerArray() = default;

  /// Rank-1 array
  explicit LayerArray(std::vector<real_t> data);

  /// @throws ShapeMismatchException if the shape product differs from data.size()
  LayerArray(Shape shape, std::vector<real_t> data);

  /// Rank-2 array from equally sized rows
  static LayerArray from_rows(const std::vector<std::vector<real_t>>& rows);

  size_t rank() const noexcept { return shape_.size(); }
  const Shape& shape() const noexcept { return shape_; }
  size_t dim(size_t axis) const { return shape_.at(axis); }
  size_t size() const noexcept { return data_.size(); }
  const std::vector<real_t>& data() const noexcept { return data_; }

  /// Remove @p axis, which must have length 1
  LayerArray squeeze(size_t axis) const;

  /// Same data, new shape of equal size
  LayerArray reshape(Shape shape) const;

  /**
   * @brief Sub-array at index @p i of the first axis (rank decreases by one)
   * @throws IndexOutOfRangeException if @p i is outside the first axis
   */
  LayerArray take(index_t i) const;

private:
  Shape shape_;
  std::vector<real_t> data_;
};

} // namespace vgrid

#endif // VGRID_LAYER_ARRAY_H
