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

#include "LayerArray.h"
#include "../Core/GridException.h"

#include <functional>
#include <numeric>
#include <string>

namespace vgrid {

namespace {

size_t shape_product(const LayerArray::Shape& shape) {
  return std::accumulate(shape.begin(), shape.end(), static_cast<size_t>(1),
                         std::multiplies<size_t>());
}

} // namespace

LayerArray::LayerArray(std::vector<real_t> data)
    : shape_{data.size()}, data_(std::move(data)) {}

LayerArray::LayerArray(Shape shape, std::vector<real_t> data)
    : shape_(std::move(shape)), data_(std::move(data)) {
  if (shape_product(shape_) != data_.size()) {
    throw ShapeMismatchException("Array shape does not match its " + std::to_string(data_.size()) +
                                 " values", shape_, __FILE__, __LINE__, __FUNCTION__);
  }
}

LayerArray LayerArray::from_rows(const std::vector<std::vector<real_t>>& rows) {
  const size_t ncol = rows.empty() ? 0 : rows.front().size();
  std::vector<real_t> data;
  data.reserve(rows.size() * ncol);
  for (size_t r = 0; r < rows.size(); ++r) {
    VGRID_CHECK_ARG(rows[r].size() == ncol,
                    "Row " + std::to_string(r) + " has " + std::to_string(rows[r].size()) +
                    " values, expected " + std::to_string(ncol));
    data.insert(data.end(), rows[r].begin(), rows[r].end());
  }
  return LayerArray(Shape{rows.size(), ncol}, std::move(data));
}

LayerArray LayerArray::squeeze(size_t axis) const {
  if (axis >= rank() || shape_[axis] != 1) {
    throw ShapeMismatchException("Cannot squeeze axis " + std::to_string(axis),
                                 shape_, __FILE__, __LINE__, __FUNCTION__);
  }
  Shape squeezed = shape_;
  squeezed.erase(squeezed.begin() + static_cast<std::ptrdiff_t>(axis));
  return LayerArray(std::move(squeezed), data_);
}

LayerArray LayerArray::reshape(Shape shape) const {
  return LayerArray(std::move(shape), data_);
}

LayerArray LayerArray::take(index_t i) const {
  if (rank() == 0) {
    throw ShapeMismatchException("Cannot index a rank-0 array", shape_,
                                 __FILE__, __LINE__, __FUNCTION__);
  }
  VGRID_CHECK_INDEX(i, static_cast<std::int64_t>(shape_[0]), "Layer index");

  const Shape inner(shape_.begin() + 1, shape_.end());
  const size_t stride = shape_product(inner);
  const auto first = data_.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(i) * stride);
  return LayerArray(inner, std::vector<real_t>(first, first + static_cast<std::ptrdiff_t>(stride)));
}

} // namespace vgrid
