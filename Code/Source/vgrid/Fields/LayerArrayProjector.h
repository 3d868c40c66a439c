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

#ifndef VGRID_LAYER_ARRAY_PROJECTOR_H
#define VGRID_LAYER_ARRAY_PROJECTOR_H

#include "LayerArray.h"

#include <vector>

namespace vgrid {

/**
 * @brief Normalizes client arrays to one layer of ncpl values
 *
 * Recognized layouts:
 * - rank 3 with exactly one of the first two axes of length 1: squeezed, then
 *   indexed by layer
 * - rank 2 [nlay][ncpl]: indexed by layer
 * - rank 1 of length ncpl: returned unchanged for every layer
 * - rank 1 of length nlay*ncpl: reshaped to [nlay][ncpl], indexed by layer
 *
 * Anything else raises ShapeMismatchException.
 */
class LayerArrayProjector {
public:
  LayerArrayProjector(index_t nlay, index_t ncpl);

  /**
   * @brief Values of @p array for @p layer, length ncpl
   * @throws ShapeMismatchException for unrecognized layouts
   * @throws IndexOutOfRangeException if @p layer is outside the layer axis
   * @throws InternalConsistencyException if the slice is not ncpl long
   */
  std::vector<real_t> project(const LayerArray& array, index_t layer) const;

  // 1 for a [ncpl] array, otherwise size / ncpl
  index_t number_plottable_layers(const LayerArray& array) const;

  LayerArray::Shape plottable_layer_shape() const { return {static_cast<size_t>(ncpl_)}; }

private:
  index_t nlay_;
  index_t ncpl_;
};

} // namespace vgrid

#endif // VGRID_LAYER_ARRAY_PROJECTOR_H
