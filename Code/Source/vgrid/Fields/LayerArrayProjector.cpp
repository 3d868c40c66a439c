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

#include "LayerArrayProjector.h"
#include "../Core/GridException.h"

#include <string>

namespace vgrid {

LayerArrayProjector::LayerArrayProjector(index_t nlay, index_t ncpl)
    : nlay_(nlay), ncpl_(ncpl) {}

std::vector<real_t> LayerArrayProjector::project(const LayerArray& array, index_t layer) const {
  const auto ncpl = static_cast<size_t>(ncpl_);
  const auto nlay = static_cast<size_t>(nlay_);
  std::vector<real_t> out;

  switch (array.rank()) {
    case 3: {
      const bool first_unit = array.dim(0) == 1;
      const bool second_unit = array.dim(1) == 1;
      if (first_unit == second_unit) {
        throw ShapeMismatchException("Cannot tell the layer axis of a rank-3 array",
                                     array.shape(), __FILE__, __LINE__, __FUNCTION__);
      }
      out = array.squeeze(first_unit ? 0 : 1).take(layer).data();
      break;
    }
    case 2:
      out = array.take(layer).data();
      break;
    case 1:
      if (array.size() == ncpl) {
        out = array.data();
      } else if (array.size() == nlay * ncpl) {
        out = array.reshape({nlay, ncpl}).take(layer).data();
      } else {
        throw ShapeMismatchException("Rank-1 array is neither ncpl (" + std::to_string(ncpl) +
                                     ") nor nnodes (" + std::to_string(nlay * ncpl) + ") long",
                                     array.shape(), __FILE__, __LINE__, __FUNCTION__);
      }
      break;
    default:
      throw ShapeMismatchException("Unsupported array rank " + std::to_string(array.rank()),
                                   array.shape(), __FILE__, __LINE__, __FUNCTION__);
  }

  VGRID_THROW_IF(out.size() != ncpl, InternalConsistencyException,
                 "Layer slice has " + std::to_string(out.size()) + " values, expected " +
                 std::to_string(ncpl));
  return out;
}

index_t LayerArrayProjector::number_plottable_layers(const LayerArray& array) const {
  if (array.rank() == 1 && array.size() == static_cast<size_t>(ncpl_)) {
    return 1;
  }
  if (ncpl_ <= 0) {
    return 0;
  }
  return static_cast<index_t>(array.size() / static_cast<size_t>(ncpl_));
}

} // namespace vgrid
