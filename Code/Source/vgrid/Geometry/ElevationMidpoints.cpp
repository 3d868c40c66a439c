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

#include "ElevationMidpoints.h"
#include "../Topology/TopologyStore.h"

namespace vgrid {

ElevationMidpoints compute_elevation_midpoints(const TopologyStore& store) {
  ElevationMidpoints out;
  if (!store.has_elevations()) {
    return out;
  }

  out.z_vertices = store.top_botm();
  const auto& zb = out.z_vertices;

  out.z_centers.nrow = zb.nrow - 1;
  out.z_centers.ncol = zb.ncol;
  out.z_centers.data.resize(static_cast<size_t>(out.z_centers.nrow) * static_cast<size_t>(zb.ncol));
  for (index_t lay = 0; lay < out.z_centers.nrow; ++lay) {
    for (index_t c = 0; c < zb.ncol; ++c) {
      out.z_centers.at(lay, c) = static_cast<real_t>(0.5) * (zb.at(lay, c) + zb.at(lay + 1, c));
    }
  }
  return out;
}

} // namespace vgrid
