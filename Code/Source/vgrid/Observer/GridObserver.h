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

#ifndef VGRID_GRID_OBSERVER_H
#define VGRID_GRID_OBSERVER_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace vgrid {

// ====================
// Grid Events
// ====================
// A VertexGrid publishes one event per mutation, after bumping its generation
// counter. Consumers that hold derived data (renderers, exporters) subscribe
// to learn when to refresh.
enum class GridEvent {
  TopologyChanged,   // cell2d / cell1d replaced
  GeometryChanged,   // vertex table replaced
  ElevationChanged,  // top / botm / elevation-midpoint routine replaced
  DomainChanged,     // idomain replaced
  FrameChanged       // offset or rotation modified
};

inline const char* event_name(GridEvent evt) {
  switch (evt) {
    case GridEvent::TopologyChanged:  return "TopologyChanged";
    case GridEvent::GeometryChanged:  return "GeometryChanged";
    case GridEvent::ElevationChanged: return "ElevationChanged";
    case GridEvent::DomainChanged:    return "DomainChanged";
    case GridEvent::FrameChanged:     return "FrameChanged";
  }
  return "Unknown";
}

// ====================
// Observer Interface
// ====================
class GridObserver {
public:
  virtual ~GridObserver() = default;

  /// @param generation the grid generation after the mutation
  virtual void on_grid_event(GridEvent event, std::uint64_t generation) = 0;

  virtual const char* observer_name() const { return "GridObserver"; }
};

// ====================
// Event Bus
// ====================
// Not thread-safe: grids are single-writer objects and the bus follows suit.
class GridEventBus {
public:
  GridEventBus() = default;
  GridEventBus(const GridEventBus&) = delete;
  GridEventBus& operator=(const GridEventBus&) = delete;
  GridEventBus(GridEventBus&&) noexcept = default;
  GridEventBus& operator=(GridEventBus&&) noexcept = default;

  // Register an observer (lifetime must exceed this bus)
  void subscribe(GridObserver* observer) {
    if (!observer) {
      return;
    }
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
      observers_.push_back(observer);
    }
  }

  // Register an observer with shared ownership
  void subscribe(std::shared_ptr<GridObserver> observer) {
    if (!observer) {
      return;
    }
    auto* raw = observer.get();
    const bool already_owned = std::any_of(
        owned_observers_.begin(), owned_observers_.end(),
        [raw](const std::shared_ptr<GridObserver>& existing) { return existing.get() == raw; });
    if (!already_owned) {
      owned_observers_.push_back(std::move(observer));
    }
    subscribe(raw);
  }

  void unsubscribe(GridObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
    owned_observers_.erase(
        std::remove_if(owned_observers_.begin(), owned_observers_.end(),
                       [observer](const std::shared_ptr<GridObserver>& owned) {
                         return owned.get() == observer;
                       }),
        owned_observers_.end());
  }

  void notify(GridEvent event, std::uint64_t generation) {
    // Iterate a snapshot so callbacks may (un)subscribe; changes apply to the next notify().
    const std::vector<GridObserver*> snapshot = observers_;
    for (auto* obs : snapshot) {
      if (obs) {
        obs->on_grid_event(event, generation);
      }
    }
  }

  size_t num_observers() const { return observers_.size(); }

  bool is_subscribed(const GridObserver* observer) const {
    return observer &&
           std::find(observers_.begin(), observers_.end(), observer) != observers_.end();
  }

  void clear() {
    observers_.clear();
    owned_observers_.clear();
  }

private:
  std::vector<GridObserver*> observers_;                       // non-owning pointers
  std::vector<std::shared_ptr<GridObserver>> owned_observers_; // owned observers
};

} // namespace vgrid

#endif // VGRID_GRID_OBSERVER_H
