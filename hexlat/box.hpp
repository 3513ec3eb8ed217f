/* box.hpp

   Copyright (C) 2012 Risto Saarelma

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef HEXLAT_BOX_HPP
#define HEXLAT_BOX_HPP

#include <hexlat/alg.hpp>
#include <hexlat/vec.hpp>
#include <hexlat/util.hpp>

namespace hexlat {

/**
 * Closed axis-aligned box.
 *
 * Both corners belong to the box, so the box spanning a single lattice point
 * has zero dimensions and still contains that point. A default-constructed
 * box is empty and contains nothing.
 */
template<class T, int N> class Box {
 public:
  Box() : is_empty(true) {}

  Box(const Vec<T, N>& min, const Vec<T, N>& max)
      : min_pt(min), max_pt(max), is_empty(false) {
    HEXLAT_ASSERT(all_of(max_pt - min_pt, [](T x) { return x >= 0; }));
  }

  template<class Input_Iterator>
  static Box<T, N> smallest_containing(Input_Iterator first, Input_Iterator last) {
    if (first == last)
      return Box<T, N>();
    Vec<T, N> min = *first;
    Vec<T, N> max = *first;
    while (++first != last) {
      min = elem_min(min, *first);
      max = elem_max(max, *first);
    }
    return Box<T, N>(min, max);
  }

  bool empty() const { return is_empty; }

  bool contains(const Vec<T, N>& pos) const {
    if (is_empty)
      return false;
    for (int i = 0; i < N; i++) {
      if (pos[i] < min_pt[i] || pos[i] > max_pt[i])
        return false;
    }
    return true;
  }

  const Vec<T, N>& min() const { return min_pt; }

  const Vec<T, N>& max() const { return max_pt; }

  Vec<T, N> dim() const { return max_pt - min_pt; }

 private:
  Vec<T, N> min_pt;
  Vec<T, N> max_pt;
  bool is_empty;
};

typedef Box<double, 2> Rectd;
typedef Box<int, 3> Cubei;

}

#endif
