/* mtx.hpp

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

#ifndef HEXLAT_MTX_HPP
#define HEXLAT_MTX_HPP

/// \file mtx.hpp \brief Square matrices for the hex to pixel transforms.

#include <hexlat/vec.hpp>
#include <boost/static_assert.hpp>
#include <initializer_list>

namespace hexlat {

/// Square matrix stored as rows.
template<class T, int N> class Mtx {
 public:
  Mtx() {}

  /// Elements in row-major order, the way the matrix is written on paper.
  Mtx(std::initializer_list<T> args) {
    int i = 0;
    for (auto v : args) {
      if (i == N * N)
        break;
      rows[i / N][i % N] = v;
      i++;
    }
  }

  T& at(int row, int column) { return rows[row][column]; }

  T at(int row, int column) const { return rows[row][column]; }

  T determinant() const {
    BOOST_STATIC_ASSERT(N == 2);
    return at(0, 0) * at(1, 1) - at(0, 1) * at(1, 0);
  }

  /// Inverse of a 2x2 matrix. The determinant must not be zero.
  Mtx<T, N> inverted() const {
    BOOST_STATIC_ASSERT(N == 2);
    T det = determinant();
    return Mtx<T, N>{
       at(1, 1) / det, -at(0, 1) / det,
      -at(1, 0) / det,  at(0, 0) / det};
  }

  bool operator==(const Mtx<T, N>& rhs) const {
    for (int i = 0; i < N; i++) {
      if (rows[i] != rhs.rows[i])
        return false;
    }
    return true;
  }

  bool operator!=(const Mtx<T, N>& rhs) const { return !(*this == rhs); }

 private:
  Vec<T, N> rows[N];
};

typedef Mtx<double, 2> Mtx2d;

template<class T, int N>
Vec<T, N> operator*(const Mtx<T, N>& lhs, const Vec<T, N>& rhs) {
  Vec<T, N> result;
  for (int i = 0; i < N; i++) {
    T sum(0);
    for (int j = 0; j < N; j++)
      sum += lhs.at(i, j) * rhs[j];
    result[i] = sum;
  }
  return result;
}

}

#endif
