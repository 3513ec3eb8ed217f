/* vec.hpp

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

#ifndef HEXLAT_VEC_HPP
#define HEXLAT_VEC_HPP

/** \file vec.hpp
 * Small fixed-size vectors, pixel positions and cube coordinate triples.
 */

#include <cmath>
#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <boost/static_assert.hpp>

namespace hexlat {

template<class T, int N> class Vec {
 public:
  Vec() {
    std::fill(data, data + N, T());
  }

  /// Missing trailing elements are zero, extra ones are ignored.
  Vec(std::initializer_list<T> args) {
    std::fill(data, data + N, T());
    std::copy(args.begin(), args.begin() + std::min<int>(N, args.size()), data);
  }

  Vec(const T& x, const T& y) {
    BOOST_STATIC_ASSERT(N == 2);
    data[0] = x;
    data[1] = y;
  }

  Vec(const T& q, const T& r, const T& s) {
    BOOST_STATIC_ASSERT(N == 3);
    data[0] = q;
    data[1] = r;
    data[2] = s;
  }

  T& operator[](int i) { return data[i]; }

  T operator[](int i) const { return data[i]; }

  const T* begin() const { return data; }

  const T* end() const { return data + N; }

  bool operator==(const Vec<T, N>& rhs) const {
    return std::equal(begin(), end(), rhs.begin());
  }

  bool operator!=(const Vec<T, N>& rhs) const { return !(*this == rhs); }

  /// Apply a binary operation pairwise to the elements of two vectors.
  template<class Op>
  Vec<T, N> zip_with(const Vec<T, N>& rhs, Op op) const {
    Vec<T, N> result;
    std::transform(begin(), end(), rhs.begin(), result.data, op);
    return result;
  }

  Vec<T, N> elem_mul(const Vec<T, N>& rhs) const {
    return zip_with(rhs, std::multiplies<T>());
  }

  Vec<T, N> elem_div(const Vec<T, N>& rhs) const {
    return zip_with(rhs, std::divides<T>());
  }

  /// Euclidean length.
  T abs() const {
    T sum(0);
    for (auto x : *this)
      sum += x * x;
    return std::sqrt(sum);
  }

 private:
  T data[N];
};

typedef Vec<int, 2>    Vec2i;
typedef Vec<double, 2> Vec2d;
typedef Vec<int, 3>    Vec3i;

template<class T, int N>
Vec<T, N> operator+(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  return lhs.zip_with(rhs, std::plus<T>());
}

template<class T, int N>
Vec<T, N> operator-(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  return lhs.zip_with(rhs, std::minus<T>());
}

template<class T, int N>
Vec<T, N> operator*(const Vec<T, N>& lhs, T rhs) {
  return lhs.zip_with(Vec<T, N>(), [=](T x, T) { return x * rhs; });
}

template<class T, int N>
Vec<T, N> operator*(T lhs, const Vec<T, N>& rhs) {
  return rhs * lhs;
}

template<class T, int N>
Vec<T, N> elem_min(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  return lhs.zip_with(rhs, [](T a, T b) { return std::min(a, b); });
}

template<class T, int N>
Vec<T, N> elem_max(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  return lhs.zip_with(rhs, [](T a, T b) { return std::max(a, b); });
}

template<class T, int N>
std::ostream& operator<<(std::ostream& out, const Vec<T, N>& vec) {
  out << "<";
  for (int i = 0; i < N; i++)
    out << (i ? ", " : "") << vec[i];
  return out << ">";
}

}

#endif
