/* alg.hpp

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

#ifndef HEXLAT_ALG_HPP
#define HEXLAT_ALG_HPP

/// \file alg.hpp \brief Generic helper algorithms

#include <algorithm>
#include <vector>
#include <boost/range.hpp>
#include <boost/range/any_range.hpp>

namespace hexlat {

/**
 * Type-erased lazy sequence of values of type C.
 *
 * Generator functions return these so that the Boost range adaptor chain
 * building the sequence does not leak into the signature. The range holds
 * copies of everything it needs, so it can be iterated after the generating
 * call returns, and calling the generator again starts a fresh sequence.
 */
template<class C>
struct Range {
  typedef boost::any_range<C, boost::forward_traversal_tag, C, std::ptrdiff_t> T;
};

/// Materialize a range into a vector.
template<class Range>
std::vector<typename boost::range_value<Range>::type> to_vector(const Range& range) {
  return std::vector<typename boost::range_value<Range>::type>(
      boost::begin(range), boost::end(range));
}

/// Helper function to run all_of over a range without spelling out the begin/end.
template<class Range, class Unary_Predicate>
bool all_of(const Range& a, Unary_Predicate p) {
  return std::all_of(a.begin(), a.end(), p);
}

}

#endif
