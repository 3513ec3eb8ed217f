/* hex_map.hpp

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

#ifndef HEXLAT_HEX_MAP_HPP
#define HEXLAT_HEX_MAP_HPP

#include <hexlat/hex.hpp>
#include <hexlat/box.hpp>
#include <hexlat/layout.hpp>
#include <hexlat/error.hpp>
#include <boost/optional.hpp>
#include <list>
#include <map>
#include <utility>
#include <vector>

namespace hexlat {

/**
 * Sparse grid of values keyed by lattice cell.
 *
 * Entries iterate in the order their cells were first inserted, and
 * overwriting the value of a cell keeps its place. Only integer cells can be
 * keys, fractional hexes have to be rounded first.
 */
template <class T>
class Hex_Map {
  typedef std::list<std::pair<const Hexi, T>> Entry_List;
 public:
  typedef typename Entry_List::value_type value_type;
  typedef typename Entry_List::iterator iterator;
  typedef typename Entry_List::const_iterator const_iterator;

  Hex_Map() {}

  Hex_Map(const Hex_Map<T>& rhs) {
    for (auto& entry : rhs)
      insert(entry.first, entry.second);
  }

  Hex_Map(Hex_Map<T>&& rhs) {
    swap(rhs);
  }

  Hex_Map<T>& operator=(Hex_Map<T> rhs) {
    swap(rhs);
    return *this;
  }

  /// Map every cell of `hexes` to `value`.
  template<class Hex_Range>
  static Hex_Map<T> from_hexes(const Hex_Range& hexes, const T& value = T()) {
    Hex_Map<T> result;
    result.insert_all(hexes, value);
    return result;
  }

  void swap(Hex_Map<T>& rhs) {
    // List iterators stay valid across a swap, so the index can follow.
    entries.swap(rhs.entries);
    index.swap(rhs.index);
  }

  /// Set the value at `hex`, adding the cell if it is not in the map yet.
  void insert(const Hexi& hex, const T& value) {
    auto iter = index.find(hex);
    if (iter != index.end()) {
      iter->second->second = value;
    } else {
      entries.push_back(value_type(hex, value));
      index[hex] = --entries.end();
    }
  }

  template<class Hex_Range>
  void insert_all(const Hex_Range& hexes, const T& value) {
    for (const Hexi& hex : hexes)
      insert(hex, value);
  }

  /// Insert the value `factory(hex)` for every cell in `hexes`.
  template<class Hex_Range, class Factory>
  void insert_generated(const Hex_Range& hexes, Factory factory) {
    for (const Hexi& hex : hexes)
      insert(hex, factory(hex));
  }

  /// Throws Key_Not_Found if `hex` is not in the map.
  void remove(const Hexi& hex) {
    auto iter = index.find(hex);
    if (iter == index.end())
      throw Key_Not_Found();
    entries.erase(iter->second);
    index.erase(iter);
  }

  T& get(const Hexi& hex) {
    auto iter = index.find(hex);
    if (iter == index.end())
      throw Key_Not_Found();
    return iter->second->second;
  }

  const T& get(const Hexi& hex) const {
    auto iter = index.find(hex);
    if (iter == index.end())
      throw Key_Not_Found();
    return iter->second->second;
  }

  boost::optional<T> find(const Hexi& hex) const {
    auto iter = index.find(hex);
    if (iter == index.end())
      return boost::optional<T>();
    return boost::optional<T>(iter->second->second);
  }

  bool contains(const Hexi& hex) const {
    return index.find(hex) != index.end();
  }

  /// Value at `hex`, a default value is inserted for a missing cell.
  T& operator[](const Hexi& hex) {
    if (!contains(hex))
      insert(hex, T());
    return get(hex);
  }

  size_t size() const { return entries.size(); }

  bool empty() const { return entries.empty(); }

  void clear() {
    index.clear();
    entries.clear();
  }

  iterator begin() { return entries.begin(); }
  iterator end() { return entries.end(); }
  const_iterator begin() const { return entries.begin(); }
  const_iterator end() const { return entries.end(); }

  /// Cells of the map in iteration order.
  std::vector<Hexi> hexes() const {
    std::vector<Hexi> result;
    for (auto& entry : entries)
      result.push_back(entry.first);
    return result;
  }

  std::vector<Hexi> hexes_with(const T& value) const {
    std::vector<Hexi> result;
    for (auto& entry : entries) {
      if (entry.second == value)
        result.push_back(entry.first);
    }
    return result;
  }

  void set_all(const T& value) {
    for (auto& entry : entries)
      entry.second = value;
  }

  /// Smallest cube coordinate box containing every cell. Empty for an empty map.
  Cubei bounds() const {
    std::vector<Vec3i> points;
    for (auto& entry : entries)
      points.push_back(entry.first.cube());
    return Cubei::smallest_containing(points.begin(), points.end());
  }

  Rectd pixel_bounds(const Layout& layout) const {
    return layout.pixel_bounds(hexes());
  }

  /// Copy of the map with every cell moved by `offset`.
  Hex_Map<T> shifted(const Hexi& offset) const {
    Hex_Map<T> result;
    for (auto& entry : entries)
      result.insert(entry.first + offset, entry.second);
    return result;
  }

  /// Cells of both maps. Cells in both keep the value from this map.
  Hex_Map<T> united(const Hex_Map<T>& other) const {
    Hex_Map<T> result(*this);
    for (auto& entry : other) {
      if (!contains(entry.first))
        result.insert(entry.first, entry.second);
    }
    return result;
  }

  /// Cells of both maps. Cells in both get `merge(this_value, other_value)`.
  template<class Merge>
  Hex_Map<T> united(const Hex_Map<T>& other, Merge merge) const {
    Hex_Map<T> result(*this);
    for (auto& entry : other) {
      auto iter = index.find(entry.first);
      if (iter != index.end())
        result.insert(entry.first, merge(iter->second->second, entry.second));
      else
        result.insert(entry.first, entry.second);
    }
    return result;
  }

  /// Cells found in both maps, with the values from this map.
  Hex_Map<T> intersected(const Hex_Map<T>& other) const {
    Hex_Map<T> result;
    for (auto& entry : entries) {
      if (other.contains(entry.first))
        result.insert(entry.first, entry.second);
    }
    return result;
  }

  template<class Merge>
  Hex_Map<T> intersected(const Hex_Map<T>& other, Merge merge) const {
    Hex_Map<T> result;
    for (auto& entry : entries) {
      auto iter = other.index.find(entry.first);
      if (iter != other.index.end())
        result.insert(entry.first, merge(entry.second, iter->second->second));
    }
    return result;
  }

  Hex_Map<T> difference(const Hex_Map<T>& other) const {
    Hex_Map<T> result;
    for (auto& entry : entries) {
      if (!other.contains(entry.first))
        result.insert(entry.first, entry.second);
    }
    return result;
  }

  /// Cells found in exactly one of the maps.
  Hex_Map<T> symmetric_difference(const Hex_Map<T>& other) const {
    Hex_Map<T> result = difference(other);
    for (auto& entry : other) {
      if (!contains(entry.first))
        result.insert(entry.first, entry.second);
    }
    return result;
  }

 private:
  Entry_List entries;
  std::map<Hexi, iterator, Hex_Less> index;
};

}

#endif
