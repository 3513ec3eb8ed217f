/* error.hpp

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

#ifndef HEXLAT_ERROR_HPP
#define HEXLAT_ERROR_HPP

#include <stdexcept>

namespace hexlat {

class Hex_Exception : public std::exception {
};


/// Exception thrown when cube coordinates do not sum to zero.
class Invalid_Coordinate : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "Cube coordinates must sum to zero";
  }
};


class Division_By_Zero : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "Hex divided by zero";
  }
};


/// Exception thrown for a direction, diagonal, clock hour, compass point or
/// corner index outside its domain.
class Invalid_Direction : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "Invalid direction";
  }
};


class Invalid_Radius : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "Radius must not be negative";
  }
};


class Invalid_Size : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "Shape dimensions must not be negative";
  }
};


/// Exception thrown when a Hex_Map has no entry for a hex.
class Key_Not_Found : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "Hex not found in map";
  }
};


/// Exception thrown for a singular orientation matrix, or when asking a
/// custom orientation for metrics only the presets define.
class Invalid_Orientation : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "Invalid orientation";
  }
};


class Layout_Not_Set : public Hex_Exception {
 public:
  virtual const char* what() const throw() {
    return "No default layout has been set";
  }
};

}

#endif
