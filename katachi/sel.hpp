//  sel.hpp -- structuring elements
//  Copyright (C) 2026  Katachi contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Katachi' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifndef katachi_sel_hpp_
#define katachi_sel_hpp_

#include <string>
#include <utility>
#include <vector>

namespace katachi {

//! Structuring element
/*! A rectangular grid of elements with a designated origin.  When a
 *  structuring element is applied to an image, its origin is placed
 *  on each output pixel in turn.  Only \c HIT elements take part in
 *  dilation and erosion, \c MISS elements are only relevant to the
 *  hit-miss transform.
 *
 *  Structuring elements cannot be modified once created.  They are
 *  normally obtained through one of the named constructors.
 */
class sel
{
public:
  typedef int size_type;

  enum element {
    DONT_CARE,
    HIT,
    MISS,
  };

  enum direction {
    HORIZONTAL,
    VERTICAL,
  };

  //! Position of an element relative to the origin, as (dx, dy)
  typedef std::pair< size_type, size_type > offset;
  typedef std::vector< offset > offset_list;

  //! Creates a structuring element from \a grid, stored row by row
  /*! \throw invalid_size if any dimension is not positive, when the
   *         origin is outside the grid or when \a grid does not have
   *         \a width times \a height elements
   */
  sel (size_type width, size_type height,
       size_type cx, size_type cy,
       const std::vector< element >& grid,
       const std::string& name = std::string ());

  //! Solid \a width x \a height rectangle with a central origin
  static sel brick (size_type width, size_type height);
  //! Solid rectangle with its origin at (\a cx, \a cy)
  static sel brick (size_type width, size_type height,
                    size_type cx, size_type cy);
  static sel horizontal (size_type length);
  static sel vertical (size_type length);
  static sel square (size_type size);

  //! Plus sign with arms spanning \a size elements
  /*! \throw invalid_size if \a size is even
   */
  static sel cross (size_type size);

  //! Elements within city block distance \a radius of the center
  static sel diamond (size_type radius);

  //! Elements within Euclidean distance \a radius of the center
  static sel disk (size_type radius);

  //! Sparse line of \a f2 hits spaced \a f1 elements apart
  /*! The comb is \a f1 times \a f2 elements long with its origin at
   *  the center.  The first hit is at \a f1 / 2.  Dilation by a brick
   *  of size \a f1 followed by dilation with this comb is the same as
   *  a dilation by a brick of size \a f1 times \a f2.
   */
  static sel comb (size_type f1, size_type f2,
                   direction dir = HORIZONTAL);

  //! Creates a structuring element from a textual \a pattern
  /*! Rows are separated by newlines and all rows need to be equally
   *  long.  An \c x denotes a hit, an \c o a miss and a \c . stands
   *  for don't care.  The upper case variants \c X, \c O and \c C
   *  (for don't care) mark the origin, overriding \a cx and \a cy.
   *
   *  \throw invalid_size on empty or ragged patterns and for any
   *         characters not mentioned above
   */
  static sel from_string (const std::string& pattern,
                          size_type cx = 0, size_type cy = 0,
                          const std::string& name = std::string ());

  size_type width () const;
  size_type height () const;
  //! Column of the origin
  size_type cx () const;
  //! Row of the origin
  size_type cy () const;
  const std::string& name () const;

  element at (size_type x, size_type y) const;

  size_type hit_count () const;
  size_type miss_count () const;

  //! Positions of all hits relative to the origin, row by row
  offset_list hit_offsets () const;
  //! Positions of all misses relative to the origin, row by row
  offset_list miss_offsets () const;

  //! Tells whether all elements are hits
  bool is_brick () const;

  //! Returns the structuring element rotated by 180 degrees
  sel reflect () const;

  //! Returns the structuring element rotated clockwise by \a quads
  //! quarter turns
  /*! \throw invalid_size unless \a quads is in [0, 3]
   */
  sel rotate_orth (int quads) const;

  //! Largest distances of any hit from the origin
  /*! \a left and \a up are returned as non-negative values.  All of
   *  the values are zero when there are no hits in that direction.
   */
  void max_translations (size_type& left, size_type& right,
                         size_type& up, size_type& down) const;

private:
  offset_list offsets_of (element e) const;

  size_type width_;
  size_type height_;
  size_type cx_;
  size_type cy_;
  std::vector< element > grid_;
  std::string name_;
};

}       // namespace katachi

#endif  /* katachi_sel_hpp_ */
