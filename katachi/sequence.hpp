//  sequence.hpp -- morphological operation sequences
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

#ifndef katachi_sequence_hpp_
#define katachi_sequence_hpp_

#include <string>
#include <vector>

#include <boost/operators.hpp>
#include <boost/variant.hpp>

#include "gray-morph.hpp"
#include "image.hpp"

namespace katachi {

//! Dilation, erosion, opening or closing with a brick
struct brick_op
  : private boost::equality_comparable< brick_op >
{
  enum operation {
    DILATE,
    ERODE,
    OPEN,
    CLOSE,
  };

  brick_op (operation op = DILATE,
            image::size_type hsize = 1, image::size_type vsize = 1);

  bool operator== (const brick_op& rhs) const;

  operation op;
  image::size_type hsize;
  image::size_type vsize;
};

//! Grayscale tophat with a brick
struct tophat_op
  : private boost::equality_comparable< tophat_op >
{
  tophat_op (tophat_type type = WHITE,
             image::size_type hsize = 1, image::size_type vsize = 1);

  bool operator== (const tophat_op& rhs) const;

  tophat_type type;
  image::size_type hsize;
  image::size_type vsize;
};

//! Cascade of 2x rank reductions, one level per reduction
struct rank_op
  : private boost::equality_comparable< rank_op >
{
  bool operator== (const rank_op& rhs) const;

  std::vector< int > levels;
};

//! Replicative expansion
struct expand_op
  : private boost::equality_comparable< expand_op >
{
  explicit expand_op (image::size_type factor = 2);

  bool operator== (const expand_op& rhs) const;

  image::size_type factor;
};

//! Temporary background border around the whole sequence
struct border_op
  : private boost::equality_comparable< border_op >
{
  explicit border_op (image::size_type size = 0);

  bool operator== (const border_op& rhs) const;

  image::size_type size;
};

typedef boost::variant< brick_op, tophat_op, rank_op, expand_op, border_op >
  morph_op;

//! Parsed chain of morphological operations
/*! Sequences are written as a list of operations separated by \c +
 *  signs.  Whitespace is ignored and letters may be in either case.
 *  The following operations are understood
 *
 *   - \c d<w>.<h>, \c e<w>.<h>, \c o<w>.<h> and \c c<w>.<h> dilate,
 *     erode, open and close with a \c w by \c h brick
 *   - \c tw<w>.<h> and \c tb<w>.<h> compute a white or black tophat,
 *     grayscale images only
 *   - \c r<levels> performs one 2x rank reduction for every digit,
 *     using that digit, 1 to 4, as the rank level, at most four
 *   - \c x<factor> expands by 2, 4, 8 or 16
 *   - \c b<size> adds a border that is removed again at the end.  It
 *     is only allowed as the first operation.
 *
 *  For example, \c "b32 + o1.3 + c7.1 + r23 + x4".
 */
class morph_sequence
{
public:
  typedef std::vector< morph_op > container_type;
  typedef container_type::const_iterator const_iterator;
  typedef container_type::size_type size_type;

  //! Turns \a text into a sequence of operations
  /*! \throw invalid_sequence if \a text does not follow the grammar
   *  \throw unsupported_operation for operations that start with an
   *         unknown letter
   */
  static morph_sequence parse (const std::string& text);

  const_iterator begin () const;
  const_iterator end () const;

  size_type size () const;
  bool empty () const;

  const morph_op& operator[] (size_type i) const;

private:
  morph_sequence ();

  container_type ops_;
};

//! Runs all operations in \a seq on \a img, left to right
/*! \c MONO images use the brick functions, \c GRAY8 images use the
 *  grayscale engine.  Operations that do not apply to the kind of
 *  image given are rejected before anything else is done.
 *
 *  \throw unsupported_operation for tophats on \c MONO images and for
 *         rank reductions, expansions and borders on \c GRAY8 images
 *  \throw invalid_sequence if the border cannot be removed after the
 *         net scaling of the sequence
 */
image execute (const image& img, const morph_sequence& seq);

//! Like execute() but with composite bricks for \c MONO images
image execute_composite (const image& img, const morph_sequence& seq);

//! Parses \a text and executes the result on \a img
image morph_sequence_apply (const image& img, const std::string& text);

}       // namespace katachi

#endif  /* katachi_sequence_hpp_ */
