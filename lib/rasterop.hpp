//  rasterop.hpp -- word-wise bit block transfers
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

#ifndef lib_rasterop_hpp_
#define lib_rasterop_hpp_

/*! \file
 *  \brief Word level shift-and-combine primitives
 *
 *  All functions here operate on whole rows, a 32-bit word at a time,
 *  and work for both \c MONO and \c GRAY8 images.  Offsets are given
 *  in pixels and converted to bit offsets based on the image depth.
 *  They never leave padding bits set in their destination.
 */

#include "katachi/image.hpp"

namespace katachi {
namespace rop {

enum operation {
  SRC_OR_DST,
  SRC_AND_DST,
  NOT_SRC_AND_DST,              // clears what the source sets
};

//! Combines \a src, translated by (\a dx, \a dy), into \a dst
/*! Pixel (x, y) of \a dst is combined with pixel (x - dx, y - dy) of
 *  \a src.  Source columns beyond the image edge read as zero.  Rows
 *  of \a dst whose source row lies outside \a src are left untouched,
 *  irrespective of the \a op.  Use clear_uncovered() to deal with
 *  those where needed.
 *
 *  Both images must have the same depth but may differ in size.
 */
void
translate (image::builder& dst, const image& src,
           image::size_type dx, image::size_type dy, operation op);

//! Zeroes all pixels of \a dst that translate() cannot reach
/*! These are the pixels for which (x - dx, y - dy) lies outside of a
 *  \a width x \a height source image.
 */
void
clear_uncovered (image::builder& dst,
                 image::size_type dx, image::size_type dy,
                 image::size_type width, image::size_type height);

//! Zeroes a rectangle of \a dst, clipped to the image
void
clear_rect (image::builder& dst,
            image::size_type x, image::size_type y,
            image::size_type width, image::size_type height);

}       // namespace rop
}       // namespace katachi

#endif  /* lib_rasterop_hpp_ */
