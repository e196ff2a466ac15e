//  brick.hpp -- brick, separable and composite morphology
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

#ifndef katachi_brick_hpp_
#define katachi_brick_hpp_

#include "image.hpp"
#include "sel.hpp"

namespace katachi {

/*! \file
 *  \brief Binary morphology with rectangular structuring elements
 *
 *  A rectangle is separable.  Rather than applying all of its hits in
 *  one go, the functions here apply a horizontal line followed by a
 *  vertical one.  This takes hsize + vsize passes instead of hsize
 *  times vsize and gives bit identical results.
 *
 *  The plain \c *_brick functions only support odd sizes.  An even
 *  size is silently incremented by one.  The \c *_comp_brick ones use
 *  their sizes as given and split each of the line passes into two
 *  smaller ones, a short brick followed by a sparse comb.
 *
 *  All functions throw wrong_depth for anything but \c MONO images
 *  and invalid_size for zero sizes.
 */

image dilate_brick (const image& img, image::size_type hsize,
                    image::size_type vsize);
image erode_brick (const image& img, image::size_type hsize,
                   image::size_type vsize);
image open_brick (const image& img, image::size_type hsize,
                  image::size_type vsize);
image close_brick (const image& img, image::size_type hsize,
                   image::size_type vsize);
image close_safe_brick (const image& img, image::size_type hsize,
                        image::size_type vsize);

//! Dilates by \a s, using two line passes if \a s is all hits
image dilate_separable (const image& img, const sel& s);
//! Erodes by \a s, using two line passes if \a s is all hits
image erode_separable (const image& img, const sel& s);

//! Splits \a size into two factors with \a f1 <= \a f2
/*! \a f1 is the largest divisor of \a size that does not exceed its
 *  square root.  It is one if \a size is prime.
 *
 *  \throw invalid_size if \a size is not positive
 */
void select_composable_sizes (image::size_type size,
                              image::size_type& f1, image::size_type& f2);

image dilate_comp_brick (const image& img, image::size_type hsize,
                         image::size_type vsize);
image erode_comp_brick (const image& img, image::size_type hsize,
                        image::size_type vsize);
image open_comp_brick (const image& img, image::size_type hsize,
                       image::size_type vsize);
image close_comp_brick (const image& img, image::size_type hsize,
                        image::size_type vsize);
image close_safe_comp_brick (const image& img, image::size_type hsize,
                             image::size_type vsize);

}       // namespace katachi

#endif  /* katachi_brick_hpp_ */
