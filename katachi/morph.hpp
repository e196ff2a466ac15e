//  morph.hpp -- binary morphology with structuring elements
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

#ifndef katachi_morph_hpp_
#define katachi_morph_hpp_

#include "image.hpp"
#include "sel.hpp"

namespace katachi {

/*! \file
 *  \brief Binary morphology with arbitrary structuring elements
 *
 *  These work on \c MONO images only and throw wrong_depth for any
 *  other kind of image.  Each hit of the structuring element costs a
 *  single pass of word-wide shifts over the image.
 *
 *  Pixels outside the image are background, for dilation as well as
 *  for erosion.  As a consequence, erosion removes foreground that
 *  touches the image edge.  Use close_safe() if that is undesirable
 *  for a closing.
 */

//! Sets every pixel for which some hit sees foreground
/*! \throw invalid_size if \a s has no hits
 */
image dilate (const image& img, const sel& s);

//! Keeps only pixels for which all hits see foreground
/*! \throw invalid_size if \a s has no hits
 */
image erode (const image& img, const sel& s);

image open (const image& img, const sel& s);
image close (const image& img, const sel& s);

//! Closes \a img without eroding foreground near the image edges
/*! The image is temporarily extended with enough background for the
 *  dilation to spill into.
 */
image close_safe (const image& img, const sel& s);

//! Hit-miss transform
/*! Keeps pixels for which all hits see foreground and all misses see
 *  background.
 */
image hit_miss (const image& img, const sel& s);

//! Hit-miss transform followed by a dilation with the hits
image open_generalized (const image& img, const sel& s);
//! Dilation followed by a hit-miss transform
image close_generalized (const image& img, const sel& s);

//! Dilation minus erosion
image gradient (const image& img, const sel& s);
//! Foreground removed by an opening
image top_hat (const image& img, const sel& s);
//! Background filled in by a closing
image bottom_hat (const image& img, const sel& s);

enum boundary_type {
  INNER,                        //!< foreground touching the background
  OUTER,                        //!< background touching the foreground
};

//! One pixel wide boundary of the foreground, 8-connected
image extract_boundary (const image& img, boundary_type type);

}       // namespace katachi

#endif  /* katachi_morph_hpp_ */
