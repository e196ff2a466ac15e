//  gray-morph.hpp -- grayscale morphology
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

#ifndef katachi_gray_morph_hpp_
#define katachi_gray_morph_hpp_

#include "image.hpp"

namespace katachi {

/*! \file
 *  \brief Grayscale morphology with rectangular structuring elements
 *
 *  Dilation computes the maximum and erosion the minimum over a
 *  brick centered on each pixel.  Pixels outside the image never
 *  contribute to the result.
 *
 *  Large bricks are handled with the van Herk/Gil-Werman algorithm,
 *  which needs a constant number of comparisons per pixel regardless
 *  of the brick size.  Bricks of at most 3 x 3 take a direct route.
 *
 *  Even sizes are incremented by one.  All functions throw
 *  wrong_depth for anything but \c GRAY8 images and invalid_size for
 *  zero sizes.
 */

enum tophat_type {
  WHITE,                        //!< image minus its opening
  BLACK,                        //!< closing minus the image
};

image dilate_gray (const image& img, image::size_type hsize,
                   image::size_type vsize);
image erode_gray (const image& img, image::size_type hsize,
                  image::size_type vsize);
image open_gray (const image& img, image::size_type hsize,
                 image::size_type vsize);
image close_gray (const image& img, image::size_type hsize,
                  image::size_type vsize);

image tophat_gray (const image& img, image::size_type hsize,
                   image::size_type vsize, tophat_type type);

//! Dilation minus erosion
image gradient_gray (const image& img, image::size_type hsize,
                     image::size_type vsize);

}       // namespace katachi

#endif  /* katachi_gray_morph_hpp_ */
