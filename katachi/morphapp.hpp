//  morphapp.hpp -- compound binary morphology
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

#ifndef katachi_morphapp_hpp_
#define katachi_morphapp_hpp_

#include <string>
#include <vector>

#include "image.hpp"
#include "sel.hpp"

namespace katachi {

/*! \file
 *  \brief Compound operations built from the binary primitives
 */

//! Binary operations that take a structuring element
enum sel_operation {
  SEL_DILATE,
  SEL_ERODE,
  SEL_OPEN,
  SEL_CLOSE,
  SEL_HIT_MISS,
};

//! Pixels set by \a op for at least one of \a sels
/*! \throw invalid_size if \a sels is empty
 */
image union_of_morph_ops (const image& img, const std::vector< sel >& sels,
                          sel_operation op);

//! Pixels set by \a op for every one of \a sels
/*! \throw invalid_size if \a sels is empty
 */
image intersection_of_morph_ops (const image& img,
                                 const std::vector< sel >& sels,
                                 sel_operation op);

//! Binary reconstruction of \a seed within \a mask
/*! Dilates with a 3 x 3 brick (\a connectivity 8) or cross
 *  (\a connectivity 4) and clips to \a mask until nothing changes or
 *  \a max_iters steps have been made.  A \a max_iters of zero allows
 *  up to 1000 steps.
 *
 *  \throw invalid_size if \a seed and \a mask differ in size or when
 *         \a max_iters is negative
 *  \throw unsupported_operation for a \a connectivity other than 4
 *         or 8
 */
image seedfill_morph (const image& seed, const image& mask,
                      int max_iters = 0, int connectivity = 8);

//! Runs a sequence, then puts back the source pixels under \a mask
/*! Only the area that \a img, \a mask and the sequence's result have
 *  in common is restored.  An empty \a mask restores nothing.
 */
image morph_sequence_masked (const image& img, const image& mask,
                             const std::string& text);

}       // namespace katachi

#endif  /* katachi_morphapp_hpp_ */
