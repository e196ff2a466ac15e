//  scale.hpp -- rank reduction and replicated expansion
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

#ifndef katachi_scale_hpp_
#define katachi_scale_hpp_

#include <vector>

#include "image.hpp"

namespace katachi {

//! Halves a \c MONO image in both directions
/*! Each 2 x 2 block becomes a foreground pixel when at least \a level
 *  of its pixels are foreground.  Blocks that stick out beyond odd
 *  sized images count the missing pixels as background.
 *
 *  \throw invalid_size unless \a level is between 1 and 4
 *  \throw wrong_depth for anything but \c MONO images
 */
image reduce_rank_binary_2 (const image& img, int level);

//! Applies reduce_rank_binary_2() once for every entry in \a levels
/*! \throw invalid_size unless there are one to four \a levels
 */
image reduce_rank_cascade (const image& img, const std::vector< int >& levels);

//! Replaces every pixel with a \a factor x \a factor block
/*! Works for both \c MONO and \c GRAY8 images.
 *
 *  \throw invalid_size if \a factor is not positive
 */
image expand_replicate (const image& img, image::size_type factor);

}       // namespace katachi

#endif  /* katachi_scale_hpp_ */
