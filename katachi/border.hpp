//  border.hpp -- image border padding and removal
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

#ifndef katachi_border_hpp_
#define katachi_border_hpp_

#include "image.hpp"

namespace katachi {

//! Returns a copy of \a img surrounded by \a npix pixels of \a value
image
add_border (const image& img, image::size_type npix, uint32_t value = 0);

//! Returns a copy of \a img with borders of individual widths added
image
add_border (const image& img,
            image::size_type left, image::size_type right,
            image::size_type top, image::size_type bottom,
            uint32_t value = 0);

//! Strips \a npix pixels from every side of \a img
/*! \throw invalid_size if nothing would remain
 */
image
remove_border (const image& img, image::size_type npix);

image
remove_border (const image& img,
               image::size_type left, image::size_type right,
               image::size_type top, image::size_type bottom);

}       // namespace katachi

#endif  /* katachi_border_hpp_ */
