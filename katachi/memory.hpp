//  memory.hpp -- smart pointer selection
//  Copyright (C) 2026  Katachi contributors
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
//
//  License: GPL-3.0+
//  Author : EPSON AVASYS CORPORATION
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

#ifndef katachi_memory_hpp_
#define katachi_memory_hpp_

/*! \file
 *  \brief Inject managed memory pointers into the katachi namespace
 *
 *  Raster data is shared between images by reference counting.  The
 *  image classes only care about \c shared_ptr semantics, not about
 *  whether these are provided by the C++11 standard library or by
 *  Boost.  This header file lets them use it as if it were part of
 *  the \c katachi namespace.
 */

#if __cplusplus >= 201103L

#include <memory>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#define NAMESPACE boost

#endif

namespace katachi {

using NAMESPACE::make_shared;
using NAMESPACE::shared_ptr;

}       // namespace katachi

#undef NAMESPACE

#endif  /* katachi_memory_hpp_ */
