//  image.cpp -- bit-packed and 8-bit raster images
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <algorithm>
#include <climits>

#include <boost/throw_exception.hpp>

#include "katachi/exception.hpp"
#include "katachi/format.hpp"
#include "katachi/image.hpp"

namespace katachi {

namespace {

image::size_type
depth_of (image::pixel_type type)
{
  return (image::MONO == type ? 1 : 8);
}

//! Number of words needed to hold \a width pixels
image::size_type
words_for (image::size_type width, image::pixel_type type)
{
  const image::size_type per_word = 32 / depth_of (type);

  return width / per_word + (0 < width % per_word ? 1 : 0);
}

//! Number of bits set in \a w
image::size_type
count_bits (image::word_type w)
{
  w = w - ((w >> 1) & 0x55555555);
  w = (w & 0x33333333) + ((w >> 2) & 0x33333333);
  w = (w + (w >> 4)) & 0x0f0f0f0f;
  return (w * 0x01010101) >> 24;
}

void
check_bounds (image::size_type x, image::size_type y,
              image::size_type width, image::size_type height)
{
  if (0 <= x && x < width && 0 <= y && y < height) return;

  BOOST_THROW_EXCEPTION
    (out_of_bounds ((format ("pixel (%1%, %2%) outside %3% x %4% image")
                     % x % y % width % height).str ()));
}

}       // namespace

image::raster::raster (size_type width, size_type height, pixel_type type)
  : type (type)
  , width (width)
  , height (height)
  , wpl (words_for (width, type))
{
  if (0 >= width || 0 >= height)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("cannot create a %1% x %2% image")
                      % width % height).str ()));

  if (INT_MAX / height < wpl || INT_MAX / depth_of (type) < width)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("a %1% x %2% image is too large")
                      % width % height).str ()));

  words.assign (wpl * height, 0);
}

image::image ()
{}

image::image (size_type width, size_type height, pixel_type type)
  : raster_(make_shared< raster > (width, height, type))
{}

image::image (builder& b)
{
  raster_.swap (b.raster_);
}

bool
image::empty () const
{
  return !raster_;
}

image::pixel_type
image::type () const
{
  return raster_->type;
}

image::size_type
image::width () const
{
  return raster_->width;
}

image::size_type
image::height () const
{
  return raster_->height;
}

image::size_type
image::depth () const
{
  return depth_of (raster_->type);
}

image::size_type
image::words_per_line () const
{
  return raster_->wpl;
}

const image::word_type *
image::data () const
{
  return &raster_->words[0];
}

const image::word_type *
image::line (size_type y) const
{
  return &raster_->words[y * raster_->wpl];
}

uint32_t
image::get (size_type x, size_type y) const
{
  check_bounds (x, y, width (), height ());
  return get_unchecked (x, y);
}

image::size_type
image::count_pixels () const
{
  if (MONO != type ())
    BOOST_THROW_EXCEPTION
      (wrong_depth ("pixel count requires a 1-bit image"));

  size_type count = 0;
  std::vector< word_type >::const_iterator it;
  for (it = raster_->words.begin (); raster_->words.end () != it; ++it)
    count += count_bits (*it);

  return count;
}

image
image::clone () const
{
  image rv;

  if (raster_)
    rv.raster_ = make_shared< raster > (*raster_);

  return rv;
}

long
image::use_count () const
{
  return raster_.use_count ();
}

bool
image::operator== (const image& rhs) const
{
  if (raster_ == rhs.raster_) return true;
  if (!raster_ || !rhs.raster_) return false;

  return (raster_->type   == rhs.raster_->type
          && raster_->width  == rhs.raster_->width
          && raster_->height == rhs.raster_->height
          && raster_->words  == rhs.raster_->words);
}

image::builder::builder (size_type width, size_type height, pixel_type type)
  : raster_(make_shared< image::raster > (width, height, type))
{}

image::builder::builder (image& img)
{
  if (img.empty ())
    BOOST_THROW_EXCEPTION
      (invalid_size ("cannot modify an empty image"));

  raster_.swap (img.raster_);

  if (1 != raster_.use_count ())
    raster_ = make_shared< image::raster > (*raster_);
}

bool
image::builder::empty () const
{
  return !raster_;
}

image::pixel_type
image::builder::type () const
{
  return raster_->type;
}

image::size_type
image::builder::width () const
{
  return raster_->width;
}

image::size_type
image::builder::height () const
{
  return raster_->height;
}

image::size_type
image::builder::depth () const
{
  return depth_of (raster_->type);
}

image::size_type
image::builder::words_per_line () const
{
  return raster_->wpl;
}

image::word_type *
image::builder::data ()
{
  return &raster_->words[0];
}

image::word_type *
image::builder::line (size_type y)
{
  return &raster_->words[y * raster_->wpl];
}

uint32_t
image::builder::get (size_type x, size_type y) const
{
  check_bounds (x, y, width (), height ());
  return get_unchecked (x, y);
}

void
image::builder::set (size_type x, size_type y, uint32_t value)
{
  check_bounds (x, y, width (), height ());
  set_unchecked (x, y, value);
}

void
image::builder::clear ()
{
  std::fill (raster_->words.begin (), raster_->words.end (), 0);
}

void
image::builder::set_all ()
{
  std::fill (raster_->words.begin (), raster_->words.end (), ~word_type (0));
  clear_padding ();
}

void
image::builder::clear_padding ()
{
  size_type bits = (raster_->width * depth ()) & 31;

  if (!bits) return;

  word_type mask = ~word_type (0) << (32 - bits);
  word_type *last = &raster_->words[raster_->wpl - 1];

  for (size_type y = 0; y < raster_->height; ++y, last += raster_->wpl)
    *last &= mask;
}

}       // namespace katachi
