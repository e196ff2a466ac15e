//  gray-morph.cpp -- grayscale morphology
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
#include <vector>

#include <boost/throw_exception.hpp>

#include "katachi/exception.hpp"
#include "katachi/gray-morph.hpp"
#include "katachi/log.hpp"

#include "morph-check.hpp"

namespace katachi {

typedef image::size_type size_type;
typedef std::vector< uint8_t > octets;

namespace {

struct max_of
{
  static const uint8_t border = 0;

  uint8_t operator() (uint8_t a, uint8_t b) const
  {
    return (a < b ? b : a);
  }
};

struct min_of
{
  static const uint8_t border = 0xff;

  uint8_t operator() (uint8_t a, uint8_t b) const
  {
    return (a < b ? a : b);
  }
};

const uint8_t max_of::border;
const uint8_t min_of::border;

//! Pixel values of \a img, one octet per pixel, row by row
octets
unpack (const image& img)
{
  octets rv (img.width () * img.height ());

  octets::iterator it = rv.begin ();
  for (size_type y = 0; y < img.height (); ++y)
    for (size_type x = 0; x < img.width (); ++x, ++it)
      *it = img.get_unchecked (x, y);

  return rv;
}

image
pack (const octets& pixels, size_type width, size_type height)
{
  image::builder b (width, height, image::GRAY8);

  octets::const_iterator it = pixels.begin ();
  for (size_type y = 0; y < height; ++y)
    for (size_type x = 0; x < width; ++x, ++it)
      b.set_unchecked (x, y, *it);

  return image (b);
}

//! Extremum over a \a size wide window along a line of \a n pixels
/*! Pixels are \a stride octets apart.  The line is padded with the
 *  border value to a multiple of the window size and split in blocks
 *  of that size.  Running extrema are computed forward and backward
 *  within each block so that any window is covered by the backward
 *  value at its start and the forward value at its end.
 */
template< typename Extremum >
void
vhgw_line (octets& pixels, size_type start, size_type stride,
           size_type n, size_type size,
           octets& buf, octets& fwd, octets& bwd)
{
  Extremum ext;

  const size_type half = size / 2;
  const size_type len  = ((n + size - 1 + size - 1) / size) * size;

  buf.assign (len, Extremum::border);
  fwd.resize (len);
  bwd.resize (len);

  for (size_type i = 0; i < n; ++i)
    buf[half + i] = pixels[start + i * stride];

  for (size_type i = 0; i < len; ++i)
    fwd[i] = (0 == i % size ? buf[i] : ext (fwd[i - 1], buf[i]));

  for (size_type i = len - 1; 0 <= i; --i)
    bwd[i] = (size - 1 == i % size ? buf[i] : ext (bwd[i + 1], buf[i]));

  for (size_type x = 0; x < n; ++x)
    pixels[start + x * stride] = ext (bwd[x], fwd[x + size - 1]);
}

//! Extremum over a three pixel window along a line of \a n pixels
template< typename Extremum >
void
fast_line (octets& pixels, size_type start, size_type stride,
           size_type n)
{
  Extremum ext;

  uint8_t prev = Extremum::border;
  for (size_type x = 0; x < n; ++x)
    {
      size_type i = start + x * stride;
      uint8_t here = pixels[i];
      uint8_t next = (x + 1 < n ? pixels[i + stride] : Extremum::border);

      pixels[i] = ext (ext (prev, here), next);
      prev = here;
    }
}

template< typename Extremum >
image
apply (const image& img, size_type hsize, size_type vsize)
{
  if (1 == hsize && 1 == vsize) return img.clone ();

  const size_type w = img.width ();
  const size_type h = img.height ();

  octets pixels (unpack (img));

  if (3 >= hsize && 3 >= vsize)
    {
      if (3 == hsize)
        for (size_type y = 0; y < h; ++y)
          fast_line< Extremum > (pixels, y * w, 1, w);
      if (3 == vsize)
        for (size_type x = 0; x < w; ++x)
          fast_line< Extremum > (pixels, x, w, h);
    }
  else
    {
      octets buf, fwd, bwd;

      if (1 < hsize)
        for (size_type y = 0; y < h; ++y)
          vhgw_line< Extremum > (pixels, y * w, 1, w, hsize, buf, fwd, bwd);
      if (1 < vsize)
        for (size_type x = 0; x < w; ++x)
          vhgw_line< Extremum > (pixels, x, w, h, vsize, buf, fwd, bwd);
    }

  return pack (pixels, w, h);
}

void
check_sizes (size_type& hsize, size_type& vsize, const char *what)
{
  if (0 >= hsize || 0 >= vsize)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("%1%: brick sizes must be positive"
                              " (got %2% x %3%)")
                      % what % hsize % vsize).str ()));

  size_type hodd = hsize | 1;
  size_type vodd = vsize | 1;

  if (hodd != hsize || vodd != vsize)
    {
      log::trace (log::GRAY, "%1%: using %2% x %3% instead of %4% x %5%")
        % what % hodd % vodd % hsize % vsize;
      hsize = hodd;
      vsize = vodd;
    }

  log::debug (log::GRAY, "%1%: %2% x %3% brick, %4%")
    % what % hsize % vsize
    % (3 >= hsize && 3 >= vsize ? "direct" : "vHGW");
}

//! Pixel-wise \a lhs minus \a rhs, clipped at zero
image
subtract (const image& lhs, const image& rhs)
{
  image::builder b (lhs.width (), lhs.height (), image::GRAY8);

  for (size_type y = 0; y < lhs.height (); ++y)
    for (size_type x = 0; x < lhs.width (); ++x)
      {
        uint32_t l = lhs.get_unchecked (x, y);
        uint32_t r = rhs.get_unchecked (x, y);
        b.set_unchecked (x, y, (l > r ? l - r : 0));
      }

  return image (b);
}

}       // namespace

image
dilate_gray (const image& img, size_type hsize, size_type vsize)
{
  check_gray (img, "dilate_gray");
  check_sizes (hsize, vsize, "dilate_gray");

  return apply< max_of > (img, hsize, vsize);
}

image
erode_gray (const image& img, size_type hsize, size_type vsize)
{
  check_gray (img, "erode_gray");
  check_sizes (hsize, vsize, "erode_gray");

  return apply< min_of > (img, hsize, vsize);
}

image
open_gray (const image& img, size_type hsize, size_type vsize)
{
  check_gray (img, "open_gray");
  check_sizes (hsize, vsize, "open_gray");

  return apply< max_of > (apply< min_of > (img, hsize, vsize),
                          hsize, vsize);
}

image
close_gray (const image& img, size_type hsize, size_type vsize)
{
  check_gray (img, "close_gray");
  check_sizes (hsize, vsize, "close_gray");

  return apply< min_of > (apply< max_of > (img, hsize, vsize),
                          hsize, vsize);
}

image
tophat_gray (const image& img, size_type hsize, size_type vsize,
             tophat_type type)
{
  if (WHITE == type)
    return subtract (img, open_gray (img, hsize, vsize));

  return subtract (close_gray (img, hsize, vsize), img);
}

image
gradient_gray (const image& img, size_type hsize, size_type vsize)
{
  return subtract (dilate_gray (img, hsize, vsize),
                   erode_gray (img, hsize, vsize));
}

}       // namespace katachi
