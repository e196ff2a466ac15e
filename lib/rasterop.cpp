//  rasterop.cpp -- word-wise bit block transfers
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

#include <boost/assert.hpp>

#include "rasterop.hpp"

namespace katachi {
namespace rop {

typedef image::size_type size_type;
typedef image::word_type word_type;

namespace {

//! Floor division by 32 that also works for negative \a bits
inline size_type
word_index (size_type bits)
{
  return (0 <= bits ? bits / 32 : -((31 - bits) / 32));
}

inline word_type
fetch (const word_type *row, size_type wpl, size_type i)
{
  return (0 <= i && i < wpl ? row[i] : 0);
}

//! Zeroes bits [\a first, \a last) in a row of words
void
clear_bits (word_type *row, size_type first, size_type last)
{
  if (first >= last) return;

  size_type fw = first / 32;
  size_type lw = (last - 1) / 32;
  word_type head = ~word_type (0) >> (first & 31);
  word_type tail = ~word_type (0) << (31 - ((last - 1) & 31));

  if (fw == lw)
    {
      row[fw] &= ~(head & tail);
      return;
    }
  row[fw] &= ~head;
  for (size_type i = fw + 1; i < lw; ++i)
    row[i] = 0;
  row[lw] &= ~tail;
}

}       // namespace

void
translate (image::builder& dst, const image& src,
           size_type dx, size_type dy, operation op)
{
  BOOST_ASSERT (dst.type () == src.type ());

  const size_type depth = dst.depth ();
  const size_type dwpl  = dst.words_per_line ();
  const size_type swpl  = src.words_per_line ();

  //  Destination word i starts at source bit 32 * i - bit_dx, i.e. at
  //  bit s of source word i + base.
  const size_type bit_dx = dx * depth;
  const size_type base   = word_index (-bit_dx);
  const size_type s      = -bit_dx - 32 * base;

  const size_type y0 = std::max (size_type (0), dy);
  const size_type y1 = std::min (dst.height (), src.height () + dy);

  for (size_type y = y0; y < y1; ++y)
    {
      const word_type *srow = src.line (y - dy);
      word_type *drow = dst.line (y);

      for (size_type i = 0; i < dwpl; ++i)
        {
          size_type k = i + base;
          word_type w = fetch (srow, swpl, k) << s;

          if (s) w |= fetch (srow, swpl, k + 1) >> (32 - s);

          if      (SRC_OR_DST  == op) drow[i] |=  w;
          else if (SRC_AND_DST == op) drow[i] &=  w;
          else                        drow[i] &= ~w;
        }
    }

  dst.clear_padding ();
}

void
clear_uncovered (image::builder& dst, size_type dx, size_type dy,
                 size_type width, size_type height)
{
  const size_type w = dst.width ();
  const size_type h = dst.height ();

  //  rows and columns whose source lies above or to the left
  clear_rect (dst, 0, 0, w, dy);
  clear_rect (dst, 0, 0, dx, h);

  //  rows and columns whose source lies below or to the right
  clear_rect (dst, 0, height + dy, w, h - (height + dy));
  clear_rect (dst, width + dx, 0, w - (width + dx), h);
}

void
clear_rect (image::builder& dst, size_type x, size_type y,
            size_type width, size_type height)
{
  size_type x0 = std::max (size_type (0), x);
  size_type y0 = std::max (size_type (0), y);
  size_type x1 = std::min (dst.width (), x + width);
  size_type y1 = std::min (dst.height (), y + height);

  if (x0 >= x1 || y0 >= y1) return;

  const size_type depth = dst.depth ();

  for (size_type row = y0; row < y1; ++row)
    clear_bits (dst.line (row), x0 * depth, x1 * depth);
}

}       // namespace rop
}       // namespace katachi
