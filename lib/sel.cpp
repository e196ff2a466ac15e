//  sel.cpp -- structuring elements
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
#include <cstdlib>

#include <boost/throw_exception.hpp>

#include "katachi/exception.hpp"
#include "katachi/format.hpp"
#include "katachi/sel.hpp"

namespace katachi {

typedef sel::size_type size_type;

namespace {

void
check_positive (size_type size, const char *what)
{
  if (0 < size) return;

  BOOST_THROW_EXCEPTION
    (invalid_size ((format ("%1% must be positive (got %2%)")
                    % what % size).str ()));
}

}       // namespace

sel::sel (size_type width, size_type height, size_type cx, size_type cy,
          const std::vector< element >& grid, const std::string& name)
  : width_(width)
  , height_(height)
  , cx_(cx)
  , cy_(cy)
  , grid_(grid)
  , name_(name)
{
  check_positive (width_, "structuring element width");
  check_positive (height_, "structuring element height");

  if (0 > cx_ || cx_ >= width_ || 0 > cy_ || cy_ >= height_)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("origin (%1%, %2%) outside %3% x %4% grid")
                      % cx_ % cy_ % width_ % height_).str ()));

  if (grid_.size () != std::vector< element >::size_type (width_ * height_))
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("%1% elements do not make a %2% x %3% grid")
                      % grid_.size () % width_ % height_).str ()));
}

sel
sel::brick (size_type width, size_type height)
{
  return brick (width, height, width / 2, height / 2);
}

sel
sel::brick (size_type width, size_type height, size_type cx, size_type cy)
{
  check_positive (width, "brick width");
  check_positive (height, "brick height");

  return sel (width, height, cx, cy,
              std::vector< element > (width * height, HIT),
              (format ("brick-%1%x%2%") % width % height).str ());
}

sel
sel::horizontal (size_type length)
{
  return brick (length, 1);
}

sel
sel::vertical (size_type length)
{
  return brick (1, length);
}

sel
sel::square (size_type size)
{
  return brick (size, size);
}

sel
sel::cross (size_type size)
{
  check_positive (size, "cross size");
  if (0 == size % 2)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("cross size must be odd (got %1%)")
                      % size).str ()));

  const size_type c = size / 2;
  std::vector< element > grid (size * size, DONT_CARE);

  for (size_type i = 0; i < size; ++i)
    {
      grid[c * size + i] = HIT;
      grid[i * size + c] = HIT;
    }
  return sel (size, size, c, c, grid,
              (format ("cross-%1%") % size).str ());
}

sel
sel::diamond (size_type radius)
{
  check_positive (radius, "diamond radius");

  const size_type size = 2 * radius + 1;
  std::vector< element > grid (size * size, DONT_CARE);

  for (size_type y = 0; y < size; ++y)
    for (size_type x = 0; x < size; ++x)
      if (std::abs (x - radius) + std::abs (y - radius) <= radius)
        grid[y * size + x] = HIT;

  return sel (size, size, radius, radius, grid,
              (format ("diamond-%1%") % radius).str ());
}

sel
sel::disk (size_type radius)
{
  check_positive (radius, "disk radius");

  const size_type size = 2 * radius + 1;
  std::vector< element > grid (size * size, DONT_CARE);

  for (size_type y = 0; y < size; ++y)
    for (size_type x = 0; x < size; ++x)
      {
        size_type dx = x - radius;
        size_type dy = y - radius;
        if (dx * dx + dy * dy <= radius * radius)
          grid[y * size + x] = HIT;
      }

  return sel (size, size, radius, radius, grid,
              (format ("disk-%1%") % radius).str ());
}

sel
sel::comb (size_type f1, size_type f2, direction dir)
{
  check_positive (f1, "comb spacing");
  check_positive (f2, "comb hit count");

  const size_type size = f1 * f2;
  std::vector< element > grid (size, DONT_CARE);

  for (size_type i = 0; i < f2; ++i)
    grid[f1 / 2 + i * f1] = HIT;

  std::string name ((format ("comb-%1%x%2%") % f1 % f2).str ());

  if (HORIZONTAL == dir)
    return sel (size, 1, size / 2, 0, grid, name);
  return sel (1, size, 0, size / 2, grid, name);
}

sel
sel::from_string (const std::string& pattern, size_type cx, size_type cy,
                  const std::string& name)
{
  std::vector< element > grid;
  size_type width  = 0;
  size_type height = 0;
  size_type column = 0;

  for (std::string::size_type i = 0; i <= pattern.size (); ++i)
    {
      char c = (i < pattern.size () ? pattern[i] : '\n');

      if ('\n' == c)
        {
          if (0 == column) continue;          // skip empty lines
          if (0 == height) width = column;
          if (column != width)
            BOOST_THROW_EXCEPTION
              (invalid_size ((format ("row %1% has %2% elements, expected %3%")
                              % height % column % width).str ()));
          ++height;
          column = 0;
          continue;
        }

      switch (c)
        {
        case 'X': cx = column; cy = height;   // fall through
        case 'x': grid.push_back (HIT); break;
        case 'O': cx = column; cy = height;   // fall through
        case 'o': grid.push_back (MISS); break;
        case 'C': cx = column; cy = height;   // fall through
        case '.': grid.push_back (DONT_CARE); break;
        default:
          BOOST_THROW_EXCEPTION
            (invalid_size ((format ("invalid element '%1%' in pattern")
                            % c).str ()));
        }
      ++column;
    }

  if (0 == height)
    BOOST_THROW_EXCEPTION (invalid_size ("empty structuring element pattern"));

  return sel (width, height, cx, cy, grid, name);
}

size_type
sel::width () const
{
  return width_;
}

size_type
sel::height () const
{
  return height_;
}

size_type
sel::cx () const
{
  return cx_;
}

size_type
sel::cy () const
{
  return cy_;
}

const std::string&
sel::name () const
{
  return name_;
}

sel::element
sel::at (size_type x, size_type y) const
{
  if (0 > x || x >= width_ || 0 > y || y >= height_)
    BOOST_THROW_EXCEPTION
      (out_of_bounds ((format ("element (%1%, %2%) outside %3% x %4% grid")
                       % x % y % width_ % height_).str ()));

  return grid_[y * width_ + x];
}

size_type
sel::hit_count () const
{
  return std::count (grid_.begin (), grid_.end (), HIT);
}

size_type
sel::miss_count () const
{
  return std::count (grid_.begin (), grid_.end (), MISS);
}

sel::offset_list
sel::hit_offsets () const
{
  return offsets_of (HIT);
}

sel::offset_list
sel::miss_offsets () const
{
  return offsets_of (MISS);
}

bool
sel::is_brick () const
{
  return (std::vector< element >::size_type (hit_count ()) == grid_.size ());
}

sel
sel::reflect () const
{
  std::vector< element > grid (grid_.rbegin (), grid_.rend ());

  return sel (width_, height_, width_ - 1 - cx_, height_ - 1 - cy_,
              grid, name_);
}

sel
sel::rotate_orth (int quads) const
{
  if (0 > quads || 3 < quads)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("cannot rotate by %1% quarter turns")
                      % quads).str ()));

  if (2 == quads) return reflect ();

  sel rv (*this);

  for (int q = 0; q < quads; ++q)
    {
      //  (x, y) moves to (height - 1 - y, x)
      std::vector< element > grid (rv.grid_.size ());
      for (size_type y = 0; y < rv.height_; ++y)
        for (size_type x = 0; x < rv.width_; ++x)
          grid[x * rv.height_ + (rv.height_ - 1 - y)]
            = rv.grid_[y * rv.width_ + x];

      rv = sel (rv.height_, rv.width_,
                rv.height_ - 1 - rv.cy_, rv.cx_, grid, name_);
    }
  return rv;
}

void
sel::max_translations (size_type& left, size_type& right,
                       size_type& up, size_type& down) const
{
  left = right = up = down = 0;

  offset_list hits (hit_offsets ());
  offset_list::const_iterator it;
  for (it = hits.begin (); hits.end () != it; ++it)
    {
      left  = std::max (left,  -it->first);
      right = std::max (right,  it->first);
      up    = std::max (up,    -it->second);
      down  = std::max (down,   it->second);
    }
}

sel::offset_list
sel::offsets_of (element e) const
{
  offset_list rv;

  for (size_type y = 0; y < height_; ++y)
    for (size_type x = 0; x < width_; ++x)
      if (e == grid_[y * width_ + x])
        rv.push_back (offset (x - cx_, y - cy_));

  return rv;
}

}       // namespace katachi
