//  image.hpp -- bit-packed and 8-bit raster images
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

#ifndef katachi_image_hpp_
#define katachi_image_hpp_

#include <vector>

#include <boost/operators.hpp>

#include "cstdint.hpp"
#include "memory.hpp"

namespace katachi {

//! Bit-packed and byte-packed raster images
/*! Pixels are stored row by row in 32-bit words.  Each row starts on
 *  a word boundary and occupies words_per_line() words.  For \c MONO
 *  images the most significant bit of a row's first word holds column
 *  zero, subsequent columns follow toward the least significant bit
 *  and then continue in the next word.  \c GRAY8 images use the same
 *  layout with one octet per pixel, most significant octet first.
 *
 *  Bits in the last word of a row that lie beyond the image's width
 *  are padding.  They are zero for every image handed out by the
 *  library.
 *
 *  An image is an immutable, reference counted handle to its pixel
 *  data.  Copying an image is cheap and copies can be read from any
 *  number of threads.  Modifications go through an image::builder,
 *  which has exclusive ownership of its pixel data.
 */
class image
  : private boost::equality_comparable< image >
{
public:
  typedef int      size_type;
  typedef uint32_t word_type;

  enum pixel_type {
    MONO,                       // 32 pixels to the word
    GRAY8,                      //  4 pixels to the word
  };

  class builder;

  //! Creates an empty image
  image ();
  //! Creates an image with all pixels set to zero
  image (size_type width, size_type height, pixel_type type = MONO);

  //! Takes over the pixel data of builder \a b
  /*! The builder is left empty.  No pixel data is copied.
   */
  explicit image (builder& b);

  bool empty () const;

  pixel_type type () const;
  //! Image width in pixels
  size_type width () const;
  //! Image height in pixels
  size_type height () const;
  //! Image depth in bits
  size_type depth () const;
  //! Number of words per row, includes any padding bits
  size_type words_per_line () const;

  const word_type * data () const;
  const word_type * line (size_type y) const;

  //! Returns the value of the pixel at column \a x, row \a y
  /*! \throw out_of_bounds if \a x or \a y lie outside the image
   */
  uint32_t get (size_type x, size_type y) const;
  //! Returns the value of the pixel at column \a x, row \a y
  /*! The caller guarantees that \a x and \a y are within bounds.
   */
  uint32_t get_unchecked (size_type x, size_type y) const;

  //! Number of foreground pixels in a \c MONO image
  size_type count_pixels () const;

  //! Returns a copy that does not share pixel data with this image
  image clone () const;

  //! Number of images, including this one, that share pixel data
  long use_count () const;

  bool operator== (const image& rhs) const;

private:
  struct raster;
  shared_ptr< raster > raster_;

  friend class builder;
};

//! Exclusively owned, modifiable image
/*! A builder is either made from scratch or by taking over the pixel
 *  data of an existing image.  In the latter case the data is only
 *  copied if other images still share it.  Turning the builder back
 *  into an image never copies.
 *
 *  Builders cannot be copied.
 */
class image::builder
{
public:
  //! Creates a builder with all pixels set to zero
  builder (size_type width, size_type height, pixel_type type = MONO);

  //! Takes over the pixel data of \a img, leaving \a img empty
  /*! If \a img was the only reference to its pixel data, ownership of
   *  that data is transferred.  Otherwise the data is copied.
   *
   *  \throw invalid_size if \a img is empty
   */
  explicit builder (image& img);

  bool empty () const;

  pixel_type type () const;
  size_type width () const;
  size_type height () const;
  size_type depth () const;
  size_type words_per_line () const;

  word_type * data ();
  word_type * line (size_type y);

  uint32_t get (size_type x, size_type y) const;
  uint32_t get_unchecked (size_type x, size_type y) const;

  //! Sets the pixel at column \a x, row \a y to \a value
  /*! \c MONO pixels are set for any non-zero \a value, \c GRAY8
   *  pixels take the least significant octet of \a value.
   *
   *  \throw out_of_bounds if \a x or \a y lie outside the image
   */
  void set (size_type x, size_type y, uint32_t value);
  void set_unchecked (size_type x, size_type y, uint32_t value);

  //! Sets all pixels to zero
  void clear ();
  //! Sets all pixels to their maximum value
  void set_all ();
  //! Zeroes the padding bits at the end of every row
  void clear_padding ();

private:
  builder (const builder&);
  builder& operator= (const builder&);

  shared_ptr< image::raster > raster_;

  friend class image;
};

struct image::raster
{
  raster (size_type width, size_type height, pixel_type type);

  pixel_type type;
  size_type  width;
  size_type  height;
  size_type  wpl;

  std::vector< word_type > words;
};

inline uint32_t
image::get_unchecked (size_type x, size_type y) const
{
  const word_type *row = &raster_->words[y * raster_->wpl];

  if (MONO == raster_->type)
    return (row[x >> 5] >> (31 - (x & 31))) & 1;

  return (row[x >> 2] >> (8 * (3 - (x & 3)))) & 0xff;
}

inline uint32_t
image::builder::get_unchecked (size_type x, size_type y) const
{
  const word_type *row = &raster_->words[y * raster_->wpl];

  if (MONO == raster_->type)
    return (row[x >> 5] >> (31 - (x & 31))) & 1;

  return (row[x >> 2] >> (8 * (3 - (x & 3)))) & 0xff;
}

inline void
image::builder::set_unchecked (size_type x, size_type y, uint32_t value)
{
  word_type *row = &raster_->words[y * raster_->wpl];

  if (MONO == raster_->type)
    {
      word_type mask = word_type (1) << (31 - (x & 31));
      if (value) row[x >> 5] |=  mask;
      else       row[x >> 5] &= ~mask;
      return;
    }

  int shift = 8 * (3 - (x & 3));
  row[x >> 2] &= ~(word_type (0xff) << shift);
  row[x >> 2] |= (word_type (value & 0xff) << shift);
}

}       // namespace katachi

#endif  /* katachi_image_hpp_ */
