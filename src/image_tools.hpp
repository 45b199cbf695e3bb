#pragma once

#include "forwards.hpp"
#include "helpers.hpp"
#include <vector>

/// Key color removed from an image
struct key_color {
    unsigned char r = 0, g = 0, b = 0;
    int tolerance = 0;      ///< Tolerance in percents [0,100]
    
    key_color() { ;; }
    key_color(unsigned char _r, unsigned char _g, unsigned char _b, int _tolerance)
    : r(_r), g(_g), b(_b), tolerance(_tolerance)
    { ;; }
};

/// Piece of the image cut by split_grid
struct grid_tile {
    int row = 0;
    int col = 0;
    image_props image;
};

/// Allocates a transparent RGBA8 image
image_props make_image(int width, int height);

/// Returns a pointer to the RGBA8 pixel
inline unsigned char* pixel_at(image_props const& image, int x, int y) {
    return image.pixels.get() + ((size_t)y * image.width() + x) * 4;
}

/// Scales an extent and rounds it to the nearest integer, never below 1 pixel
int scaled_extent(int value, double scale);

/// Scales an offset and rounds it to the nearest integer
int scaled_offset(int value, double scale);

/// Resamples the RGBA8 image with the Lanczos-3 filter
image_props resize_lanczos(image_props const& image, int width, int height);

/**
 @brief Makes pixels close to any key color transparent.
 A pixel matches when its RGB distance doesn't exceed tolerance * 4.42.
 @return number of pixels made transparent
 */
size_t remove_colors(image_props& image, std::vector<key_color> const& colors);

/// Copies the part of the image. The area is clipped by the image bounds.
image_props crop(image_props const& image, rect const& area);

/**
 @brief Slices the image along horizontal (y) and vertical (x) lines.
 Tiles go row by row. Lines outside of the image and duplicates are ignored.
 */
std::vector<grid_tile> split_grid(image_props const& image,
                                   std::vector<int> horizontal_lines,
                                   std::vector<int> vertical_lines);
