#pragma once

#include "forwards.hpp"
#include <atlas2d/forwards.hpp>
#include <atlas2d/pixel_format.hpp>
#include <atlas2d/image.hpp>
#include <string>
#include <vector>

/// Simple rect
struct rect {
    int x=0, y=0, width=0, height=0;
    
    rect() { ;; }
    rect(int _x, int _y, int _w, int _h)
    : x(_x), y(_y), width(_w), height(_h)
    { ;; }
    
    int right() const { return x + width; }
    int bottom() const { return y + height; }
    
    /// Checks whether two rects share at least one pixel
    bool intersects(rect const& other) const {
        return x < other.right() && other.x < right() &&
               y < other.bottom() && other.y < bottom();
    }
    
    bool operator==(rect const& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(rect const& other) const { return !(*this == other); }
};

/// Generic image properties
struct image_props {
    atlas2d::size size;             ///< Image size
    atlas2d::pixel_format fmt = atlas2d::pixel_format::rgba8;  ///< Pixel format
    atlas2d::raw_data_ptr pixels;   ///< Pixels array
    
    int width() const { return (int)size.width; }
    int height() const { return (int)size.height; }
};

/// Sprite handed over to the packing engine
struct sprite_input {
    std::string name;               ///< Unique sprite name
    image_props image;              ///< Decoded RGBA8 bitmap
    int offset_x = 0;               ///< Anchor offset in full resolution space
    int offset_y = 0;
};

/// Sprite whose image is still encoded (data url, plain base64 or raw png)
struct encoded_sprite {
    std::string name;
    std::string data;
    int offset_x = 0;
    int offset_y = 0;
};

/// Input of a single atlas build
struct packing_request {
    std::vector<sprite_input> sprites;  ///< Ordered sprites
    int padding = 0;                    ///< Pixels reserved on every side of a sprite
};

/// Describes atlas item generic properties
struct atlas_item: image_props {
    std::string name;               ///< Sprite name
    int index = 0;                  ///< Position of the sprite in the request
    int offset_x = 0;               ///< Anchor offset, already scaled
    int offset_y = 0;
    rect box;                       ///< Padded rect the sprite is placed into
};

/// Describes atlas properties
struct atlas_props {
    atlas2d::pixel_format fmt = atlas2d::pixel_format::rgba8;  ///< Atlas pixel format
    int padding = 0;                ///< Padding around atlas items
    double scale = 1.0;             ///< Scale factor applied to every sprite
    int bin_size = 0;               ///< Side of the candidate bin the items were packed into
    float occupancy = 0;            ///< Atlas ocuppancy factor (the value in the range [0,1])
    atlas2d::size size;             ///< Dimensions of the atlas
};
