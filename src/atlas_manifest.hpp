#pragma once

#include "forwards.hpp"
#include "helpers.hpp"
#include <map>
#include <string>

/// Placement description of a single sprite
struct frame_descriptor {
    std::string name;
    rect frame;                         ///< Sprite rect inside the atlas, padding excluded
    bool rotated = false;
    bool trimmed = false;
    rect sprite_source_size;            ///< Always the whole frame with zero origin
    atlas2d::size source_size;          ///< Sprite size
    double pivot_x = 0.5;
    double pivot_y = 0.5;
    int offset_x = 0;                   ///< Anchor offset, scaled with the sprite
    int offset_y = 0;
};

/// Frame map of an atlas
struct atlas_manifest {
    std::map<std::string, frame_descriptor> frames;     ///< Frames ordered by name
    std::string image;                  ///< Atlas image reference
    atlas2d::size size;                 ///< Canvas dimensions
    double scale = 1.0;                 ///< Scale factor applied to sprites
};

/// Serializes the manifest as a frame hash JSON document
std::string write_manifest_json(atlas_manifest const& manifest, bool pretty=true);
