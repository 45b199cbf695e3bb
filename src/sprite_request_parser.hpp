#pragma once

#include "forwards.hpp"
#include "helpers.hpp"
#include <istream>

/// Sprite request parser properties
struct sprite_request_props {
    using props = sprite_request_props;
    using image_reader = std::function<bool(std::string const&, image_props&)>;
    
    std::string base_dir;           ///< Directory relative image paths are resolved against
    int default_padding = 0;        ///< Padding used when the request doesn't specify one
    image_reader read_image;        ///< Reader of the images referenced by path
    
    /// Sets the directory of relative image paths
    props& set_base_dir(std::string arg) {base_dir=std::move(arg); return *this;}
    /// Sets padding used when the request has no padding
    props& set_default_padding(int arg) {default_padding=arg; return *this;}
    /// Sets image reader
    props& set_image_reader(image_reader arg) {read_image=std::move(arg); return *this;}
};

/**
 @brief Parses the JSON sprite list.
 The stream contains either an array of sprites or an object with "padding"
 and "sprites" members. Each sprite has a "name", either a "base64" image or
 an image "path", and optional "offsetX"/"offsetY".
 Throws atlas_error when the document or one of the images is invalid.
 */
packing_request parse_sprite_request(std::istream& stream, sprite_request_props const& props);
