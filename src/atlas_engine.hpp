#pragma once

#include "forwards.hpp"
#include "helpers.hpp"
#include "atlas_manifest.hpp"
#include "atlas_error.hpp"
#include "packing_options.hpp"
#include <string>
#include <vector>

/// Result of a successful atlas build
struct atlas_output {
    byte_buffer png;                ///< Encoded atlas image
    std::string manifest_json;      ///< Serialized manifest
    atlas_manifest manifest;        ///< Frame map of the atlas
    image_props canvas;             ///< Decoded atlas image
};

/// Decodes a single sprite, throws atlas_error(decode_error) on failure
sprite_input decode_sprite(encoded_sprite const& encoded);

/**
 @brief Decodes encoded sprites.
 Throws atlas_error(decode_error) naming the sprite which can't be decoded.
 */
packing_request decode_sprites(std::vector<encoded_sprite> const& sprites, int padding);

/**
 @brief Packs all the sprites into a single atlas.
 Every call builds its own pipeline, nothing is kept between calls.
 Failures are reported with atlas_error, nothing is produced in that case.
 @param packer packing heuristic, the largest-first MaxRects packer if null
 */
atlas_output pack_atlas(packing_request const& request,
                        packing_options const& options = packing_options(),
                        rect_packer_ptr packer = rect_packer_ptr());

/**
 @brief Writes the atlas image and its manifest.
 Throws atlas_error(io_error) and leaves neither file behind if any write fails.
 */
void save_atlas(atlas_output const& output,
                std::string const& image_file,
                std::string const& manifest_file);

/// Decodes and packs the sprites
atlas_output pack_atlas(std::vector<encoded_sprite> const& sprites,
                        int padding,
                        packing_options const& options = packing_options(),
                        rect_packer_ptr packer = rect_packer_ptr());
