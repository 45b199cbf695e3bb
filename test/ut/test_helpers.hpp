#pragma once

#include "helpers.hpp"
#include "atlas_manifest.hpp"
#include "atlas_error.hpp"
#include <boost/optional.hpp>
#include <string>

/// Creates RGBA8 image filled with one color
image_props solid_image(int width, int height,
                        unsigned char r, unsigned char g, unsigned char b, unsigned char a = 255);

/// Creates sprite of one color
sprite_input solid_sprite(std::string const& name, int width, int height,
                          unsigned char shade, int offset_x = 0, int offset_y = 0);

/// Compares the RGBA8 pixel with the expected color
bool pixel_equals(image_props const& image, int x, int y,
                  unsigned char r, unsigned char g, unsigned char b, unsigned char a);

/// Frame rect grown by padding on every side
rect inflate(rect const& frame, int padding);

/// Checks that no two padded frames share a pixel
bool frames_overlap(atlas_manifest const& manifest, int padding);

/// Runs the call and returns the kind of the atlas_error it throws
template<typename Fn>
boost::optional<error_kind> error_of(Fn&& fn) {
    try {
        fn();
    } catch(atlas_error const& e) {
        return e.kind();
    }
    return boost::none;
}
