#pragma once

#include "forwards.hpp"
#include <string>

/// Decodes png data into a RGBA8 image
bool decode_png(byte_buffer const& data, image_props& props);

/// Encodes the image into png data
bool encode_png(image_props const& props, byte_buffer& data);

/// Reads image from file
bool read_image(std::string const& filename, image_props& props);

/// Writes image to file
bool write_image(std::string const& filename, image_props const& props);

/// Reads the whole file
bool read_file(std::string const& filename, byte_buffer& data);

/// Writes the whole buffer to the file
bool write_file(std::string const& filename, byte_buffer const& data);

/**
 @brief Decodes base64 image payload.
 A leading "data:<mime>;base64," header is skipped if present.
 */
bool decode_data_url(std::string const& text, byte_buffer& data);

/// Encodes png data as the "data:image/png;base64," url
std::string encode_data_url(byte_buffer const& data);
