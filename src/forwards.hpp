#pragma once

#include <memory>
#include <functional>
#include <string>
#include <vector>

// Here are necessary forwards of some basic types

struct rect;
struct image_props;
struct sprite_input;
struct encoded_sprite;
struct packing_request;
struct packing_options;
struct atlas_item;
struct atlas_props;
struct atlas_manifest;
struct atlas_output;

class atlas_error;

class chain_node;
using chain_node_ptr = std::shared_ptr<chain_node>;

class atlas_builder;
using atlas_builder_ptr = std::shared_ptr<atlas_builder>;

class bin_packer;
using bin_packer_ptr = std::shared_ptr<bin_packer>;

class rect_packer;
using rect_packer_ptr = std::shared_ptr<rect_packer>;

/// Raw encoded file content
using byte_buffer = std::vector<unsigned char>;
