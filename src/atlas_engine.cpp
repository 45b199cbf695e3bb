#include "atlas_engine.hpp"
#include "atlas_mapper_node.hpp"
#include "manifest_writer_node.hpp"
#include "canvas_writer_node.hpp"
#include "rect_packer.hpp"
#include "image_io.hpp"
#include "image_tools.hpp"
#include <boost/filesystem.hpp>
#include <cstring>
#include <set>
#include <stdexcept>
#include <easylogging++.h>

#define MODULE_LOGGER "atlas_engine"

using namespace ::std;

namespace {
    
    void checkOptions(packing_options const& options) {
        if(options.start_bin_size <= 0)
            throw invalid_argument("Start bin size must be positive");
        if(options.scale_factors.empty())
            throw invalid_argument("No scale factors to try");
        
        double previous = 0;
        for(size_t i = 0; i < options.scale_factors.size(); ++i) {
            double scale = options.scale_factors[i];
            if(scale <= 0 || scale > 1.0)
                throw invalid_argument("Scale factors must be in (0,1]");
            if(i > 0 && scale >= previous)
                throw invalid_argument("Scale factors must be strictly decreasing");
            previous = scale;
        }
    }
    
    // Names are checked before the images are touched
    template<typename Sprites>
    void checkUniqueNames(Sprites const& sprites) {
        set<string> names;
        for(auto const& sprite : sprites) {
            if(!names.insert(sprite.name).second) {
                CLOG(ERROR, MODULE_LOGGER) << "Sprite name " << sprite.name << " already exists";
                throw atlas_error(error_kind::duplicate_name, "Duplicate sprite name: " + sprite.name);
            }
        }
    }
    
    // Validates the request before packing
    void checkRequest(packing_request const& request) {
        if(request.sprites.empty()) {
            CLOG(ERROR, MODULE_LOGGER) << "No sprites to pack";
            throw atlas_error(error_kind::empty_input, "No images to pack");
        }
        
        if(request.padding < 0)
            throw invalid_argument("Padding must not be negative");
        
        checkUniqueNames(request.sprites);
        for(auto const& sprite : request.sprites) {
            auto const& image = sprite.image;
            if(image.width() <= 0 || image.height() <= 0 || !image.pixels ||
               image.fmt != atlas2d::pixel_format::rgba8)
            {
                throw atlas_error(error_kind::decode_error, "Sprite " + sprite.name + " has no RGBA8 pixels");
            }
        }
    }
    
    void discardFile(string const& filename) {
        boost::system::error_code ec;
        boost::filesystem::remove(filename, ec);
        if(ec)
            CLOG(WARNING, MODULE_LOGGER) << "Can't remove " << filename << ": " << ec.message();
    }
    
    // Copies the canvas owned by the chain
    image_props copyCanvas(image_props const& image) {
        image_props copy = make_image(image.width(), image.height());
        memcpy(copy.pixels.get(), image.pixels.get(), (size_t)image.width() * image.height() * 4);
        return copy;
    }
}

sprite_input decode_sprite(encoded_sprite const& encoded) {
    byte_buffer data;
    if(!decode_data_url(encoded.data, data)) {
        throw atlas_error(error_kind::decode_error, "Invalid base64 data of the sprite " + encoded.name);
    }
    
    sprite_input sprite;
    sprite.name = encoded.name;
    sprite.offset_x = encoded.offset_x;
    sprite.offset_y = encoded.offset_y;
    if(!decode_png(data, sprite.image)) {
        throw atlas_error(error_kind::decode_error, "Can't decode the image of the sprite " + encoded.name);
    }
    return sprite;
}

packing_request decode_sprites(vector<encoded_sprite> const& sprites, int padding) {
    packing_request request;
    request.padding = padding;
    request.sprites.reserve(sprites.size());
    
    for(auto const& encoded : sprites) {
        request.sprites.push_back(decode_sprite(encoded));
    }
    
    return request;
}

atlas_output pack_atlas(packing_request const& request,
                        packing_options const& options,
                        rect_packer_ptr packer)
{
    checkRequest(request);
    checkOptions(options);
    
    if(!packer)
        packer = create_default_rect_packer();
    
    atlas_output output;
    
    // The chain: packing, then the manifest, then the canvas
    auto mapper = make_shared<atlas_mapper_node>(atlas_mapper_node::init_props()
                                                 .set_packer(packer)
                                                 .set_options(options));
    auto manifestWriter = make_shared<manifest_writer_node>(manifest_writer_node::init_props()
                                                            .set_image_name(options.image_name)
                                                            .enable_pretty_json(options.pretty_json));
    auto canvasWriter = make_shared<canvas_writer_node>(canvas_writer_node::init_props()
                                                        .set_writer([&output](image_props const& canvas) {
        if(!encode_png(canvas, output.png))
            throw atlas_error(error_kind::encode_error, "Error encoding the atlas image");
        output.canvas = copyCanvas(canvas);
        return true;
    }));
    mapper->set_child(manifestWriter)->set_child(canvasWriter);
    
    atlas_props atlas;
    atlas.padding = request.padding;
    atlas.fmt = atlas2d::pixel_format::rgba8;
    
    bool isOk = mapper->begin_atlas(atlas);
    for(size_t i = 0; isOk && i < request.sprites.size(); ++i) {
        auto const& sprite = request.sprites[i];
        
        atlas_item item;
        (image_props&)item = sprite.image;
        item.name = sprite.name;
        item.offset_x = sprite.offset_x;
        item.offset_y = sprite.offset_y;
        isOk = mapper->add_atlas_item(item);
    }
    isOk = isOk && mapper->end_atlas();
    
    if(!isOk) {
        mapper->reset();
        throw atlas_error(error_kind::composition_error, "Atlas pipeline rejected the sprites");
    }
    
    output.manifest = manifestWriter->manifest();
    output.manifest_json = manifestWriter->manifest_json();
    return output;
}

atlas_output pack_atlas(vector<encoded_sprite> const& sprites,
                        int padding,
                        packing_options const& options,
                        rect_packer_ptr packer)
{
    checkUniqueNames(sprites);
    return pack_atlas(decode_sprites(sprites, padding), options, move(packer));
}

void save_atlas(atlas_output const& output,
                string const& image_file,
                string const& manifest_file)
{
    const byte_buffer manifestData(output.manifest_json.begin(), output.manifest_json.end());
    
    bool isOk = write_file(image_file, output.png) && write_file(manifest_file, manifestData);
    if(!isOk) {
        discardFile(image_file);
        discardFile(manifest_file);
        throw atlas_error(error_kind::io_error, "Error writing the atlas to " + image_file + " and " + manifest_file);
    }
    
    CLOG(INFO, MODULE_LOGGER) << "Atlas saved to " << image_file;
}
