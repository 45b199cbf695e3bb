#include "canvas_writer_node.hpp"
#include "atlas_error.hpp"
#include "helpers.hpp"
#include <atlas2d/pixel_format.hpp>
#include <atlas2d/raw_image.hpp>
#include <sstream>
#include <easylogging++.h>

#define MODULE_LOGGER "canvas_writer"

using namespace ::atlas2d;
using namespace ::std;

struct canvas_writer_node::Pimpl: canvas_writer_props {
    raw_image rawImage;             ///< Raw image to map atlas items into
    atlas_props atlas;              ///< Properties of the active atlas
    bool active = false;            ///< The canvas is initialized
};

canvas_writer_node::canvas_writer_node(canvas_writer_props const& props): _pimpl(new Pimpl) {
    (canvas_writer_props&)(*_pimpl) = props;
    reset();
}

canvas_writer_node::~canvas_writer_node() {
    ;;
}

void canvas_writer_node::reset() {
    _pimpl->active = false;
}


bool canvas_writer_node::begin_atlas(atlas_props const& atlas) {
    if(atlas.size.width <= 0 || atlas.size.height <= 0) {
        CLOG(ERROR, MODULE_LOGGER) << "Empty canvas " << atlas.size.width << "x" << atlas.size.height;
        throw atlas_error(error_kind::composition_error, "Atlas canvas is empty");
    }
    
    // Init the transparent rawImage with the atlas properties.
    // The padding is applied by the item offsets.
    auto& rawImage = _pimpl->rawImage;
    rawImage.init(raw_image::init_props()
                  .set_dims(atlas.size)
                  .set_pixel_format(atlas.fmt)
                  .set_sprites_padding(0)
                  .wipe_allocated_data());
    
    _pimpl->atlas = atlas;
    _pimpl->active = true;
    return safe_fwd().begin_atlas(atlas);
}

bool canvas_writer_node::add_atlas_item(atlas_item const& item) {
    if(!_pimpl->active)
        return false;
    
    auto const& atlas = _pimpl->atlas;
    const int x = item.box.x + atlas.padding;
    const int y = item.box.y + atlas.padding;
    
    // A copy outside of the canvas means the placement is broken
    if(x < 0 || y < 0 ||
       x + item.width() > (int)atlas.size.width ||
       y + item.height() > (int)atlas.size.height)
    {
        ostringstream msg;
        msg << "Sprite " << item.name << " at (" << x << "," << y << ") "
            << item.width() << "x" << item.height()
            << " exceeds the canvas " << atlas.size.width << "x" << atlas.size.height;
        CLOG(ERROR, MODULE_LOGGER) << msg.str();
        throw atlas_error(error_kind::composition_error, msg.str());
    }
    
    // Init the pixel_area with item's properties
    raw_pixel_area area;
    area.init(raw_pixel_area::init_props()
              .set_dims(item.size)
              .set_pixel_format(item.fmt)
              .set_raw_data(item.pixels));
    area.set_rotator(raw_pixel_area::rotate_0_degree);
    
    // copy the pixel area into the canvas, alpha is copied as is
    auto& rawImage = _pimpl->rawImage;
    bool isOk = rawImage.fill_image(area,
                                    raw_image::filling_props()
                                    .set_offset(offset(x, y))
                                    .enable_premultiple(false));
    if(!isOk) {
        CLOG(ERROR, MODULE_LOGGER) << "Error copying the sprite " << item.name;
        throw atlas_error(error_kind::composition_error, "Error copying the sprite " + item.name);
    }
    
    return safe_fwd().add_atlas_item(item);
}

bool canvas_writer_node::end_atlas() {
    if(!_pimpl->active)
        return false;
    
    auto& rawImage = _pimpl->rawImage;

    image_props image;
    image.fmt = rawImage.props().format;
    image.size = rawImage.props().dimensions;
    image.pixels = details::unowned_ptr(rawImage.get_raw_pixels());

    // Write the final atlas image
    if(!_pimpl->writer || !_pimpl->writer(image))
        return false;
    
    _pimpl->active = false;
    return safe_fwd().end_atlas();
}
