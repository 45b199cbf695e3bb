#include "manifest_writer_node.hpp"
#include "atlas_error.hpp"
#include "helpers.hpp"
#include <easylogging++.h>

#define MODULE_LOGGER "manifest_writer"

using namespace ::std;

struct manifest_writer_node::Pimpl: manifest_writer_props {
    atlas_manifest manifest;    ///< The manifest under construction
    string json;                ///< Serialized manifest
    int padding = 0;            ///< Padding around the items
    
    void reset() {
        manifest = atlas_manifest();
        json.clear();
        padding = 0;
    }
    
    // Builds frame descriptor from the placed item
    frame_descriptor makeFrame(atlas_item const& item) const {
        frame_descriptor desc;
        desc.name = item.name;
        desc.frame = rect(item.box.x + padding,
                          item.box.y + padding,
                          item.width(),
                          item.height());
        desc.sprite_source_size = rect(0, 0, item.width(), item.height());
        desc.source_size = item.size;
        desc.offset_x = item.offset_x;
        desc.offset_y = item.offset_y;
        return desc;
    }
    
    bool isInsideAtlas(rect const& frame) const {
        return frame.x >= 0 && frame.y >= 0 &&
               frame.right() <= (int)manifest.size.width &&
               frame.bottom() <= (int)manifest.size.height;
    }
    
};

manifest_writer_node::manifest_writer_node(manifest_writer_props const& props)
: _pimpl(new Pimpl)
{
    ((manifest_writer_props&)*_pimpl) = props;
    _pimpl->reset();
}

manifest_writer_node::~manifest_writer_node() {
    ;;
}

bool manifest_writer_node::begin_atlas(atlas_props const& atlas) {
    _pimpl->reset();
    
    auto& manifest = _pimpl->manifest;
    manifest.image = _pimpl->image_name;
    manifest.size = atlas.size;
    manifest.scale = atlas.scale;
    _pimpl->padding = atlas.padding;

    return safe_fwd().begin_atlas(atlas);
}

bool manifest_writer_node::add_atlas_item(atlas_item const& item) {
    auto& frames = _pimpl->manifest.frames;
    if(frames.find(item.name) != frames.end()) {
        // Don't process dublicated items
        CLOG(ERROR, MODULE_LOGGER)
            << "Sprite name "
            << item.name
            << " already exists";
        throw atlas_error(error_kind::duplicate_name, "Duplicate sprite name: " + item.name);
    }
    
    frame_descriptor desc = _pimpl->makeFrame(item);
    if(!_pimpl->isInsideAtlas(desc.frame)) {
        CLOG(ERROR, MODULE_LOGGER) << "Frame of " << item.name << " exceeds the atlas";
        throw atlas_error(error_kind::composition_error, "Frame of " + item.name + " exceeds the atlas bounds");
    }
    
    frames.insert(make_pair(item.name, move(desc)));
    return safe_fwd().add_atlas_item(item);
}

bool manifest_writer_node::end_atlas() {
    _pimpl->json = write_manifest_json(_pimpl->manifest, _pimpl->pretty_json);
    CLOG(INFO, MODULE_LOGGER) << "Manifest of " << _pimpl->manifest.frames.size() << " frames is ready";
    return safe_fwd().end_atlas();
}

void manifest_writer_node::reset() {
    _pimpl->reset();
    safe_fwd().reset();
}

atlas_manifest const& manifest_writer_node::manifest() const {
    return _pimpl->manifest;
}

string const& manifest_writer_node::manifest_json() const {
    return _pimpl->json;
}
