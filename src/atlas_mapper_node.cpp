#include "atlas_mapper_node.hpp"
#include "atlas_error.hpp"
#include "capacity_search.hpp"
#include "image_tools.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <sstream>
#include <easylogging++.h>

#define MODULE_LOGGER "atlas_mapper"

using namespace ::atlas2d;
using namespace ::std;

namespace {
    
    // Scale factor accepted by the capacity search
    struct AcceptedPacking {
        double scale = 1.0;
        capacity_result capacity;
    };
    
    // Returns the tight bounding box of the placed rects
    atlas2d::size calcTightSize(placement const& places) {
        int width = 0, height = 0;
        for(auto const& box : places) {
            width = (std::max)(width, box.right());
            height = (std::max)(height, box.bottom());
        }
        return atlas2d::size(width, height);
    }
    
    float calcOccupancy(placement const& places, atlas2d::size const& atlasSize) {
        const double atlasSquare = (double)atlasSize.width * atlasSize.height;
        if(atlasSquare <= 0)
            return 0;
        
        double itemsSquare = 0;
        for(auto const& box : places)
            itemsSquare += (double)box.width * box.height;
        return (float)(itemsSquare / atlasSquare);
    }
}

struct atlas_mapper_node::Pimpl: atlas_mapper_props {
    atlas_builder* mainChain = nullptr;
    atlas_props atlasTmpl;          ///< Atlas template
    vector<atlas_item> items;       ///< Collected items in the input order
    
    // Calculates item extra pixels (padding)
    int itemExtraPixels() const {
        return atlasTmpl.padding * 2;
    }
    
    // Returns padded rects of all items at a specific scale
    vector<packing_rect> makeRects(double scale) const {
        const int extraLen = itemExtraPixels();
        
        vector<packing_rect> rects;
        rects.reserve(items.size());
        for(auto const& item : items) {
            rects.push_back(packing_rect(item.index,
                                         scaled_extent(item.width(), scale) + extraLen,
                                         scaled_extent(item.height(), scale) + extraLen));
        }
        return rects;
    }
    
    // Tries each scale factor until some bin holds all the items
    bool findPacking(AcceptedPacking& accepted) {
        for(auto scale : options.scale_factors) {
            auto capacity = search_capacity(makeRects(scale),
                                            *packer,
                                            options.start_bin_size,
                                            options.max_bin_size);
            if(capacity) {
                accepted.scale = scale;
                accepted.capacity = std::move(*capacity);
                return true;
            }
            
            CLOG(WARNING, MODULE_LOGGER) << "Sprites don't fit " << options.max_bin_size
                << "x" << options.max_bin_size << " at scale " << scale;
        }
        
        return false;
    }
    
    // Scales item's pixels and anchor
    void scaleItem(atlas_item& item, double scale) {
        if(scale == 1.0)
            return;
        
        const int width = scaled_extent(item.width(), scale);
        const int height = scaled_extent(item.height(), scale);
        (image_props&)item = resize_lanczos(item, width, height);
        item.offset_x = scaled_offset(item.offset_x, scale);
        item.offset_y = scaled_offset(item.offset_y, scale);
    }
    
    // Builds the atlas of collected items and transfers it to the chain
    bool buildAtlas() {
        if(items.empty()) {
            CLOG(ERROR, MODULE_LOGGER) << "No sprites to pack";
            throw atlas_error(error_kind::empty_input, "No images to pack");
        }
        
        if(!packer) {
            throw atlas_error(error_kind::composition_error, "Atlas mapper has no packer");
        }
        
        AcceptedPacking accepted;
        if(!findPacking(accepted)) {
            ostringstream msg;
            msg << "Images too large to pack into "
                << options.max_bin_size << "x" << options.max_bin_size
                << " at any scale factor";
            CLOG(ERROR, MODULE_LOGGER) << msg.str();
            throw atlas_error(error_kind::packing_infeasible, msg.str());
        }
        
        auto const& places = accepted.capacity.places;
        
        // The atlas is as large as the placed items, not as the bin
        atlas_props atlas = atlasTmpl;
        atlas.scale = accepted.scale;
        atlas.bin_size = accepted.capacity.bin_size;
        atlas.size = calcTightSize(places);
        atlas.occupancy = calcOccupancy(places, atlas.size);
        
        CLOG(INFO, MODULE_LOGGER) << "Packed " << items.size() << " sprites into bin "
            << atlas.bin_size << ", atlas " << atlas.size.width << "x" << atlas.size.height
            << ", scale " << atlas.scale;
        CLOG(INFO, MODULE_LOGGER) << "Occupancy = " << atlas.occupancy;
        
        if(!mainChain->begin_atlas(atlas))
            return false;
        
        for(size_t i = 0; i < items.size(); ++i) {
            atlas_item item = items[i];
            scaleItem(item, accepted.scale);
            item.box = places[i];
            
            if(!mainChain->add_atlas_item(item))
                return false;
        }
        
        return mainChain->end_atlas();
    }
    
    // Set the atlas' info
    void setAtlasTemplate(atlas_props const& atlas) {
        atlasTmpl = atlas;
        items.clear();
    }
};


atlas_mapper_node::atlas_mapper_node(atlas_mapper_props const& props): _pimpl(new Pimpl) {
    (atlas_mapper_props&)(*_pimpl) = props;
    
    auto& safeForwarder = this->safe_fwd();
    _pimpl->mainChain = &safeForwarder;
}

atlas_mapper_node::~atlas_mapper_node() {
    ;;
}

bool atlas_mapper_node::begin_atlas(atlas_props const& atlas) {
    if(atlas.padding < 0) {
        CLOG(ERROR, MODULE_LOGGER) << "Negative padding " << atlas.padding;
        return false;
    }
    
    _pimpl->setAtlasTemplate(atlas);
    return true;
}

bool atlas_mapper_node::add_atlas_item(atlas_item const& item) {
    // Oversized sprites are kept, the scale fallback may still fit them
    if(item.width() <= 0 || item.height() <= 0 || !item.pixels) {
        CLOG(ERROR, MODULE_LOGGER) << "The sprite " << item.name << " has no pixels";
        return false;
    }
    
    // Collect items
    atlas_item collected = item;
    collected.index = (int)_pimpl->items.size();
    _pimpl->items.push_back(move(collected));
    return true;
}

bool atlas_mapper_node::end_atlas() {
    return _pimpl->buildAtlas();
}

void atlas_mapper_node::reset() {
    _pimpl->items.clear();
    safe_fwd().reset();
}
