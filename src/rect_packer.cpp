#include "rect_packer.hpp"
#include "bin_packer.hpp"
#include "rbp_wrappers.hpp"
#include <algorithm>
#include <numeric>
#include <easylogging++.h>

#define MODULE_LOGGER "rect_packer"

using namespace ::std;

namespace {
    
    // Item order: the biggest area goes first, ties keep the input order
    vector<size_t> orderByArea(vector<packing_rect> const& rects) {
        vector<size_t> order(rects.size());
        iota(order.begin(), order.end(), 0);
        stable_sort(order.begin(), order.end(), [&rects](size_t a, size_t b) {
            long long areaA = (long long)rects[a].width * rects[a].height;
            long long areaB = (long long)rects[b].width * rects[b].height;
            return areaA > areaB;
        });
        return order;
    }
    
}

heuristic_rect_packer::heuristic_rect_packer(heuristic_packer_props const& props)
: _props(props)
{ ;; }

boost::optional<placement> heuristic_rect_packer::pack(vector<packing_rect> const& rects, int bin_size) {
    if(bin_size <= 0 || !_props.create_bin)
        return boost::none;
    
    auto bin = _props.create_bin(bin_size, bin_size);
    if(!bin)
        return boost::none;
    
    placement result(rects.size());
    for(auto index : orderByArea(rects)) {
        auto const& item = rects[index];
        if(item.width <= 0 || item.height <= 0 ||
           item.width > bin_size || item.height > bin_size) {
            return boost::none;
        }
        
        if(!bin->insert_square(item.width, item.height, result[index])) {
            CLOG(DEBUG, MODULE_LOGGER) << "Rect " << item.id << " ("
                << item.width << "x" << item.height << ") doesn't fit the bin " << bin_size;
            return boost::none;
        }
    }
    
    CLOG(DEBUG, MODULE_LOGGER) << "Bin " << bin_size << " occupancy = " << bin->occupancy();
    return result;
}

bin_packer_ptr create_max_rects_bin(int width, int height) {
    return make_shared<max_rects_bin>(max_rects_bin::prefs()
                                      .set_bin_width(width)
                                      .set_bin_height(height));
}

rect_packer_ptr create_default_rect_packer() {
    return make_shared<heuristic_rect_packer>(heuristic_rect_packer::init_props()
                                              .set_bin_factory(&create_max_rects_bin));
}
