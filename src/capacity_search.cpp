#include "capacity_search.hpp"
#include <easylogging++.h>

#define MODULE_LOGGER "capacity_search"

using namespace ::std;

vector<int> candidate_bin_sizes(int start_size, int max_size) {
    vector<int> sizes;
    if(start_size <= 0)
        return sizes;
    
    for(long long binSize = start_size; binSize <= max_size; binSize *= 2) {
        sizes.push_back((int)binSize);
    }
    return sizes;
}

boost::optional<capacity_result> search_capacity(vector<packing_rect> const& rects,
                                                 rect_packer& packer,
                                                 int start_size,
                                                 int max_size)
{
    for(auto binSize : candidate_bin_sizes(start_size, max_size)) {
        CLOG(DEBUG, MODULE_LOGGER) << "Trying bin " << binSize << "x" << binSize;
        
        auto places = packer.pack(rects, binSize);
        if(!places)
            continue;
        
        capacity_result result;
        result.bin_size = binSize;
        result.places = std::move(*places);
        return result;
    }
    
    CLOG(DEBUG, MODULE_LOGGER) << "No bin up to " << max_size << " holds " << rects.size() << " rects";
    return boost::none;
}
