#include "rbp_wrappers.hpp"
#include "helpers.hpp"

max_rects_bin::max_rects_bin(prefs const& props)
: _prefs(props)
{
    clean_bin();
}

float max_rects_bin::occupancy() const {
    return _rbp.Occupancy();
}

bool max_rects_bin::insert_square(int width, int height, rect& placed) {
    auto found = _rbp.Insert(width, height, _prefs.heuristic);
    
    // a miss comes back empty, a flipped rect is a miss too
    if(found.width != width || found.height != height || found.width == 0)
        return false;
    
    placed = rect(found.x, found.y, found.width, found.height);
    return true;
}

void max_rects_bin::clean_bin() {
    _rbp.Init(_prefs.bin_width, _prefs.bin_height, false);
}
