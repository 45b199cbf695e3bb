#pragma once

#include "bin_packer.hpp"
#include <rbp/MaxRectsBinPack.h>

/// Square bin filled by the MaxRectsBinPack algorithm, flipping disabled
class max_rects_bin: public bin_packer {
public:
    using free_rect_heuristic = rbp::MaxRectsBinPack::FreeRectChoiceHeuristic;
    
    /// Bin preferences
    struct prefs {
        int bin_width = 0, bin_height = 0;
        
        /// Best area fit puts a rect into the smallest free region which contains it
        free_rect_heuristic heuristic = free_rect_heuristic::RectBestAreaFit;
        
        prefs& set_bin_width(int arg) { bin_width = arg; return *this; }
        prefs& set_bin_height(int arg) { bin_height = arg; return *this; }
    };
    
    explicit max_rects_bin(prefs const& props);
    
    float occupancy() const override;
    bool insert_square(int width, int height, rect& placed) override;
    void clean_bin() override;
    
private:
    prefs _prefs;
    rbp::MaxRectsBinPack _rbp;
};
