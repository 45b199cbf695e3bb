#pragma once

#include "forwards.hpp"
#include <string>
#include <vector>

/// Settings of the atlas packing engine
struct packing_options {
    using props = packing_options;
    
    int start_bin_size = 256;       ///< The first candidate bin side
    int max_bin_size = 2048;        ///< The largest candidate bin side, used at every scale
    std::vector<double> scale_factors = {1.0, 0.9, 0.8, 0.7, 0.6, 0.5, 0.4, 0.3, 0.25, 0.2};
    std::string image_name = "atlas.png";   ///< Image reference stored in the manifest
    bool pretty_json = true;        ///< Indent the manifest
    
    /// Sets the first candidate bin side
    props& set_start_bin_size(int arg) {start_bin_size = arg; return *this;}
    /// Sets the bin size ceiling
    props& set_max_bin_size(int arg) {max_bin_size = arg; return *this;}
    /// Sets scale factors to try, in strictly decreasing order
    props& set_scale_factors(std::vector<double> arg) {scale_factors = std::move(arg); return *this;}
    /// Sets image reference of the manifest
    props& set_image_name(std::string arg) {image_name = std::move(arg); return *this;}
    /// Enables the pretty printed manifest
    props& enable_pretty_json(bool arg=true) {pretty_json = arg; return *this;}
};
