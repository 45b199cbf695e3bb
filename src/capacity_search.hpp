#pragma once

#include "rect_packer.hpp"
#include <boost/optional.hpp>
#include <vector>

/// The smallest bin which was able to hold all the rects
struct capacity_result {
    int bin_size = 0;       ///< Side of the accepted square bin
    placement places;       ///< Positions of the rects inside the bin
};

/// Returns candidate bin sides: start_size doubled until it exceeds max_size
std::vector<int> candidate_bin_sizes(int start_size, int max_size);

/**
 @brief Looks for the smallest square bin which holds all the rects.
 Candidates are tried from the smallest one. Returns none when even the
 largest candidate can't hold the rects.
 */
boost::optional<capacity_result> search_capacity(std::vector<packing_rect> const& rects,
                                                 rect_packer& packer,
                                                 int start_size,
                                                 int max_size);
