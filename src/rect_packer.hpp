#pragma once

#include "forwards.hpp"
#include "helpers.hpp"
#include <boost/optional.hpp>
#include <vector>

/// Rectangle which has to be placed into a bin
struct packing_rect {
    int id = 0;         ///< Caller defined identifier, the sprite index
    int width = 0;
    int height = 0;
    
    packing_rect() { ;; }
    packing_rect(int _id, int _w, int _h)
    : id(_id), width(_w), height(_h)
    { ;; }
};

/// Positions of the packed rectangles, in the same order as the input rectangles
using placement = std::vector<rect>;

/**
 @brief Packing capability used by the capacity search.
 Given a list of rectangles and a square bin it either places every rectangle
 or reports the failure.
 */
class rect_packer {
public:
    virtual ~rect_packer() { ;; }
    
    /// Places all rects into the square bin of the bin_size side
    virtual boost::optional<placement> pack(std::vector<packing_rect> const& rects, int bin_size) = 0;
};

/// Heuristic packer properties
struct heuristic_packer_props {
    using bin_factory = std::function<bin_packer_ptr(int,int)>;
    
    bin_factory create_bin;     ///< Bin factory
};

/**
 @brief Packs the largest rectangles first into a single bin.
 Rectangles of equal area keep the input order, so the result is deterministic.
 */
class heuristic_rect_packer: public rect_packer {
public:
    struct init_props: heuristic_packer_props {
        using props = init_props;
        
        /// Set bin factory
        props& set_bin_factory(bin_factory arg) {create_bin=std::move(arg); return *this;}
    };
    
    explicit heuristic_rect_packer(heuristic_packer_props const& props);
    
    boost::optional<placement> pack(std::vector<packing_rect> const& rects, int bin_size) override;
    
private:
    heuristic_packer_props _props;
};

/// Creates the MaxRects bin with specific dimensions
bin_packer_ptr create_max_rects_bin(int width, int height);

/// Creates the packer used by default: largest first into MaxRects bins
rect_packer_ptr create_default_rect_packer();
