#pragma once

#include "forwards.hpp"

/**
 @brief Generic interface of a bin packer.
 The packer fills a single bin with a bunch of 2d items, one insertion at a time.
 */
class bin_packer {
public:
    virtual ~bin_packer() { ;; }
    
    /// Returns current occupancy of the bin. The value is in [0,1] range.
    virtual float occupancy() const = 0;
    
    /**
     * @brief Inserts the square [width, height] into the bin and stores its position to the placed rect.
     * Items are never rotated.
     * @return In case of success returns true and updates the placed rect.
     */
    virtual bool insert_square(int width, int height, rect& placed) = 0;
    
    /// Erases all preserved squares of the bin
    virtual void clean_bin() = 0;

};
