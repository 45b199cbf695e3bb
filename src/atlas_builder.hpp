#pragma once

#include "forwards.hpp"

/**
 @brief Generic interface for building an atlas.
 The builder receives the atlas properties first, then every placed sprite,
 and finally the end of the atlas.
 */
class atlas_builder {
public:
    virtual ~atlas_builder() { ;; }
    
    /// Creates a new atlas and set it as active
    virtual bool begin_atlas(atlas_props const& props) = 0;
    
    /// Inserts an item to the active atlas
    virtual bool add_atlas_item(atlas_item const& item) = 0;
    
    /// Finishes building of the active atlas.
    virtual bool end_atlas() = 0;
    
    /// Drops everything collected for the active atlas
    virtual void reset() { ;; }
};
