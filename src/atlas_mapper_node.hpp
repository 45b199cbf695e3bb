#pragma once

#include "chain_node.hpp"
#include "packing_options.hpp"

/// Atlas mapper properties
struct atlas_mapper_props {
    rect_packer_ptr packer;     ///< Packing heuristic used for every candidate bin
    packing_options options;    ///< Candidate bins and scale factors
};


/**
 @brief The node maps sprites into a single atlas.
 Items are collected until end_atlas(). Then the smallest fitting bin is searched,
 downscaling all sprites when no bin holds them at their native size.
 The child node receives the final atlas size, the scale factor and every item
 with its scaled pixels, scaled offset and padded box.
 */
class atlas_mapper_node: public chain_node {
public:
    struct init_props: atlas_mapper_props {
        using props = init_props;
        
        /// Set packing heuristic
        props& set_packer(rect_packer_ptr arg) {packer=std::move(arg); return *this;}
        /// Set packing options
        props& set_options(packing_options arg) {options=std::move(arg); return *this;}
    };
    
    explicit atlas_mapper_node(atlas_mapper_props const& props);
    virtual ~atlas_mapper_node();
    
    virtual bool begin_atlas(atlas_props const& atlas) override;
    virtual bool add_atlas_item(atlas_item const& item) override;
    virtual bool end_atlas() override;
    virtual void reset() override;
    
private:
    struct Pimpl;
    std::unique_ptr<Pimpl> _pimpl;
};
