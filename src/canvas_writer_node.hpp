#pragma once

#include "chain_node.hpp"

/// Canvas writer properties
struct canvas_writer_props {
    using img_writer = std::function<bool(image_props const&)>;
    
    img_writer writer;  ///< Handler to write the final image
};

/// The node composes the atlas image by copying every sprite into the canvas
class canvas_writer_node: public chain_node {
public:
    struct init_props: canvas_writer_props {
        using props = init_props;
        
        /// Handler to write the final image
        props& set_writer(img_writer arg) {writer = std::move(arg); return *this;}
    };
    
    explicit canvas_writer_node(canvas_writer_props const& props);
    virtual ~canvas_writer_node();
    
    bool begin_atlas(atlas_props const& atlas) override;
    bool add_atlas_item(atlas_item const& item) override;
    bool end_atlas() override;
    void reset() override;
    
private:
    struct Pimpl;
    std::unique_ptr<Pimpl> _pimpl;
};
