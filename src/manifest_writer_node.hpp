#pragma once

#include "chain_node.hpp"
#include "atlas_manifest.hpp"

/// Manifest writer properties
struct manifest_writer_props {
    std::string image_name;                 ///< Atlas image reference
    bool pretty_json = true;                ///< Indent the JSON document
};

/// The node builds the frame manifest of the atlas and dumps it to JSON
class manifest_writer_node: public chain_node {
public:
    struct init_props: manifest_writer_props {
        using props = init_props;
        
        /// Sets atlas image reference
        props& set_image_name(std::string arg) {image_name=std::move(arg); return *this;}
        /// Enables the indented output
        props& enable_pretty_json(bool arg=true) {pretty_json=arg; return *this;}
    };
    
    explicit manifest_writer_node(manifest_writer_props const& props);
    virtual ~manifest_writer_node();

    bool begin_atlas(atlas_props const& atlas) override;
    bool add_atlas_item(atlas_item const& item) override;
    bool end_atlas() override;
    void reset() override;
    
    /// Returns the manifest of the last atlas
    atlas_manifest const& manifest() const;
    
    /// Returns the manifest JSON of the last atlas
    std::string const& manifest_json() const;
    
private:
    struct Pimpl;
    std::unique_ptr<Pimpl> _pimpl;
};
