#pragma once

#include "atlas_builder.hpp"

/**
 * @brief Pipeline stage of the atlas build.
 * Each stage does its own job and passes every builder call down to the
 * next stage, so the packing, the manifest and the canvas stages run as one
 * builder.
 */
class chain_node: public atlas_builder {
protected:
    chain_node();
    
    /// Downstream stage. A missing stage accepts everything.
    atlas_builder& safe_fwd();

public:
    virtual ~chain_node();

    /**
     * @brief Appends the next stage and returns it.
     * @code
     *  mapper->set_child(manifest)->set_child(canvas);
     * @endcode
     */
    chain_node_ptr set_child(chain_node_ptr child);

private:
    class forwarder;
    std::unique_ptr<forwarder> _next;
};
