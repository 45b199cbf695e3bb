#include "chain_node.hpp"

using namespace ::std;

class chain_node::forwarder: public atlas_builder {
public:
    bool begin_atlas(atlas_props const& props) override {
        return !child || child->begin_atlas(props);
    }
    
    bool add_atlas_item(atlas_item const& item) override {
        return !child || child->add_atlas_item(item);
    }
    
    bool end_atlas() override {
        return !child || child->end_atlas();
    }
    
    void reset() override {
        if(child)
            child->reset();
    }
    
    chain_node_ptr child;
};

chain_node::chain_node(): _next(new forwarder) {
    ;;
}

chain_node::~chain_node() {
    ;;
}

atlas_builder& chain_node::safe_fwd() {
    return *_next;
}

chain_node_ptr chain_node::set_child(chain_node_ptr child) {
    _next->child = move(child);
    return _next->child;
}
