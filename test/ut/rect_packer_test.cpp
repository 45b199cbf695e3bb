//=============================================================================
// Rect packer tests
//
// Covers: non-overlap, bin bounds, no rotation, failures, largest-first order
//=============================================================================

#include <boost/ut.hpp>
#include "rect_packer.hpp"
#include "bin_packer.hpp"
#include <vector>

using namespace boost::ut;

namespace {
    bool insideBin(rect const& r, int binSize) {
        return r.x >= 0 && r.y >= 0 && r.right() <= binSize && r.bottom() <= binSize;
    }
}

suite rect_packer_tests = [] {
    "places every rect inside the bin without overlap"_test = [] {
        auto packer = create_default_rect_packer();
        std::vector<packing_rect> rects = {
            {0, 104, 104}, {1, 54, 54}, {2, 34, 34}, {3, 60, 20}, {4, 20, 60}
        };
        
        auto places = packer->pack(rects, 256);
        expect(places.has_value() >> fatal);
        expect(places->size() == rects.size());
        
        for(size_t i = 0; i < places->size(); ++i) {
            auto const& r = (*places)[i];
            expect(insideBin(r, 256)) << "rect" << i << "is outside of the bin";
            expect(r.width == rects[i].width && r.height == rects[i].height) << "rect" << i << "changed its size";
            for(size_t j = i + 1; j < places->size(); ++j) {
                expect(!r.intersects((*places)[j])) << "rects" << i << "and" << j << "overlap";
            }
        }
    };
    
    "never rotates a rect"_test = [] {
        auto packer = create_default_rect_packer();
        std::vector<packing_rect> rects = {{0, 250, 20}, {1, 250, 20}, {2, 20, 200}};
        
        auto places = packer->pack(rects, 256);
        expect(places.has_value() >> fatal);
        expect((*places)[0].width == 250_i && (*places)[0].height == 20_i);
        expect((*places)[2].width == 20_i && (*places)[2].height == 200_i);
    };
    
    "fails when a rect is larger than the bin"_test = [] {
        auto packer = create_default_rect_packer();
        expect(!packer->pack({{0, 257, 10}}, 256).has_value());
        expect(!packer->pack({{0, 10, 300}}, 256).has_value());
    };
    
    "fails when rects don't fit together"_test = [] {
        auto packer = create_default_rect_packer();
        std::vector<packing_rect> rects;
        for(int i = 0; i < 5; ++i)
            rects.push_back(packing_rect(i, 128, 128));
        
        expect(!packer->pack(rects, 256).has_value());
        rects.pop_back();
        expect(packer->pack(rects, 256).has_value());
    };
    
    "puts the largest rect first"_test = [] {
        auto packer = create_default_rect_packer();
        std::vector<packing_rect> rects = {{0, 50, 50}, {1, 200, 200}};
        
        auto places = packer->pack(rects, 256);
        expect(places.has_value() >> fatal);
        expect((*places)[1].x == 0_i && (*places)[1].y == 0_i);
    };
    
    "repeated packing gives the same placement"_test = [] {
        std::vector<packing_rect> rects;
        for(int i = 0; i < 20; ++i)
            rects.push_back(packing_rect(i, 10 + (i * 7) % 40, 12 + (i * 11) % 30));
        
        auto first = create_default_rect_packer()->pack(rects, 256);
        auto second = create_default_rect_packer()->pack(rects, 256);
        expect((first.has_value() && second.has_value()) >> fatal);
        expect(*first == *second);
    };
    
    "max rects bin is filled up to its dimensions"_test = [] {
        auto bin = create_max_rects_bin(128, 64);
        
        rect placed;
        expect(!bin->insert_square(129, 64, placed));
        expect(!bin->insert_square(128, 65, placed));
        expect(bin->insert_square(128, 64, placed));
        expect(bin->occupancy() > 0.99f);
        expect(!bin->insert_square(1, 1, placed));
        
        bin->clean_bin();
        expect(bin->insert_square(64, 64, placed));
    };
};
