//=============================================================================
// Atlas engine tests
//
// Covers: frame count, bounds, padding, tight canvas, determinism,
// scale fallback, failures, verbatim pixel copy, custom packers
//=============================================================================

#include <boost/ut.hpp>
#include "atlas_engine.hpp"
#include "rect_packer.hpp"
#include "image_io.hpp"
#include "image_tools.hpp"
#include "test_helpers.hpp"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace boost::ut;

namespace {
    
    packing_request threeSprites(int padding) {
        packing_request request;
        request.padding = padding;
        request.sprites.push_back(solid_sprite("big", 100, 100, 10));
        request.sprites.push_back(solid_sprite("medium", 50, 50, 120));
        request.sprites.push_back(solid_sprite("small", 30, 30, 200));
        return request;
    }
    
    packing_request manySprites(int padding) {
        packing_request request;
        request.padding = padding;
        for(int i = 0; i < 40; ++i) {
            request.sprites.push_back(solid_sprite("sprite_" + std::to_string(i),
                                                   8 + (i * 13) % 57,
                                                   6 + (i * 29) % 61,
                                                   (unsigned char)(i * 5)));
        }
        return request;
    }
    
    // Places rects in a single row, ignoring the bin size
    class row_packer: public rect_packer {
    public:
        boost::optional<placement> pack(std::vector<packing_rect> const& rects, int) override {
            placement places;
            int x = 0;
            for(auto const& r : rects) {
                places.push_back(rect(x, 0, r.width, r.height));
                x += r.width;
            }
            return places;
        }
    };
    
    // Counts packing attempts, never finds a placement
    class counting_packer: public rect_packer {
    public:
        boost::optional<placement> pack(std::vector<packing_rect> const&, int) override {
            ++calls;
            return boost::none;
        }
        
        int calls = 0;
    };
    
    encoded_sprite encodedSprite(std::string const& name, int width, int height) {
        byte_buffer png;
        encode_png(solid_image(width, height, 7, 8, 9), png);
        
        encoded_sprite sprite;
        sprite.name = name;
        sprite.data = encode_data_url(png);
        return sprite;
    }
    
    // Returns placement overlapping the bin edge
    class broken_packer: public rect_packer {
    public:
        boost::optional<placement> pack(std::vector<packing_rect> const& rects, int) override {
            return placement(rects.size(), rect(-5, 0, rects[0].width, rects[0].height));
        }
    };
}

suite atlas_engine_tests = [] {
    "every sprite appears exactly once"_test = [] {
        auto request = manySprites(1);
        auto output = pack_atlas(request);
        
        expect(output.manifest.frames.size() == request.sprites.size());
        for(auto const& sprite : request.sprites) {
            expect(output.manifest.frames.count(sprite.name) == 1_ul) << sprite.name;
        }
    };
    
    "frames stay inside the canvas and padded frames don't overlap"_test = [] {
        const int padding = 3;
        auto output = pack_atlas(manySprites(padding));
        auto const& manifest = output.manifest;
        
        for(auto const& entry : manifest.frames) {
            auto const& frame = entry.second.frame;
            expect(frame.x >= padding && frame.y >= padding) << entry.first;
            expect(frame.right() + padding <= (int)manifest.size.width) << entry.first;
            expect(frame.bottom() + padding <= (int)manifest.size.height) << entry.first;
        }
        expect(!frames_overlap(manifest, padding));
    };
    
    "canvas is the tight box of the padded frames"_test = [] {
        const int padding = 2;
        auto output = pack_atlas(threeSprites(padding));
        auto const& manifest = output.manifest;
        
        int right = 0, bottom = 0;
        for(auto const& entry : manifest.frames) {
            right = (std::max)(right, entry.second.frame.right() + padding);
            bottom = (std::max)(bottom, entry.second.frame.bottom() + padding);
        }
        
        expect(manifest.scale == 1.0_d);
        expect((int)manifest.size.width == right);
        expect((int)manifest.size.height == bottom);
        expect((int)manifest.size.width <= 256 && (int)manifest.size.height <= 256);
        expect((int)manifest.size.width < 256 || (int)manifest.size.height < 256);
        expect(output.canvas.width() == right && output.canvas.height() == bottom);
    };
    
    "frame rects carry the sprite sizes"_test = [] {
        auto output = pack_atlas(threeSprites(2));
        auto const& big = output.manifest.frames.at("big");
        
        expect(big.frame.width == 100_i && big.frame.height == 100_i);
        expect(big.sprite_source_size == rect(0, 0, 100, 100));
        expect((int)big.source_size.width == 100 && (int)big.source_size.height == 100);
        expect(!big.rotated && !big.trimmed);
        expect(big.pivot_x == 0.5_d && big.pivot_y == 0.5_d);
    };
    
    "identical input gives identical atlas"_test = [] {
        auto first = pack_atlas(manySprites(2));
        auto second = pack_atlas(manySprites(2));
        
        expect(first.manifest.size.width == second.manifest.size.width);
        expect(first.manifest.size.height == second.manifest.size.height);
        expect(first.manifest_json == second.manifest_json);
        expect(first.png == second.png);
        for(auto const& entry : first.manifest.frames) {
            expect(entry.second.frame == second.manifest.frames.at(entry.first).frame) << entry.first;
        }
    };
    
    "offsets are carried through at full scale"_test = [] {
        packing_request request;
        request.sprites.push_back(solid_sprite("hero", 40, 60, 90, -3, 7));
        
        auto output = pack_atlas(request);
        auto const& hero = output.manifest.frames.at("hero");
        expect(hero.offset_x == -3_i && hero.offset_y == 7_i);
    };
    
    "sprites too large for every bin are downscaled"_test = [] {
        packing_request request;
        request.sprites.push_back(solid_sprite("boss", 300, 300, 60, 10, -7));
        
        // 300 doesn't fit 256, 270 neither, 240 does
        auto output = pack_atlas(request, packing_options().set_max_bin_size(256));
        auto const& manifest = output.manifest;
        auto const& boss = manifest.frames.at("boss");
        
        expect(manifest.scale == 0.8_d);
        expect(boss.frame == rect(0, 0, 240, 240));
        expect(boss.offset_x == 8_i && boss.offset_y == -6_i);
        expect((int)manifest.size.width == 240 && (int)manifest.size.height == 240);
        expect(output.canvas.width() == 240_i);
    };
    
    "sprite larger than the default ceiling packs at scale 0.4"_test = [] {
        packing_request request;
        request.sprites.push_back(solid_sprite("backdrop", 5000, 5000, 70));
        
        // 5000 * 0.5 = 2500 still exceeds 2048, 5000 * 0.4 = 2000 fits
        auto output = pack_atlas(request);
        expect(output.manifest.scale == 0.4_d);
        expect(output.manifest.frames.at("backdrop").frame == rect(0, 0, 2000, 2000));
        expect((int)output.manifest.size.width == 2000 && (int)output.manifest.size.height == 2000);
        expect(output.canvas.width() == 2000_i && output.canvas.height() == 2000_i);
    };
    
    "sprites too large at every scale fail without output"_test = [] {
        packing_request request;
        request.sprites.push_back(solid_sprite("huge", 1300, 1300, 30));
        
        // even at 0.2 the sprite is 260 pixels wide
        auto kind = error_of([&] {
            pack_atlas(request, packing_options().set_max_bin_size(256));
        });
        expect(kind == error_kind::packing_infeasible);
    };
    
    "empty input is rejected"_test = [] {
        expect(error_of([] { pack_atlas(packing_request()); }) == error_kind::empty_input);
        expect(error_of([] { pack_atlas(std::vector<encoded_sprite>(), 0); }) == error_kind::empty_input);
    };
    
    "empty input is rejected before packing and option checks"_test = [] {
        auto packer = std::make_shared<counting_packer>();
        expect(error_of([&] { pack_atlas(packing_request(), packing_options(), packer); }) == error_kind::empty_input);
        expect(packer->calls == 0_i);
        
        auto badOptions = packing_options().set_scale_factors({});
        expect(error_of([&] { pack_atlas(packing_request(), badOptions, packer); }) == error_kind::empty_input);
        expect(packer->calls == 0_i);
    };
    
    "duplicate names are found before decoding"_test = [] {
        auto broken = encodedSprite("walk_0", 4, 4);
        broken.data = "***";
        std::vector<encoded_sprite> sprites = {encodedSprite("walk_0", 4, 4), broken};
        
        expect(error_of([&] { pack_atlas(sprites, 0); }) == error_kind::duplicate_name);
        
        std::reverse(sprites.begin(), sprites.end());
        expect(error_of([&] { pack_atlas(sprites, 0); }) == error_kind::duplicate_name);
    };
    
    "duplicate sprite names are rejected"_test = [] {
        packing_request request;
        request.sprites.push_back(solid_sprite("walk_0", 10, 10, 1));
        request.sprites.push_back(solid_sprite("walk_0", 12, 12, 2));
        
        expect(error_of([&] { pack_atlas(request); }) == error_kind::duplicate_name);
    };
    
    "pixels are copied verbatim"_test = [] {
        const int padding = 2;
        packing_request request;
        request.padding = padding;
        
        sprite_input ghost;
        ghost.name = "ghost";
        ghost.image = solid_image(20, 10, 200, 100, 50, 128);
        request.sprites.push_back(ghost);
        
        sprite_input glass;
        glass.name = "glass";
        glass.image = solid_image(15, 15, 10, 20, 30, 0);
        pixel_at(glass.image, 7, 7)[3] = 77;
        request.sprites.push_back(glass);
        
        auto output = pack_atlas(request);
        auto const& canvas = output.canvas;
        auto const& ghostFrame = output.manifest.frames.at("ghost").frame;
        auto const& glassFrame = output.manifest.frames.at("glass").frame;
        
        expect(pixel_equals(canvas, ghostFrame.x, ghostFrame.y, 200, 100, 50, 128));
        expect(pixel_equals(canvas, ghostFrame.right() - 1, ghostFrame.bottom() - 1, 200, 100, 50, 128));
        expect(pixel_equals(canvas, glassFrame.x, glassFrame.y, 10, 20, 30, 0));
        expect(pixel_equals(canvas, glassFrame.x + 7, glassFrame.y + 7, 10, 20, 30, 77));
        
        // padding stays transparent
        expect(pixel_equals(canvas, ghostFrame.x - 1, ghostFrame.y, 0, 0, 0, 0));
        expect(pixel_equals(canvas, ghostFrame.x, ghostFrame.y - padding, 0, 0, 0, 0));
    };
    
    "encoded canvas decodes to the composed canvas"_test = [] {
        auto output = pack_atlas(threeSprites(1));
        
        image_props decoded;
        expect(decode_png(output.png, decoded) >> fatal);
        expect(decoded.width() == output.canvas.width());
        expect(decoded.height() == output.canvas.height());
        expect(std::equal(decoded.pixels.get(),
                          decoded.pixels.get() + (size_t)decoded.width() * decoded.height() * 4,
                          output.canvas.pixels.get()));
    };
    
    "encoded sprites are decoded before packing"_test = [] {
        std::vector<encoded_sprite> sprites;
        for(int i = 0; i < 3; ++i) {
            byte_buffer png;
            expect(encode_png(solid_image(10 + i, 20, 1, 2, 3), png) >> fatal);
            
            encoded_sprite sprite;
            sprite.name = "frame_" + std::to_string(i);
            sprite.data = i % 2 ? encode_data_url(png) : encode_data_url(png).substr(22);
            sprite.offset_x = i;
            sprites.push_back(sprite);
        }
        
        auto output = pack_atlas(sprites, 1);
        expect(output.manifest.frames.size() == 3_ul);
        expect(output.manifest.frames.at("frame_2").frame.width == 12_i);
        expect(output.manifest.frames.at("frame_2").offset_x == 2_i);
    };
    
    "undecodable sprite is reported"_test = [] {
        encoded_sprite broken;
        broken.name = "broken";
        broken.data = "data:image/png;base64,bm90IGEgcG5n";
        
        expect(error_of([&] { pack_atlas(std::vector<encoded_sprite>{broken}, 0); }) == error_kind::decode_error);
        
        broken.data = "***";
        expect(error_of([&] { pack_atlas(std::vector<encoded_sprite>{broken}, 0); }) == error_kind::decode_error);
    };
    
    "packing heuristic can be replaced"_test = [] {
        auto output = pack_atlas(threeSprites(0), packing_options(), std::make_shared<row_packer>());
        auto const& frames = output.manifest.frames;
        
        expect(frames.at("big").frame == rect(0, 0, 100, 100));
        expect(frames.at("medium").frame == rect(100, 0, 50, 50));
        expect(frames.at("small").frame == rect(150, 0, 30, 30));
        expect((int)output.manifest.size.width == 180 && (int)output.manifest.size.height == 100);
    };
    
    "placement outside of the canvas is a composition error"_test = [] {
        auto kind = error_of([] {
            pack_atlas(threeSprites(0), packing_options(), std::make_shared<broken_packer>());
        });
        expect(kind == error_kind::composition_error);
    };
    
    "invalid options are rejected"_test = [] {
        auto request = threeSprites(0);
        expect(throws<std::invalid_argument>([&] {
            pack_atlas(request, packing_options().set_scale_factors({0.5, 0.8}));
        }));
        expect(throws<std::invalid_argument>([&] {
            pack_atlas(request, packing_options().set_scale_factors({}));
        }));
        
        request.padding = -1;
        expect(throws<std::invalid_argument>([&] { pack_atlas(request); }));
    };
    
    "saved atlas has both files or none"_test = [] {
        namespace fs = boost::filesystem;
        auto dir = fs::temp_directory_path() / fs::unique_path("spriteprep-%%%%-%%%%");
        fs::create_directories(dir);
        auto output = pack_atlas(threeSprites(1));
        
        auto imageFile = (dir / "atlas.png").string();
        auto manifestFile = (dir / "atlas.json").string();
        save_atlas(output, imageFile, manifestFile);
        expect(fs::file_size(imageFile) == output.png.size());
        expect(fs::file_size(manifestFile) == output.manifest_json.size());
        
        auto lostImage = (dir / "lost.png").string();
        auto lostManifest = (dir / "missing" / "lost.json").string();
        expect(error_of([&] { save_atlas(output, lostImage, lostManifest); }) == error_kind::io_error);
        expect(!fs::exists(lostImage));
        expect(!fs::exists(lostManifest));
        
        fs::remove_all(dir);
    };
};
