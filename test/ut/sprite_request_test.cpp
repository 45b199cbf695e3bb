//=============================================================================
// Sprite request parser tests
//=============================================================================

#include <boost/ut.hpp>
#include "sprite_request_parser.hpp"
#include "image_io.hpp"
#include "test_helpers.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace boost::ut;

namespace {
    
    std::string pngUrl(int width, int height) {
        byte_buffer png;
        encode_png(solid_image(width, height, 1, 2, 3), png);
        return encode_data_url(png);
    }
    
    packing_request parse(std::string const& json, sprite_request_props const& props = sprite_request_props()) {
        std::istringstream stream(json);
        return parse_sprite_request(stream, props);
    }
}

suite sprite_request_tests = [] {
    "array of sprites"_test = [] {
        auto json = "[{\"name\": \"a\", \"base64\": \"" + pngUrl(4, 5) + "\", \"offsetX\": 3},"
                    " {\"name\": \"b\", \"base64\": \"" + pngUrl(6, 2) + "\", \"offsetY\": -4}]";
        auto request = parse(json, sprite_request_props().set_default_padding(2));
        
        expect((request.sprites.size() == 2_ul) >> fatal);
        expect(request.padding == 2_i);
        expect(request.sprites[0].name == "a");
        expect(request.sprites[0].image.width() == 4_i && request.sprites[0].image.height() == 5_i);
        expect(request.sprites[0].offset_x == 3_i && request.sprites[0].offset_y == 0_i);
        expect(request.sprites[1].name == "b");
        expect(request.sprites[1].offset_y == -4_i);
    };
    
    "object with padding"_test = [] {
        auto json = "{\"padding\": 5, \"sprites\": [{\"name\": \"coin\", \"base64\": \"" + pngUrl(8, 8) + "\"}]}";
        auto request = parse(json, sprite_request_props().set_default_padding(1));
        
        expect((request.sprites.size() == 1_ul) >> fatal);
        expect(request.padding == 5_i);
        expect(pixel_equals(request.sprites[0].image, 7, 7, 1, 2, 3, 255));
    };
    
    "image paths are resolved against the base directory"_test = [] {
        std::vector<std::string> requested;
        auto props = sprite_request_props()
            .set_base_dir("assets")
            .set_image_reader([&](std::string const& filename, image_props& image) {
                requested.push_back(filename);
                image = solid_image(3, 3, 9, 9, 9);
                return true;
            });
        
        auto request = parse("[{\"name\": \"rel\", \"path\": \"hero/idle.png\"},"
                             " {\"name\": \"abs\", \"path\": \"/tmp/idle.png\"}]", props);
        
        expect((requested.size() == 2_ul) >> fatal);
        expect(requested[0] == "assets/hero/idle.png");
        expect(requested[1] == "/tmp/idle.png");
        expect(request.sprites[1].name == "abs");
        expect(request.sprites[1].image.width() == 3_i);
    };
    
    "unreadable image path is a decode error"_test = [] {
        auto props = sprite_request_props().set_image_reader([](std::string const&, image_props&) {
            return false;
        });
        
        auto kind = error_of([&] { parse("[{\"name\": \"x\", \"path\": \"x.png\"}]", props); });
        expect(kind == error_kind::decode_error);
    };
    
    "malformed requests are rejected"_test = [] {
        expect(error_of([] { parse("[{\"name\": \"a\""); }) == error_kind::decode_error);
        expect(error_of([] { parse("[{\"base64\": \"aGk=\"}]"); }) == error_kind::decode_error);
        expect(error_of([] { parse("[{\"name\": \"a\"}]"); }) == error_kind::decode_error);
        expect(error_of([] { parse("{\"padding\": -1, \"sprites\": []}"); }) == error_kind::decode_error);
        expect(error_of([] { parse("{\"padding\": 1}"); }) == error_kind::decode_error);
        expect(error_of([] { parse("42"); }) == error_kind::decode_error);
        
        auto json = "[{\"name\": \"a\", \"base64\": \"" + pngUrl(2, 2) + "\", \"offsetX\": \"left\"}]";
        expect(error_of([&] { parse(json); }) == error_kind::decode_error);
    };
    
    "duplicate names are found before decoding"_test = [] {
        auto json = "[{\"name\": \"a\", \"base64\": \"" + pngUrl(2, 2) + "\"},"
                    " {\"name\": \"a\", \"base64\": \"***\"}]";
        expect(error_of([&] { parse(json); }) == error_kind::duplicate_name);
        
        int reads = 0;
        auto props = sprite_request_props().set_image_reader([&](std::string const&, image_props& image) {
            ++reads;
            image = solid_image(2, 2, 0, 0, 0);
            return true;
        });
        expect(error_of([&] { parse("[{\"name\": \"b\", \"path\": \"b.png\"},"
                                    " {\"name\": \"b\", \"path\": \"c.png\"}]", props); }) == error_kind::duplicate_name);
        expect(reads == 1_i);
    };
    
    "invalid image data is a decode error"_test = [] {
        expect(error_of([] { parse("[{\"name\": \"a\", \"base64\": \"bm90IGEgcG5n\"}]"); }) == error_kind::decode_error);
    };
    
    "empty sprite list is parsed"_test = [] {
        auto request = parse("{\"sprites\": []}");
        expect(request.sprites.empty());
        expect(request.padding == 0_i);
    };
};
