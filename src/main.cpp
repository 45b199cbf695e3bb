#include "forwards.hpp"
#include "helpers.hpp"
#include "atlas_engine.hpp"
#include "image_io.hpp"
#include "image_tools.hpp"
#include "logging.hpp"
#include "sprite_request_parser.hpp"
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/range/adaptor/filtered.hpp>
#include <boost/algorithm/string.hpp>
#include <iostream>
#include <fstream>
#include <regex>
#include <algorithm>
#include <easylogging++.h>

using namespace std;

namespace fs = boost::filesystem;
namespace po = boost::program_options;
namespace ba = boost::adaptors;

INITIALIZE_EASYLOGGINGPP

namespace {

    // Parses comma separated integers
    bool parseIntList(string const& text, vector<int>& values) {
        vector<string> parts;
        boost::split(parts, text, boost::is_any_of(","), boost::token_compress_on);
        for(auto& part : parts) {
            boost::trim(part);
            if(part.empty())
                continue;
            try {
                size_t used = 0;
                values.push_back(stoi(part, &used));
                if(used != part.size())
                    return false;
            } catch(std::exception const&) {
                return false;
            }
        }
        return true;
    }
    
    // Parses the "r,g,b,tolerance" key color
    bool parseKeyColor(string const& text, key_color& color) {
        vector<int> values;
        if(!parseIntList(text, values) || values.size() != 4)
            return false;
        for(int i = 0; i < 3; ++i) {
            if(values[i] < 0 || values[i] > 255)
                return false;
        }
        if(values[3] < 0 || values[3] > 100)
            return false;
        
        color = key_color((unsigned char)values[0], (unsigned char)values[1], (unsigned char)values[2], values[3]);
        return true;
    }
    
    // Builds packing options from the command line
    packing_options extractPackingOptions(po::variables_map const& vars) {
        return packing_options()
            .set_start_bin_size(vars["start-size"].as<int>())
            .set_max_bin_size(vars["max-size"].as<int>())
            .set_image_name(vars["image-name"].as<string>())
            .enable_pretty_json(!vars["compact-json"].as<bool>());
    }
    
    // Collects sprites of the source directory
    packing_request collectDirectorySprites(po::variables_map const& vars) {
        const string srcDir(vars["src"].as<string>());
        
        auto is_file = [](fs::directory_entry const& e){
            return fs::is_regular_file(e.status());
        };

        const regex matchPattern(vars["filter"].as<string>(), regex_constants::grep);
        auto matched_pattern = [&matchPattern](fs::directory_entry const& e) {
            return regex_match(e.path().string(), matchPattern);
        };
        
        vector<fs::path> files;
        for(auto const& dirEntry : fs::recursive_directory_iterator(srcDir)
            | ba::filtered(is_file) | ba::filtered(matched_pattern))
        {
            files.push_back(dirEntry.path());
        }
        // keep the sprite order independent of the directory listing
        sort(files.begin(), files.end());
        
        packing_request request;
        request.padding = vars["padding"].as<int>();
        for(auto const& filename : files) {
            LOG(INFO) << "Processing " << fs::relative(filename, srcDir);
            
            sprite_input sprite;
            sprite.name = filename.stem().string();
            if(!read_image(filename.generic_string(), sprite.image)) {
                throw atlas_error(error_kind::decode_error, "Error reading the " + filename.generic_string() + " file");
            }
            request.sprites.push_back(move(sprite));
        }
        
        return request;
    }
    
    // Reads sprites of the JSON request
    packing_request readRequestSprites(po::variables_map const& vars) {
        const fs::path requestFile(vars["src"].as<string>());
        ifstream requestStream(requestFile.string(), ios_base::in | ios_base::binary);
        if(!requestStream)
            throw atlas_error(error_kind::io_error, "Can't open " + requestFile.string());
        
        return parse_sprite_request(requestStream, sprite_request_props()
                                    .set_base_dir(requestFile.parent_path().string())
                                    .set_default_padding(vars["padding"].as<int>())
                                    .set_image_reader([](string const& filename, image_props& image) {
                                        return read_image(filename, image);
                                    }));
    }
    
    // Packs sprites into the atlas image and its manifest
    int performPack(po::variables_map const& vars) {
        const fs::path src(vars["src"].as<string>());
        const fs::path outDir(vars["dst"].as<string>());
        
        packing_request request = fs::is_directory(src) ?
            collectDirectorySprites(vars) :
            readRequestSprites(vars);
        
        auto options = extractPackingOptions(vars);
        auto output = pack_atlas(request, options);
        
        fs::create_directories(outDir);
        auto imageFile = outDir / options.image_name;
        auto manifestFile = outDir / fs::path(options.image_name).replace_extension(".json");
        
        save_atlas(output, imageFile.generic_string(), manifestFile.generic_string());
        
        LOG(INFO) << "Atlas " << output.manifest.size.width << "x" << output.manifest.size.height
                  << " of " << output.manifest.frames.size() << " sprites, scale " << output.manifest.scale;
        return 0;
    }
    
    // Removes key colors from the source image
    int performRemoveColors(po::variables_map const& vars) {
        const string src(vars["src"].as<string>());
        const string dst(vars["dst"].as<string>());
        
        vector<key_color> colors;
        if(vars.count("color")) {
            for(auto const& text : vars["color"].as<vector<string>>()) {
                key_color color;
                if(!parseKeyColor(text, color)) {
                    LOG(ERROR) << "Invalid key color " << text << ", r,g,b,tolerance expected";
                    return 1;
                }
                colors.push_back(color);
            }
        }
        
        if(colors.empty()) {
            LOG(ERROR) << "No key colors specified";
            return 1;
        }
        
        image_props image;
        if(!read_image(src, image)) {
            LOG(ERROR) << "Error reading the " << src << " file";
            return 1;
        }
        
        remove_colors(image, colors);
        
        if(!write_image(dst, image)) {
            LOG(ERROR) << "Error writing the " << dst << " file";
            return 1;
        }
        return 0;
    }
    
    // Splits the source image along grid lines
    int performSplit(po::variables_map const& vars) {
        const fs::path src(vars["src"].as<string>());
        const fs::path outDir(vars["dst"].as<string>());
        
        vector<int> rows, cols;
        if(!parseIntList(vars["rows"].as<string>(), rows) ||
           !parseIntList(vars["cols"].as<string>(), cols))
        {
            LOG(ERROR) << "Grid lines must be comma separated integers";
            return 1;
        }
        
        image_props image;
        if(!read_image(src.generic_string(), image)) {
            LOG(ERROR) << "Error reading the " << src << " file";
            return 1;
        }
        
        auto tiles = split_grid(image, rows, cols);
        
        fs::create_directories(outDir);
        for(auto const& tile : tiles) {
            auto name = src.stem().string() + "_" + to_string(tile.row) + "_" + to_string(tile.col) + ".png";
            auto filename = outDir / name;
            if(!write_image(filename.generic_string(), tile.image)) {
                LOG(ERROR) << "Error writing the " << filename << " file";
                return 1;
            }
        }
        
        LOG(INFO) << "Written " << tiles.size() << " tiles";
        return 0;
    }

} // anonymous


int main(int argc, const char * argv[]) {
    po::options_description generic("Generic options");
    generic.add_options()
        ("help", "Help message")
        ("verbose,v", po::bool_switch()->default_value(false), "Verbose mode")
        ("config,c", po::value<string>(), "INI file with default option values")
    ;
    
    po::options_description settings("Command options");
    settings.add_options()
        ("padding,p", po::value<int>()->default_value(0), "Padding around each sprite")
        ("start-size", po::value<int>()->default_value(256), "The first candidate atlas side")
        ("max-size", po::value<int>()->default_value(2048), "The largest atlas side")
        ("image-name", po::value<string>()->default_value("atlas.png"), "Atlas image file name referenced by the manifest")
        ("compact-json", po::bool_switch()->default_value(false), "Write the manifest without indentation")
        ("filter,f", po::value<string>()->default_value(".*\\.png$"), "Image file filter")
        ("color", po::value<vector<string>>()->composing(), "Key color r,g,b,tolerance to remove")
        ("rows", po::value<string>()->default_value(""), "Horizontal cut lines y1,y2,...")
        ("cols", po::value<string>()->default_value(""), "Vertical cut lines x1,x2,...")
    ;
    
    po::options_description hidden("Positional options");
    hidden.add_options()
        ("command", po::value<string>()->required(), "pack, remove-colors or split")
        ("src", po::value<string>()->required(), "Source directory, sprite list or image")
        ("dst", po::value<string>()->required(), "Output directory or image")
    ;
    
    po::options_description desc("Usage: spriteprep <pack|remove-colors|split> <src> <dst> [options]");
    desc.add(generic).add(settings);
    
    po::options_description all;
    all.add(generic).add(settings).add(hidden);
    
    po::positional_options_description pos;
    pos.add("command", 1).add("src", 1).add("dst", 1);
    
    // Parse command line arguments
    po::variables_map vars;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vars);
        
        // Values of the config file don't override the command line
        if(vars.count("config")) {
            const string configFile = vars["config"].as<string>();
            ifstream configStream(configFile);
            if(!configStream) {
                cout << "Can't open the config file " << configFile << endl;
                return 1;
            }
            po::store(po::parse_config_file(configStream, settings), vars);
        }
        
        // Check for the help argument
        if(vars.count("help") > 0) {
            cout << desc;
            return 1;
        }
        
        po::notify(vars);
    } catch( po::error const& e) {
        cout << e.what() << endl;
        cout << desc << endl;
        return 1;
    }

    init_logging(vars["verbose"].as<bool>());
    
    const string command = vars["command"].as<string>();
    try {
        if(command == "pack") {
            LOG(INFO) << "Perform atlas packing";
            return performPack(vars);
        }
        if(command == "remove-colors") {
            LOG(INFO) << "Perform key colors removal";
            return performRemoveColors(vars);
        }
        if(command == "split") {
            LOG(INFO) << "Perform grid splitting";
            return performSplit(vars);
        }
    } catch(atlas_error const& e) {
        LOG(ERROR) << error_kind_name(e.kind()) << ": " << e.what();
        return 1;
    } catch(std::exception const& e) {
        LOG(ERROR) << e.what();
        return 1;
    }
    
    LOG(ERROR) << "Unknown command " << command;
    cout << desc << endl;
    return 1;
}
