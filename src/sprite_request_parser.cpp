#include "sprite_request_parser.hpp"
#include "atlas_engine.hpp"
#include "json_atlas_dict.hpp"
#include "helpers.hpp"
#include <rapidjson/rapidjson.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <boost/filesystem.hpp>
#include <set>
#include <easylogging++.h>

#define MODULE_LOGGER "request_parser"

using namespace ::rapidjson;
using namespace ::std;

namespace fs = boost::filesystem;

// undef colliding windows definings
#ifdef GetObject
#undef GetObject
#endif

namespace {
    using Dict = json_atlas_dict;
    
    atlas_error requestError(string const& msg) {
        CLOG(ERROR, MODULE_LOGGER) << msg;
        return atlas_error(error_kind::decode_error, msg);
    }
    
    int readOffset(Value const& jSprite, const char* key, string const& name) {
        auto pos = jSprite.FindMember(key);
        if(pos == jSprite.MemberEnd())
            return 0;
        if(!pos->value.IsInt())
            throw requestError(string("Invalid ") + key + " of the sprite " + name);
        return pos->value.GetInt();
    }
    
    sprite_input parseSprite(Value const& jSprite, sprite_request_props const& props, set<string>& names) {
        if(!jSprite.IsObject())
            throw requestError("Sprite entry must be an object");
        
        auto jName = jSprite.FindMember(Dict::name);
        if(jName == jSprite.MemberEnd() || !jName->value.IsString())
            throw requestError("Sprite entry has no name");
        string name = jName->value.GetString();
        if(!names.insert(name).second) {
            CLOG(ERROR, MODULE_LOGGER) << "Sprite name " << name << " already exists";
            throw atlas_error(error_kind::duplicate_name, "Duplicate sprite name: " + name);
        }
        
        auto jBase64 = jSprite.FindMember(Dict::base64);
        auto jPath = jSprite.FindMember(Dict::path);
        
        sprite_input sprite;
        if(jBase64 != jSprite.MemberEnd() && jBase64->value.IsString()) {
            encoded_sprite encoded;
            encoded.name = name;
            encoded.data = jBase64->value.GetString();
            sprite = decode_sprite(encoded);
        } else if(jPath != jSprite.MemberEnd() && jPath->value.IsString()) {
            fs::path filename(jPath->value.GetString());
            if(filename.is_relative() && !props.base_dir.empty())
                filename = fs::path(props.base_dir) / filename;
            
            sprite.name = name;
            if(!props.read_image || !props.read_image(filename.generic_string(), sprite.image)) {
                throw atlas_error(error_kind::decode_error,
                                  "Error reading the image " + filename.generic_string() + " of the sprite " + name);
            }
        } else {
            throw requestError("Sprite " + name + " has neither base64 data nor path");
        }
        
        sprite.offset_x = readOffset(jSprite, Dict::offset_x, name);
        sprite.offset_y = readOffset(jSprite, Dict::offset_y, name);
        return sprite;
    }
    
} // anonymous

packing_request parse_sprite_request(std::istream& stream, sprite_request_props const& props) {
    if(!stream)
        throw atlas_error(error_kind::io_error, "Sprite request stream is not readable");
    
    IStreamWrapper rjStream(stream);
    Document doc;
    doc.ParseStream(rjStream);
    
    if(doc.HasParseError()) {
        throw requestError(string("Invalid sprite request JSON: ") + GetParseError_En(doc.GetParseError()));
    }
    
    packing_request request;
    request.padding = props.default_padding;
    
    Value const* jSprites = &doc;
    if(doc.IsObject()) {
        auto jPadding = doc.FindMember(Dict::padding);
        if(jPadding != doc.MemberEnd()) {
            if(!jPadding->value.IsInt() || jPadding->value.GetInt() < 0)
                throw requestError("Padding must be a non-negative integer");
            request.padding = jPadding->value.GetInt();
        }
        
        auto jList = doc.FindMember(Dict::sprites);
        if(jList == doc.MemberEnd())
            throw requestError("Sprite request has no sprites");
        jSprites = &jList->value;
    }
    
    if(!jSprites->IsArray())
        throw requestError("Sprites must be an array");
    
    // Parse each sprite
    set<string> names;
    for(auto const& jSprite : jSprites->GetArray()) {
        request.sprites.push_back(parseSprite(jSprite, props, names));
    }
    
    CLOG(INFO, MODULE_LOGGER) << "Parsed " << request.sprites.size() << " sprites";
    return request;
}
