#include "atlas_manifest.hpp"
#include "json_atlas_dict.hpp"
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <rapidjson/prettywriter.h>

using namespace ::std;
using namespace ::rapidjson;

namespace rj = ::rapidjson;

namespace {
    using Dict = json_atlas_dict;
    
    rj::Value makeRect(rect const& r, rj::Document::AllocatorType& allocator) {
        rj::Value entry(rj::kObjectType);
        entry.AddMember(StringRef(Dict::x), rj::Value(r.x).Move(), allocator);
        entry.AddMember(StringRef(Dict::y), rj::Value(r.y).Move(), allocator);
        entry.AddMember(StringRef(Dict::w), rj::Value(r.width).Move(), allocator);
        entry.AddMember(StringRef(Dict::h), rj::Value(r.height).Move(), allocator);
        return entry;
    }
    
    rj::Value makeSize(atlas2d::size const& sz, rj::Document::AllocatorType& allocator) {
        rj::Value entry(rj::kObjectType);
        entry.AddMember(StringRef(Dict::w), rj::Value((int)sz.width).Move(), allocator);
        entry.AddMember(StringRef(Dict::h), rj::Value((int)sz.height).Move(), allocator);
        return entry;
    }
    
    template<typename T>
    rj::Value makePoint(T x, T y, rj::Document::AllocatorType& allocator) {
        rj::Value entry(rj::kObjectType);
        entry.AddMember(StringRef(Dict::x), rj::Value(x).Move(), allocator);
        entry.AddMember(StringRef(Dict::y), rj::Value(y).Move(), allocator);
        return entry;
    }
    
    rj::Value makeFrame(frame_descriptor const& desc, rj::Document::AllocatorType& allocator) {
        rj::Value entry(rj::kObjectType);
        entry.AddMember(StringRef(Dict::frame), makeRect(desc.frame, allocator), allocator);
        entry.AddMember(StringRef(Dict::rotated), rj::Value(desc.rotated).Move(), allocator);
        entry.AddMember(StringRef(Dict::trimmed), rj::Value(desc.trimmed).Move(), allocator);
        entry.AddMember(StringRef(Dict::sprite_source_size), makeRect(desc.sprite_source_size, allocator), allocator);
        entry.AddMember(StringRef(Dict::source_size), makeSize(desc.source_size, allocator), allocator);
        entry.AddMember(StringRef(Dict::pivot), makePoint(desc.pivot_x, desc.pivot_y, allocator), allocator);
        entry.AddMember(StringRef(Dict::offset), makePoint(desc.offset_x, desc.offset_y, allocator), allocator);
        return entry;
    }
}

string write_manifest_json(atlas_manifest const& manifest, bool pretty) {
    rj::Document doc(rj::kObjectType);
    auto& allocator = doc.GetAllocator();
    
    // frames go in the name order of the map
    rj::Value frames(rj::kObjectType);
    for(auto const& entry : manifest.frames) {
        frames.AddMember(rj::Value(entry.first.c_str(), allocator).Move(),
                         makeFrame(entry.second, allocator),
                         allocator);
    }
    doc.AddMember(StringRef(Dict::frames), frames, allocator);
    
    rj::Value meta(rj::kObjectType);
    meta.AddMember(StringRef(Dict::image), rj::Value(manifest.image.c_str(), allocator).Move(), allocator);
    meta.AddMember(StringRef(Dict::size), makeSize(manifest.size, allocator), allocator);
    meta.AddMember(StringRef(Dict::scale), rj::Value(manifest.scale).Move(), allocator);
    doc.AddMember(StringRef(Dict::meta), meta, allocator);
    
    StringBuffer buffer;
    if(pretty) {
        PrettyWriter<StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        Writer<StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    
    return string(buffer.GetString(), buffer.GetSize());
}
