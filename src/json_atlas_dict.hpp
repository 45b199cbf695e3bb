#pragma once

/// Json fields dictionary
struct json_atlas_dict {
    static const char* frames;
    static const char* frame;
    static const char* rotated;
    static const char* trimmed;
    static const char* sprite_source_size;
    static const char* source_size;
    static const char* pivot;
    static const char* offset;
    static const char* meta;
    static const char* image;
    static const char* size;
    static const char* scale;
    static const char* x;
    static const char* y;
    static const char* w;
    static const char* h;
    
    // sprite request fields
    static const char* padding;
    static const char* sprites;
    static const char* name;
    static const char* base64;
    static const char* path;
    static const char* offset_x;
    static const char* offset_y;
};
