#include "json_atlas_dict.hpp"

const char* json_atlas_dict::frames             = "frames";
const char* json_atlas_dict::frame              = "frame";
const char* json_atlas_dict::rotated            = "rotated";
const char* json_atlas_dict::trimmed            = "trimmed";
const char* json_atlas_dict::sprite_source_size = "spriteSourceSize";
const char* json_atlas_dict::source_size        = "sourceSize";
const char* json_atlas_dict::pivot              = "pivot";
const char* json_atlas_dict::offset             = "offset";
const char* json_atlas_dict::meta               = "meta";
const char* json_atlas_dict::image              = "image";
const char* json_atlas_dict::size               = "size";
const char* json_atlas_dict::scale              = "scale";
const char* json_atlas_dict::x                  = "x";
const char* json_atlas_dict::y                  = "y";
const char* json_atlas_dict::w                  = "w";
const char* json_atlas_dict::h                  = "h";

const char* json_atlas_dict::padding            = "padding";
const char* json_atlas_dict::sprites            = "sprites";
const char* json_atlas_dict::name               = "name";
const char* json_atlas_dict::base64             = "base64";
const char* json_atlas_dict::path               = "path";
const char* json_atlas_dict::offset_x           = "offsetX";
const char* json_atlas_dict::offset_y           = "offsetY";
