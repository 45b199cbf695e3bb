#include "image_io.hpp"
#include "helpers.hpp"
#include "image_tools.hpp"
#include <atlas2d/pixel_format.hpp>
#include <atlas2d/forwards.hpp>
#include <boost/filesystem.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <png.h>
#include <set>
#include <cstring>
#include <fstream>
#include <algorithm>
#include <iterator>
#include <easylogging++.h>

#define MODULE_LOGGER "image_io"

using namespace ::std;
using namespace ::atlas2d;

namespace fs = boost::filesystem;
namespace bai = boost::archive::iterators;

namespace {
    using img_writer = std::function<bool(std::string const&, image_props const&)>;
    using img_reader = std::function<bool(std::string const&, image_props&)>;
    
    const string dataUrlMarker = "data:";
    const string base64Marker = ";base64,";
    const string pngDataUrlHeader = "data:image/png;base64,";
    
    /// Source of the png reading callback
    struct png_memory_source {
        byte_buffer const* data = nullptr;
        size_t pos = 0;
    };

    // default error handler, must not return to libpng
    void onPngError(png_structp pngStruct, png_const_charp msg) {
        CLOG(ERROR, MODULE_LOGGER) << msg;
        png_longjmp(pngStruct, 1);
    }

    // default warning handler
    void onPngWarning(png_structp pngStruct, png_const_charp msg) {
        CLOG(WARNING, MODULE_LOGGER) << msg;
    }
    
    void readPngChunk(png_structp pngStruct, png_bytep out, png_size_t count) {
        auto source = static_cast<png_memory_source*>(png_get_io_ptr(pngStruct));
        if(source->pos + count > source->data->size()) {
            png_error(pngStruct, "Unexpected end of png data");
        }
        memcpy(out, source->data->data() + source->pos, count);
        source->pos += count;
    }
    
    void writePngChunk(png_structp pngStruct, png_bytep in, png_size_t count) {
        auto sink = static_cast<byte_buffer*>(png_get_io_ptr(pngStruct));
        sink->insert(sink->end(), in, in + count);
    }
    
    void flushPng(png_structp) {
        ;;
    }

    /**
     @brief Reads the png stream into the RGBA8 image.
     Palette, gray, low and high bit depth images are converted on the fly.
     */
    bool readPng(byte_buffer const& data, image_props& props) {
        const size_t sigBytes = 8;
        if(data.size() < sigBytes || png_sig_cmp(data.data(), 0, sigBytes) != 0) {
            CLOG(ERROR, MODULE_LOGGER) << "The data is not a png image";
            return false;
        }
        
        png_structp pngStruct = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, &onPngError, &onPngWarning);
        png_infop pngInfo = pngStruct ? png_create_info_struct(pngStruct) : nullptr;
        
        shared_ptr<png_struct> pngGuard(pngStruct, [&](png_structp){
            png_destroy_read_struct(&pngStruct, &pngInfo, NULL);
        });
        
        shared_ptr<png_bytep> rowPtrsGuard;
        atlas2d::raw_data_ptr pixelsGuard;
        png_memory_source source;
        source.data = &data;
        
        if(!pngStruct || !pngInfo) {
            CLOG(ERROR, MODULE_LOGGER) << "Error initializing png struct";
            return false;
        }
        
        if(setjmp(png_jmpbuf(pngStruct))) {
            return false;
        }

        png_set_read_fn(pngStruct, &source, &readPngChunk);
        png_read_info(pngStruct, pngInfo);

        png_uint_32 bitdepth   = png_get_bit_depth(pngStruct, pngInfo);
        png_uint_32 color_type = png_get_color_type(pngStruct, pngInfo);
        bool hasTransparency   = png_get_valid(pngStruct, pngInfo, PNG_INFO_tRNS) != 0;
        
        // Convert palette color to true color
        if (color_type == PNG_COLOR_TYPE_PALETTE)
            png_set_palette_to_rgb(pngStruct);
        
        // Convert low bit colors to 8 bit colors
        if (bitdepth < 8)
        {
            if (color_type==PNG_COLOR_TYPE_GRAY || color_type==PNG_COLOR_TYPE_GRAY_ALPHA)
                png_set_expand_gray_1_2_4_to_8(pngStruct);
            else
                png_set_packing(pngStruct);
        }
        
        if (hasTransparency)
            png_set_tRNS_to_alpha(pngStruct);
        
        // Convert high bit colors to 8 bit colors
        if (bitdepth == 16)
            png_set_strip_16(pngStruct);
        
        // Convert gray color to true color
        if (color_type==PNG_COLOR_TYPE_GRAY || color_type==PNG_COLOR_TYPE_GRAY_ALPHA)
            png_set_gray_to_rgb(pngStruct);
        
        // Every decoded image carries the alpha channel
        if (!(color_type & PNG_COLOR_MASK_ALPHA) && !hasTransparency)
            png_set_add_alpha(pngStruct, 0xff, PNG_FILLER_AFTER);
        
        png_set_interlace_handling(pngStruct);
        
        // Update the changes
        png_read_update_info(pngStruct, pngInfo);
        
        uint32_t width = (uint32_t)png_get_image_width(pngStruct, pngInfo);
        uint32_t height = (uint32_t)png_get_image_height(pngStruct, pngInfo);
        bitdepth = png_get_bit_depth(pngStruct, pngInfo);
        png_uint_32 channels = png_get_channels(pngStruct, pngInfo);
        if(channels != 4 || bitdepth != 8) {
            CLOG(ERROR, MODULE_LOGGER) << "Unsupported png layout: " << channels << " channels, " << bitdepth << " bits";
            return false;
        }
        
        uint32_t bpp = channels * bitdepth / 8;
        uint32_t bytesInRow = width * bpp;

        pixelsGuard = atlas2d::raw_data_ptr((unsigned char*)malloc(sizeof(unsigned char) * width * height * bpp),
                                        [](unsigned char* p){free(p);});
        unsigned char* pixels = pixelsGuard.get();
        if(!pixels) {
            CLOG(ERROR, MODULE_LOGGER) << "Can't allocate " << width << "x" << height << " image";
            return false;
        }
        
        // Map each image's row to the pixels array
        {
            rowPtrsGuard = shared_ptr<png_bytep>((png_bytepp)malloc(sizeof(png_bytep)*height),
                                                     [](png_bytepp ptr){free(ptr);});
            png_bytepp rowPtrs = rowPtrsGuard.get();

            for (uint32_t i = 0; i < height; i++) {
                rowPtrs[i] = &pixels[(size_t)i * bytesInRow];
            }
            
            png_read_image(pngStruct, rowPtrs);
        }

        props.pixels = pixelsGuard;
        props.size = atlas2d::size(width, height);
        props.fmt = atlas2d::pixel_format::rgba8;

        return true;
    }

    /// Writes the image to the png stream.
    bool writePng(image_props const& image, byte_buffer& data) {
        if(image.fmt != pixel_format::rgba8 &&
           image.fmt != pixel_format::rgb8) {
            CLOG(ERROR, MODULE_LOGGER) << "Unsupported pixel format";
            return false;
        }
        
        if(image.width() <= 0 || image.height() <= 0 || !image.pixels) {
            CLOG(ERROR, MODULE_LOGGER) << "Can't encode an empty image";
            return false;
        }
        
        png_structp pngStruct = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, &onPngError, &onPngWarning);
        png_infop pngInfo = pngStruct ? png_create_info_struct(pngStruct) : nullptr;
        
        shared_ptr<png_struct> pngGuard(pngStruct, [&](png_structp){
            png_destroy_write_struct(&pngStruct, &pngInfo);
        });
        
        shared_ptr<png_bytep> rowPtrsGuard;
        byte_buffer encoded;
        
        if(!pngStruct || !pngInfo) {
            CLOG(ERROR, MODULE_LOGGER) << "Error initializing png struct";
            return false;
        }
        
        if(setjmp(png_jmpbuf(pngStruct))) {
            return false;
        }
        
        png_set_write_fn(pngStruct, &encoded, &writePngChunk, &flushPng);
        
        png_set_IHDR(pngStruct,
                     pngInfo,
                     image.size.width,
                     image.size.height,
                     8,
                     image.fmt == pixel_format::rgba8 ? PNG_COLOR_TYPE_RGB_ALPHA : PNG_COLOR_TYPE_RGB,
                     PNG_INTERLACE_NONE,
                     PNG_COMPRESSION_TYPE_BASE,
                     PNG_FILTER_TYPE_BASE);
        
        rowPtrsGuard = shared_ptr<png_bytep>(new png_bytep[image.size.height], [](png_bytepp ptr){
            delete [] ptr;
        });
        
        png_bytepp rowPtrs = rowPtrsGuard.get();
        unsigned char* pixels = image.pixels.get();
        uint32_t bpp = pixel_format_details(image.fmt).bpp;
        uint32_t bytesInRow = image.size.width * bpp;
        
        for (uint32_t i = 0; i < (uint32_t)image.size.height; i++) {
            rowPtrs[i] = (png_bytep)(&pixels[(size_t)i * bytesInRow]);
        }
        
        png_set_rows(pngStruct, pngInfo, rowPtrs);
        
        png_write_png(pngStruct, pngInfo, PNG_TRANSFORM_IDENTITY, NULL);
        
        data.swap(encoded);
        return true;
    }
    
    bool readPngFile(std::string const& filename, image_props& props) {
        byte_buffer data;
        if(!read_file(filename, data))
            return false;
        return readPng(data, props);
    }
    
    bool writePngFile(std::string const& filename, image_props const& props) {
        byte_buffer data;
        if(!writePng(props, data))
            return false;
        return write_file(filename, data);
    }
    
    /// Describes specific image format and acts as an item of a "set" container
    struct image_ext {
        using Self = image_ext;
        
        string ext;
        img_reader reader;
        img_writer writer;
        
        image_ext() { ;; }
        explicit image_ext(string _ext): ext(move(_ext)) { ;; }
        
        Self& set_ext(string arg) { ext = move(arg); return *this; }
        Self& set_reader(img_reader arg) { reader = move(arg); return *this; }
        Self& set_writer(img_writer arg) { writer = move(arg); return *this; }

        bool operator<(image_ext const& tbl) const {
            return ext < tbl.ext;
        }
    };
    
    /// Returns table of supported formats to load or save
    std::set<image_ext> const& ext_table() {
        static std::set<image_ext> table = {
            image_ext(".png").set_reader(&readPngFile).set_writer(&writePngFile)
        };
        
        return table;
    }
    
    /// Returns an image format entry by filename
    image_ext const* find_image_ext(string const& filename) {
        auto const& table = ext_table();
        
        string ext = fs::path(filename).extension().string();
        std::transform(ext.begin(), ext.end(),
                       ext.begin(), ::tolower);
        
        auto pos = table.find(image_ext(ext));
        if(pos == table.end()) {
            return nullptr;
        }
        
        image_ext const& item = *pos;
        return &item;
    }
    
} // anonymous

bool decode_png(byte_buffer const& data, image_props& props) {
    return readPng(data, props);
}

bool encode_png(image_props const& props, byte_buffer& data) {
    return writePng(props, data);
}

bool read_image(std::string const& filename, image_props& props) {
    auto processor = find_image_ext(filename);
    if(!processor) {
        CLOG(ERROR, MODULE_LOGGER) << "Unknown format of the file " << filename;
        return false;
    }

    return processor->reader(filename, props);
}

bool write_image(std::string const& filename, image_props const& props) {
    auto processor = find_image_ext(filename);
    if(!processor) {
        CLOG(ERROR, MODULE_LOGGER) << "Unknown format of the file " << filename;
        return false;
    }

    return processor->writer(filename, props);
}

bool read_file(std::string const& filename, byte_buffer& data) {
    ifstream file(filename, ios_base::in | ios_base::binary);
    if(!file) {
        CLOG(ERROR, MODULE_LOGGER) << "Error openening " << filename << " for read";
        return false;
    }
    
    data.assign(istreambuf_iterator<char>(file), istreambuf_iterator<char>());
    if(file.bad()) {
        CLOG(ERROR, MODULE_LOGGER) << "Error reading " << filename;
        return false;
    }
    return true;
}

bool write_file(std::string const& filename, byte_buffer const& data) {
    ofstream file(filename, ios_base::out | ios_base::binary | ios_base::trunc);
    if(!file) {
        CLOG(ERROR, MODULE_LOGGER) << "Error openening " << filename << " for write";
        return false;
    }
    
    file.write(reinterpret_cast<char const*>(data.data()), data.size());
    if(!file) {
        CLOG(ERROR, MODULE_LOGGER) << "Error writing " << filename;
        return false;
    }
    return true;
}

bool decode_data_url(std::string const& text, byte_buffer& data) {
    using base64_decoder = bai::transform_width<bai::binary_from_base64<string::const_iterator>, 8, 6>;
    
    // skip the data url header
    size_t payloadPos = 0;
    if(text.compare(0, dataUrlMarker.size(), dataUrlMarker) == 0) {
        auto markerPos = text.find(base64Marker);
        if(markerPos == string::npos) {
            CLOG(ERROR, MODULE_LOGGER) << "The data url isn't base64 encoded";
            return false;
        }
        payloadPos = markerPos + base64Marker.size();
    }
    
    string payload;
    payload.reserve(text.size() - payloadPos);
    for(auto pos = text.begin() + payloadPos; pos != text.end(); ++pos) {
        if(!isspace((unsigned char)*pos))
            payload.push_back(*pos);
    }
    
    if(payload.empty() || payload.size() % 4 != 0) {
        CLOG(ERROR, MODULE_LOGGER) << "Invalid base64 length " << payload.size();
        return false;
    }
    
    // the padding is decoded as zero bits and cut afterwards
    size_t paddingLen = 0;
    while(paddingLen < 2 && payload[payload.size() - 1 - paddingLen] == '=')
        ++paddingLen;
    if(payload.find('=') < payload.size() - paddingLen) {
        CLOG(ERROR, MODULE_LOGGER) << "Unexpected base64 padding";
        return false;
    }
    std::fill(payload.end() - paddingLen, payload.end(), 'A');
    
    byte_buffer decoded;
    try {
        decoded.assign(base64_decoder(payload.cbegin()), base64_decoder(payload.cend()));
    } catch(bai::dataflow_exception const& e) {
        CLOG(ERROR, MODULE_LOGGER) << "Invalid base64 data: " << e.what();
        return false;
    }
    decoded.resize(decoded.size() - paddingLen);
    
    data.swap(decoded);
    return true;
}

std::string encode_data_url(byte_buffer const& data) {
    using base64_encoder = bai::base64_from_binary<bai::transform_width<byte_buffer::const_iterator, 6, 8>>;
    
    string encoded(base64_encoder(data.cbegin()), base64_encoder(data.cend()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return pngDataUrlHeader + encoded;
}
