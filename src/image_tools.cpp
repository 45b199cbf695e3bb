#include "image_tools.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <easylogging++.h>

#define MODULE_LOGGER "image_tools"

using namespace ::std;

namespace {
    const double lanczosRadius = 3.0;
    const double pi = 3.14159265358979323846;
    const double colorDistanceScale = 4.42;   // maps [0,100] to the RGB distance range
    
    double sinc(double x) {
        if(x == 0.0)
            return 1.0;
        x *= pi;
        return sin(x) / x;
    }
    
    double lanczos(double x) {
        if(x <= -lanczosRadius || x >= lanczosRadius)
            return 0.0;
        return sinc(x) * sinc(x / lanczosRadius);
    }
    
    // Filter taps of a single destination pixel
    struct Contribution {
        int first = 0;
        vector<double> weights;
    };
    
    // Precalculates normalized filter taps for each destination pixel
    vector<Contribution> makeContributions(int srcLen, int dstLen) {
        vector<Contribution> contribs(dstLen);
        
        const double ratio = (double)srcLen / dstLen;
        const double filterScale = (std::max)(ratio, 1.0);
        const double support = lanczosRadius * filterScale;
        
        for(int i = 0; i < dstLen; ++i) {
            const double center = (i + 0.5) * ratio;
            int first = (int)floor(center - support);
            int last = (int)ceil(center + support);
            first = (std::max)(first, 0);
            last = (std::min)(last, srcLen - 1);
            
            auto& contrib = contribs[i];
            contrib.first = first;
            
            double total = 0.0;
            for(int j = first; j <= last; ++j) {
                double w = lanczos((j + 0.5 - center) / filterScale);
                contrib.weights.push_back(w);
                total += w;
            }
            
            if(total != 0.0) {
                for(auto& w : contrib.weights)
                    w /= total;
            }
        }
        
        return contribs;
    }
    
    unsigned char clampChannel(double value) {
        value = (std::min)(255.0, (std::max)(0.0, value));
        return (unsigned char)lround(value);
    }
    
    void checkRgba(image_props const& image) {
        if(image.fmt != atlas2d::pixel_format::rgba8 || !image.pixels)
            throw invalid_argument("RGBA8 image expected");
    }
}

image_props make_image(int width, int height) {
    if(width <= 0 || height <= 0)
        throw invalid_argument("Image dimensions must be positive");
    
    const size_t bytes = (size_t)width * height * 4;
    auto pixels = atlas2d::raw_data_ptr((unsigned char*)calloc(bytes, 1),
                                        [](unsigned char* p){free(p);});
    if(!pixels)
        throw bad_alloc();
    
    image_props image;
    image.size = atlas2d::size(width, height);
    image.fmt = atlas2d::pixel_format::rgba8;
    image.pixels = pixels;
    return image;
}

int scaled_extent(int value, double scale) {
    return (std::max)(1, (int)lround(value * scale));
}

int scaled_offset(int value, double scale) {
    return (int)lround(value * scale);
}

image_props resize_lanczos(image_props const& image, int width, int height) {
    checkRgba(image);
    
    const int srcWidth = image.width();
    const int srcHeight = image.height();
    image_props result = make_image(width, height);
    
    if(srcWidth == width && srcHeight == height) {
        memcpy(result.pixels.get(), image.pixels.get(), (size_t)width * height * 4);
        return result;
    }
    
    CLOG(DEBUG, MODULE_LOGGER) << "Resampling " << srcWidth << "x" << srcHeight
        << " to " << width << "x" << height;
    
    // Horizontal pass into the intermediate buffer
    auto horizontal = makeContributions(srcWidth, width);
    vector<double> temp((size_t)width * srcHeight * 4);
    for(int y = 0; y < srcHeight; ++y) {
        for(int x = 0; x < width; ++x) {
            auto const& contrib = horizontal[x];
            double acc[4] = {0, 0, 0, 0};
            for(size_t k = 0; k < contrib.weights.size(); ++k) {
                const unsigned char* src = pixel_at(image, contrib.first + (int)k, y);
                for(int c = 0; c < 4; ++c)
                    acc[c] += src[c] * contrib.weights[k];
            }
            double* dst = &temp[((size_t)y * width + x) * 4];
            for(int c = 0; c < 4; ++c)
                dst[c] = acc[c];
        }
    }
    
    // Vertical pass into the result
    auto vertical = makeContributions(srcHeight, height);
    for(int y = 0; y < height; ++y) {
        auto const& contrib = vertical[y];
        for(int x = 0; x < width; ++x) {
            double acc[4] = {0, 0, 0, 0};
            for(size_t k = 0; k < contrib.weights.size(); ++k) {
                const double* src = &temp[((size_t)(contrib.first + (int)k) * width + x) * 4];
                for(int c = 0; c < 4; ++c)
                    acc[c] += src[c] * contrib.weights[k];
            }
            unsigned char* dst = pixel_at(result, x, y);
            for(int c = 0; c < 4; ++c)
                dst[c] = clampChannel(acc[c]);
        }
    }
    
    return result;
}

size_t remove_colors(image_props& image, vector<key_color> const& colors) {
    checkRgba(image);
    
    size_t removed = 0;
    const size_t count = (size_t)image.width() * image.height();
    unsigned char* pixel = image.pixels.get();
    for(size_t i = 0; i < count; ++i, pixel += 4) {
        for(auto const& color : colors) {
            const int dr = pixel[0] - color.r;
            const int dg = pixel[1] - color.g;
            const int db = pixel[2] - color.b;
            const double distance = sqrt((double)(dr * dr + dg * dg + db * db));
            
            if(distance <= color.tolerance * colorDistanceScale) {
                pixel[3] = 0;
                ++removed;
                break;
            }
        }
    }
    
    CLOG(INFO, MODULE_LOGGER) << "Removed " << removed << " pixels";
    return removed;
}

image_props crop(image_props const& image, rect const& area) {
    checkRgba(image);
    
    const int left = (std::max)(area.x, 0);
    const int top = (std::max)(area.y, 0);
    const int right = (std::min)(area.right(), image.width());
    const int bottom = (std::min)(area.bottom(), image.height());
    if(right <= left || bottom <= top)
        throw invalid_argument("Crop area doesn't intersect the image");
    
    image_props result = make_image(right - left, bottom - top);
    const size_t rowBytes = (size_t)result.width() * 4;
    for(int y = top; y < bottom; ++y) {
        memcpy(pixel_at(result, 0, y - top), pixel_at(image, left, y), rowBytes);
    }
    return result;
}

vector<grid_tile> split_grid(image_props const& image,
                             vector<int> horizontal_lines,
                             vector<int> vertical_lines)
{
    checkRgba(image);
    
    // turn cut lines into sorted unique points, including image edges
    auto makePoints = [](vector<int>& lines, int extent) {
        lines.push_back(0);
        lines.push_back(extent);
        lines.erase(remove_if(lines.begin(), lines.end(), [extent](int v) {
            return v < 0 || v > extent;
        }), lines.end());
        sort(lines.begin(), lines.end());
        lines.erase(unique(lines.begin(), lines.end()), lines.end());
    };
    makePoints(horizontal_lines, image.height());
    makePoints(vertical_lines, image.width());
    
    vector<grid_tile> tiles;
    for(size_t row = 0; row + 1 < horizontal_lines.size(); ++row) {
        for(size_t col = 0; col + 1 < vertical_lines.size(); ++col) {
            rect area(vertical_lines[col],
                      horizontal_lines[row],
                      vertical_lines[col + 1] - vertical_lines[col],
                      horizontal_lines[row + 1] - horizontal_lines[row]);
            grid_tile tile;
            tile.row = (int)row;
            tile.col = (int)col;
            tile.image = crop(image, area);
            tiles.push_back(move(tile));
        }
    }
    
    CLOG(INFO, MODULE_LOGGER) << "Image split into " << tiles.size() << " tiles";
    return tiles;
}
