#pragma once

#include "forwards.hpp"
#include <stdexcept>

/// Failure categories of an atlas build
enum class error_kind {
    decode_error = 0,       ///< Malformed image or base64 payload
    empty_input,            ///< No sprites were supplied
    duplicate_name,         ///< Two sprites share the same name
    packing_infeasible,     ///< No bin fits the sprites at any scale factor
    composition_error,      ///< Placed item exceeds the canvas
    encode_error,           ///< Final image can't be serialized
    io_error,               ///< File can't be read or written
};

/// Returns a stable identifier of the error kind
char const* error_kind_name(error_kind kind);

/// The error terminating an atlas build
class atlas_error: public std::runtime_error {
public:
    atlas_error(error_kind kind, std::string const& message);
    
    error_kind kind() const { return _kind; }
    
private:
    error_kind _kind;
};
