#include "atlas_error.hpp"

char const* error_kind_name(error_kind kind) {
    switch (kind) {
        case error_kind::decode_error:          return "DecodeError";
        case error_kind::empty_input:           return "EmptyInput";
        case error_kind::duplicate_name:        return "DuplicateName";
        case error_kind::packing_infeasible:    return "PackingInfeasible";
        case error_kind::composition_error:     return "CompositionError";
        case error_kind::encode_error:          return "EncodeError";
        case error_kind::io_error:              return "IoError";
    }
    return "UnknownError";
}

atlas_error::atlas_error(error_kind kind, std::string const& message)
: std::runtime_error(message), _kind(kind)
{ ;; }
