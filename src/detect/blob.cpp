#include "detect/blob.h"

namespace detect {

const char* to_string(BlobKind kind) {
    switch (kind) {
        case BlobKind::Dark:    return "dark";
        case BlobKind::Bright:  return "bright";
        case BlobKind::Coupled: return "coupled";
        case BlobKind::Standard:
        default:                return "standard";
    }
}

} // namespace detect
