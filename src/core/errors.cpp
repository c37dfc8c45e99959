#include <sitemirror/core/errors.hpp>

namespace sitemirror {

const char* clone_error_kind_str(CloneErrorKind kind) {
    switch (kind) {
        case CloneErrorKind::VALIDATION:  return "validation";
        case CloneErrorKind::RENDER:      return "render";
        case CloneErrorKind::PERSISTENCE: return "persistence";
        case CloneErrorKind::ASSET_FETCH: return "asset_fetch";
    }
    return "unknown";
}

} // namespace sitemirror
