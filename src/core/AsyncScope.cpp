#include "core/AsyncScope.hpp"

#include "common/Log.hpp"

namespace tinydep::core::detail {

void logDuplicateResume(const char* what) {
    LOG_WARN("Resume ignorado (" << what << "): la operación ya había completado");
}

}  // namespace tinydep::core::detail
