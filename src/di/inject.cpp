#include "dix/di/inject.hpp"

#include <spdlog/spdlog.h>

#include "dix/util/logging.hpp"

namespace dix::di {

void logSkippedField(const TypeKey& record, const std::string& field) {
  util::logger()->debug("Skipping non-settable field '{}' of '{}'", field, record.name());
}

}  // namespace dix::di
