#include "factory.hpp"

#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/queue/local_disk_queue.hpp"
#include "internal/storage/disk/local_disk_blob.hpp"

namespace localdisk::factory {

Runtime Build(const localdisk::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  if (config.has_blob()) {
    runtime.blob = std::make_shared<storage::LocalDiskBlob>(config.blob());
  }

  if (config.has_queue()) {
    runtime.queue = std::make_shared<queue::LocalDiskQueue>(config.queue());
  }

  if (!runtime.blob && !runtime.queue) {
    LOCALDISK_LOG_WARN("No blob or queue section configured");
  }

  return runtime;
}

} // namespace localdisk::factory
