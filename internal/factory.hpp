#pragma once

#include "config/config.pb.h"
#include "internal/persistence/blob.hpp"
#include "internal/persistence/queue.hpp"

namespace localdisk::factory {

/*
  Runtime

  The persistence services a caller works against. Either member is
  null when its config section is absent.
*/
struct Runtime {
  persistence::BlobPtr  blob;
  persistence::QueuePtr queue;
};

/*
  Build

  Composition root: the ONLY place that knows the concrete store types.
*/
Runtime Build(const localdisk::runtime::config::RuntimeConfig& config);

} // namespace localdisk::factory
