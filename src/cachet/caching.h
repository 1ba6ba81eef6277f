#ifndef CACHET_CACHING_H
#define CACHET_CACHING_H

#include <cachet/caching/cache.h>
#include <cachet/caching/cache_key.h>
#include <cachet/caching/config.h>
#include <cachet/caching/decorators/exclusive_access.h>
#include <cachet/caching/decorators/fifo_eviction.h>
#include <cachet/caching/decorators/hit_ratio.h>
#include <cachet/caching/decorators/lru_eviction.h>
#include <cachet/caching/decorators/scheduled_flush.h>
#include <cachet/caching/decorators/stampede_guard.h>
#include <cachet/caching/unbounded_cache.h>

#endif
