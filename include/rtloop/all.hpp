#pragma once

#include "rtloop/version.hpp"
#include "rtloop/visibility.hpp"
#include "rtloop/core/types.hpp"
#include "rtloop/core/time.hpp"
#include "rtloop/core/clock.hpp"
#include "rtloop/core/status.hpp"
#include "rtloop/core/error.hpp"
#include "rtloop/core/expected.hpp"
#include "rtloop/io/logger.hpp"
#include "rtloop/io/stderr_sink.hpp"
#include "rtloop/timing/rt_stats.hpp"
#include "rtloop/timing/wait_strategy.hpp"
#include "rtloop/timing/cycle_pacer.hpp"
#include "rtloop/sync/state_slot.hpp"
#include "rtloop/control/pid/pid.hpp"
#include "rtloop/safety/clip.hpp"
#include "rtloop/safety/watchdog.hpp"
