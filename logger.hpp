#pragma once

// Umbrella header: levels, sources, filters, formatters, backends and the
// dispatcher that fans log calls out to them.

#include "log_level.hpp"
#include "log_source.hpp"
#include "source_filter.hpp"
#include "formatter.hpp"
#include "mailbox.hpp"
#include "backend.hpp"
#include "dispatcher.hpp"
#include "sinks.hpp"
