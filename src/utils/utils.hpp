#pragma once

// Shared helpers pulled in by most translation units
#include "logging.hpp"
#include "time_utils.hpp"
