
#pragma once

// Included first by every translation unit (and usable as a precompiled header).
#include "tether/utils/base-include.hpp"
