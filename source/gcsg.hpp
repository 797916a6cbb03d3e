#pragma once

#include "platform/platform.hpp"
#include "error.hpp"
