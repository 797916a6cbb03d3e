#pragma once

#include "platform/types.hpp"
#include "platform/math.hpp"
#include "platform/vector3.hpp"
#include "platform/utility.hpp"
#include "platform/log.hpp"
