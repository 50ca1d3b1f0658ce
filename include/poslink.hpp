#pragma once

#include "poslink/version.hpp"
#include "poslink/log/logger.hpp"
#include "poslink/config.hpp"
#include "poslink/client.hpp"
#include "poslink/dispatch/bus.hpp"
#include "poslink/dispatch/category.hpp"
#include "poslink/host/lifecycle.hpp"
