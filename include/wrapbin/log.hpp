#pragma once

#include <wrapbin/log/log.hpp>
