#pragma once

#include <wrapbin/binary/binary.hpp>
#include <wrapbin/binary/error.hpp>
