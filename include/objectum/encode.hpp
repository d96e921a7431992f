#pragma once

#include <objectum/encode/bcs.hpp>
#include <objectum/encode/error.hpp>
#include <objectum/encode/hex.hpp>
