#pragma once

#include <objectum/ownership/authority.hpp>
#include <objectum/ownership/error.hpp>
