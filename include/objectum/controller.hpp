#pragma once

#include <objectum/controller/controller.hpp>
#include <objectum/controller/error.hpp>
