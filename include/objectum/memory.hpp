#pragma once

#include <objectum/memory/memory.hpp>
