#pragma once

#include <objectum/store/error.hpp>
#include <objectum/store/memory_store.hpp>
#include <objectum/store/object_store.hpp>
