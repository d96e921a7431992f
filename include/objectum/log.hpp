#pragma once

#include <objectum/log/formatter.hpp>
#include <objectum/log/frontend.hpp>
#include <objectum/log/log.hpp>
