#pragma once

#include <objectum/package/error.hpp>
#include <objectum/package/lock_file.hpp>
#include <objectum/package/manifest.hpp>
#include <objectum/package/module.hpp>
#include <objectum/package/publication_gate.hpp>
#include <objectum/package/resolution.hpp>
