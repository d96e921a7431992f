#pragma once

#include <objectum/crypto/hash.hpp>
