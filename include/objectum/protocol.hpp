#pragma once

#include <objectum/protocol/effects.hpp>
#include <objectum/protocol/error.hpp>
#include <objectum/protocol/object.hpp>
#include <objectum/protocol/owner.hpp>
#include <objectum/protocol/transaction.hpp>
#include <objectum/protocol/type_tag.hpp>
#include <objectum/protocol/types.hpp>
