#pragma once

#include <objectum/execution/argument_validator.hpp>
#include <objectum/execution/effects_builder.hpp>
#include <objectum/execution/executor.hpp>
#include <objectum/execution/gas.hpp>
#include <objectum/execution/scripted_executor.hpp>
#include <objectum/execution/version_assigner.hpp>
