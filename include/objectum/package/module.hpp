#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <objectum/package/error.hpp>

namespace objectum::package {

constexpr std::uint32_t module_magic             = 0xa11c'eb0b;
constexpr std::uint32_t min_bytecode_version     = 1;
constexpr std::uint32_t current_bytecode_version = 6;

/**
 * The leading fields of a compiled module: magic, bytecode version and the
 * declared module name. Everything after the name is opaque to the gate.
 */
struct module_header
{
  std::uint32_t version = current_bytecode_version;
  std::string name;
};

result< module_header > decode_module_header( std::span< const std::byte > bytes ) noexcept;

std::vector< std::byte > make_module( std::string_view name,
                                      std::span< const std::byte > body = {},
                                      std::uint32_t version             = current_bytecode_version );

} // namespace objectum::package
