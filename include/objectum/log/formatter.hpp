#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <objectum/encode/hex.hpp>

namespace objectum::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace objectum::log

template<>
struct fmtquill::formatter< objectum::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const objectum::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                objectum::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< objectum::log::hex >: quill::BinaryDataDeferredFormatCodec< objectum::log::hex >
{};
