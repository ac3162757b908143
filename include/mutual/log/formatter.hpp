#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <mutual/encode/hex.hpp>

namespace mutual::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace mutual::log

template<>
struct fmtquill::formatter< mutual::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mutual::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                mutual::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< mutual::log::hex >: quill::BinaryDataDeferredFormatCodec< mutual::log::hex >
{};
