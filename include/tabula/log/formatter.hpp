#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <tabula/encode/hex.hpp>

namespace tabula::log {

struct hex_tag
{};

/**
 * Binary data (ids, roots, addresses) logged as hex. Formatting is
 * deferred to the backend thread.
 */
using hex = quill::BinaryData< hex_tag >;

} // namespace tabula::log

template<>
struct fmtquill::formatter< tabula::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tabula::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tabula::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tabula::log::hex >: quill::BinaryDataDeferredFormatCodec< tabula::log::hex >
{};
