/**
 * @file block_resolver.hpp
 * @brief AlertBlock -> (message body, optional EAS header).
 *
 * @details
 * The appliance usually prints the header on its own line, but over a noisy
 * serial link it also arrives split mid-field across two lines, or glued to
 * the human-readable text. Resolution, in order:
 *
 *  1. **Single line.** The first line that is exactly one valid header is
 *     taken; the other lines, space-joined, are the body.
 *  2. **Fragmented / embedded.** All lines concatenated with no separator
 *     and searched for the first valid header. The body keeps, per input
 *     line, only the characters outside the header's span, so text before
 *     and after the header survives even when the span crosses lines.
 *  3. **None.** The space-joined block is the body; no header.
 *  4. A header with an empty body gets the event name as its body.
 *
 * Header-shaped text that fails validation is body text (FaultKind::MalformedHeader,
 * logged at debug).
 */
#ifndef ENDEC_BLOCK_RESOLVER_HPP
#define ENDEC_BLOCK_RESOLVER_HPP

#include <stdint.h>
#include <optional>
#include <string>

#include "endec/eas_header.hpp"
#include "endec/frame_assembler.hpp"

namespace endec {

/// Where the header came from, for logs.
enum class HeaderSource : uint8_t { None = 0, Line = 1, Embedded = 2 };

struct ResolvedAlert {
  std::string body;
  std::optional<EasHeader> header;
  HeaderSource source{HeaderSource::None};

  bool has_header() const { return header.has_value(); }

  /// Nothing worth dispatching.
  bool empty() const { return body.empty() && !header; }
};

ResolvedAlert resolve_block(const AlertBlock& block, const HeaderContext& ctx);

} // namespace endec

#endif // ENDEC_BLOCK_RESOLVER_HPP
