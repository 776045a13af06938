// -----------------------------------------------------------------------------
// block_resolver.cpp: implementation for block_resolver.hpp
// -----------------------------------------------------------------------------
#include "endec/block_resolver.hpp"
#include "endec/faults.hpp"
#include "endec/text_util.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace endec {

namespace {

std::optional<ResolvedAlert> try_single_line(const AlertBlock& block, const HeaderContext& ctx) {
  for (size_t i = 0; i < block.lines.size(); ++i) {
    const std::string& line = block.lines[i];
    if (match_header_at(line, 0) != line.size()) continue;

    auto header = parse_header(line, ctx);
    if (!header) continue;

    std::vector<std::string> rest;
    rest.reserve(block.lines.size() - 1);
    for (size_t j = 0; j < block.lines.size(); ++j)
      if (j != i) rest.push_back(block.lines[j]);

    ResolvedAlert r;
    r.body = join_nonempty(rest);
    r.header = std::move(header);
    r.source = HeaderSource::Line;
    return r;
  }
  return std::nullopt;
}

std::optional<ResolvedAlert> try_embedded(const AlertBlock& block, const HeaderContext& ctx) {
  std::string concat;
  std::vector<size_t> starts;                    // offset of each line inside concat
  starts.reserve(block.lines.size());
  for (const auto& line : block.lines) {
    starts.push_back(concat.size());
    concat += line;
  }

  const auto span = find_header(concat);
  if (!span) return std::nullopt;

  auto header = parse_header(std::string_view(concat).substr(span->offset, span->length), ctx);
  if (!header) return std::nullopt;

  // Keep, per line, whatever lies outside [offset, end) of the header.
  std::vector<std::string> kept;
  for (size_t i = 0; i < block.lines.size(); ++i) {
    const std::string& line = block.lines[i];
    const size_t ls = starts[i];
    const size_t le = ls + line.size();

    if (ls < span->offset) {
      const size_t stop = std::min(le, span->offset);
      kept.emplace_back(trim(std::string_view(line).substr(0, stop - ls)));
    }
    if (le > span->end()) {
      const size_t from = std::max(ls, span->end());
      kept.emplace_back(trim(std::string_view(line).substr(from - ls)));
    }
  }

  ResolvedAlert r;
  r.body = join_nonempty(kept);
  r.header = std::move(header);
  r.source = HeaderSource::Embedded;
  return r;
}

bool looks_like_header(const AlertBlock& block) {
  for (const auto& line : block.lines)
    if (line.find("ZCZC") != std::string::npos) return true;
  return false;
}

} // namespace

ResolvedAlert resolve_block(const AlertBlock& block, const HeaderContext& ctx) {
  std::optional<ResolvedAlert> found = try_single_line(block, ctx);
  if (!found) found = try_embedded(block, ctx);

  ResolvedAlert r;
  if (found) {
    r = std::move(*found);
  } else {
    if (looks_like_header(block))
      spdlog::debug("[resolver] {}: ZCZC text failed validation, kept as body",
                    to_string(FaultKind::MalformedHeader));
    r.body = join_nonempty(block.lines);
  }

  if (r.body.empty() && r.header) r.body = r.header->event_name;
  return r;
}

} // namespace endec
