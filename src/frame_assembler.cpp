// -----------------------------------------------------------------------------
// frame_assembler.cpp: implementation of the marker state machine
//
// API contract and diagrams: include/endec/frame_assembler.hpp
//
// A single line may hold several markers ("...<ENDECEND><ENDECSTART>..."),
// so push_line() walks the line marker by marker instead of assuming one
// transition per line.
// -----------------------------------------------------------------------------
#include "endec/frame_assembler.hpp"
#include "endec/text_util.hpp"

namespace endec {

void FrameAssembler::push_line(std::string_view line) {
  bool touched = false;                          // did any part of the line land in a block?

  while (true) {
    if (state_ == State::Scanning) {
      const size_t s = line.find(START_MARKER);
      if (s == std::string_view::npos) break;    // rest is idle chatter
      line.remove_prefix(s + START_MARKER.size());
      begin_block();
      touched = true;
      continue;
    }

    // Collecting: the earliest marker decides what happens next
    const size_t s = line.find(START_MARKER);
    const size_t e = line.find(END_MARKER);

    if (s == std::string_view::npos && e == std::string_view::npos) {
      append(line);
      touched = true;
      break;
    }

    if (e != std::string_view::npos && (s == std::string_view::npos || e < s)) {
      append(line.substr(0, e));                 // last content line
      emit(/*forced*/ false);
      state_ = State::Scanning;
      line.remove_prefix(e + END_MARKER.size());
      touched = true;
      continue;
    }

    // New start while still collecting: the previous block was truncated.
    append(line.substr(0, s));
    emit(/*forced*/ true);
    line.remove_prefix(s + START_MARKER.size());
    begin_block();
    touched = true;
  }

  if (!touched) ++lines_ignored_;
}

bool FrameAssembler::on_read_timeout() {
  if (state_ != State::Collecting) return false;
  const bool had_lines = !current_.lines.empty();
  emit(/*forced*/ true);
  state_ = State::Scanning;
  return had_lines;
}

bool FrameAssembler::get_block(AlertBlock& out) {
  if (outbox_.empty()) return false;
  out = std::move(outbox_.front());
  outbox_.pop_front();
  return true;
}

// ---------- private ----------

void FrameAssembler::begin_block() {
  current_.lines.clear();
  current_.forced = false;
  state_ = State::Collecting;
}

void FrameAssembler::append(std::string_view text) {
  const std::string_view t = trim(text);
  if (t.empty()) return;                         // blank lines never reach a block

  if (current_.lines.size() >= MAX_BLOCK_LINES) {
    emit(/*forced*/ true);                       // cap reached: hand off, keep collecting
    begin_block();
  }
  current_.lines.emplace_back(t);
}

void FrameAssembler::emit(bool forced) {
  if (current_.lines.empty()) return;            // empty blocks are discarded

  current_.forced = forced;
  outbox_.push_back(std::move(current_));
  current_ = AlertBlock{};

  ++blocks_emitted_;
  if (forced) ++blocks_forced_;
}

} // namespace endec
