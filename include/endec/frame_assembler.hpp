/**
 * @file frame_assembler.hpp
 * @brief Turns the appliance's endless line stream into discrete alert blocks.
 *
 * @details
 * ## Field Brief
 * The appliance prints every alert between two markers:
 * ```
 *   <ENDECSTART>
 *   ZCZC-WXR-TOR-048113+0030-1234567-KXYZ1234-
 *   Take shelter now
 *   <ENDECEND>
 * ```
 * Between alerts the line carries idle chatter, partial lines after a
 * reconnect, and the occasional truncated alert. The assembler keeps only
 * what sits between markers and hands it on as an `AlertBlock`.
 *
 * ---
 *
 * @par State machine
 * ```
 *            start marker                     end marker
 *  Scanning ──────────────► Collecting ───────────────────► Scanning (+ emit)
 *     ▲                      │   │  start marker again
 *     │                      │   └──────────► emit stale block, keep Collecting
 *     └──── read timeout ────┘ (emit what was buffered)
 * ```
 * - Markers match as case-sensitive substrings anywhere in a line.
 * - Text after a start marker on the same line is the first content line;
 *   text before an end marker is the last.
 * - Blank lines are dropped. An empty block is never emitted.
 * - A block that reaches MAX_BLOCK_LINES is emitted as-is (forced) and
 *   collection continues into a fresh block.
 *
 * ---
 *
 * @par Operational model
 * Same three-call loop as the rest of the relay: feed, tick, drain.
 * @code
 * FrameAssembler fa;
 * fa.push_line(line);          // or fa.on_read_timeout() when a read times out
 * AlertBlock block;
 * while (fa.get_block(block)) {
 *   // resolve + dispatch
 * }
 * @endcode
 *
 * A single line may close and open any number of blocks, so the outbox is
 * not capped: every emitted block waits until the caller drains it. The
 * relay drains after every call, which keeps it at a few blocks at most.
 */
#ifndef ENDEC_FRAME_ASSEMBLER_HPP
#define ENDEC_FRAME_ASSEMBLER_HPP

#include <stdint.h>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace endec {

static constexpr std::string_view START_MARKER = "<ENDECSTART>";
static constexpr std::string_view END_MARKER   = "<ENDECEND>";

/// Lines collected between markers. Owned by the assembler until drained.
struct AlertBlock {
  std::vector<std::string> lines;
  bool forced = false;   ///< emitted by timeout, restart, or line cap rather than an end marker
};

class FrameAssembler {
public:
  static constexpr size_t MAX_BLOCK_LINES = 256;   ///< force-emit threshold

  enum class State : uint8_t { Scanning = 0, Collecting = 1 };

  /// Feed one line (terminator already stripped).
  void push_line(std::string_view line);

  /**
   * @brief A read timed out with no new data.
   * @return true if an open block was force-emitted.
   */
  bool on_read_timeout();

  /// Pop the oldest emitted block. false if none is waiting.
  bool get_block(AlertBlock& out);

  State state() const { return state_; }
  bool is_collecting() const { return state_ == State::Collecting; }
  size_t buffered_lines() const { return current_.lines.size(); }
  size_t pending_blocks() const { return outbox_.size(); }

  /// @name Counters (monotonic, for logs and tests)
  ///@{
  uint32_t blocks_emitted() const { return blocks_emitted_; }
  uint32_t blocks_forced()  const { return blocks_forced_; }
  uint32_t lines_ignored()  const { return lines_ignored_; }
  ///@}

private:
  void begin_block();
  void append(std::string_view text);
  void emit(bool forced);

  State state_{State::Scanning};
  AlertBlock current_;
  std::deque<AlertBlock> outbox_;

  uint32_t blocks_emitted_{0};
  uint32_t blocks_forced_{0};
  uint32_t lines_ignored_{0};
};

} // namespace endec

#endif // ENDEC_FRAME_ASSEMBLER_HPP
