#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../detail/pull.hpp"
#include "../source.hpp"
#include "gate.hpp"

namespace seqflow {
/**
 * @brief Segments a source between opening and closing elements
 *
 * Gate mode (open / close predicates), one transition per element:
 *
 * | state   | element       | action                                                      |
 * |---------|---------------|-------------------------------------------------------------|
 * | waiting | open(e)       | -> open, e appended if open_included                        |
 * | waiting | otherwise     | ignored (a closing element is ignored too)                  |
 * | open    | close(e)      | e appended if close_included, segment emitted, -> waiting   |
 * | open    | otherwise     | appended (an opening element does not nest)                 |
 *
 * A segment closed while empty is dropped. At exhaustion a non-empty open segment is emitted last.
 *
 * Split mode (one splitter): a splitter while open closes the current segment, emitted even if empty, and opens the
 * next one, into which it goes if included. Elements before the first splitter are ignored, the last started segment
 * is emitted at exhaustion.
 *
 * The accumulation buffer is swapped out on emission, never cleared in place.
 */
template <typename T>
class group_gate_seq : public seq_base<seq<T>> {
public:
  using base = seq_base<seq<T>>;
  using typename base::sink_type;

  /// gate mode
  group_gate_seq(seq<T> src, pred_fn<T> open, bool open_included, pred_fn<T> close, bool close_included)
      : src(std::move(src)), open(std::move(open)), close(std::move(close)), open_included(open_included),
        close_included(close_included), split_mode(false) {
    detail::require_ordered(this->src, "group");
    detail::require_callable(this->open, "group", "opening predicate");
    detail::require_callable(this->close, "group", "closing predicate");
  }

  /// split mode
  group_gate_seq(seq<T> src, pred_fn<T> splitter, bool included)
      : src(std::move(src)), open(splitter), close(std::move(splitter)), open_included(included),
        close_included(false), split_mode(true) {
    detail::require_ordered(this->src, "group");
    detail::require_callable(this->open, "group", "splitter");
  }

  bool try_advance(sink_type sink) override {
    started = true;
    while (state != gate_state::ready) {
      if (done) {
        return false;
      }
      auto v = detail::pull_one(src);
      if (!v) {
        on_exhausted();
      } else {
        on_element(std::move(*v));
      }
    }
    state = after_emit;
    sink(from_vector(std::exchange(out, {})));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (started) {
      return nullptr;
    }
    auto prefix = src.try_split();
    if (!prefix) {
      return nullptr;
    }
    if (split_mode) {
      return std::make_unique<group_gate_seq>(std::move(prefix), open, open_included);
    }
    return std::make_unique<group_gate_seq>(std::move(prefix), open, open_included, close, close_included);
  }

  // at most one segment per element
  size_t estimate_size() const noexcept override {
    return done && state != gate_state::ready ? 0 : src.estimate_size();
  }
  seq_props props() const noexcept override { return src.props().structural().without_sized(); }

private:
  void on_element(T &&v) {
    if (state == gate_state::waiting) {
      if (open(v)) {
        state = gate_state::open;
        if (open_included) {
          buf.push_back(std::move(v));
        }
      }
      return;
    }

    // state == open
    if (!close(v)) {
      buf.push_back(std::move(v));
      return;
    }
    if (split_mode) {
      out = std::exchange(buf, {});
      if (open_included) {
        buf.push_back(std::move(v));
      }
      ready(gate_state::open);
      return;
    }
    if (close_included) {
      buf.push_back(std::move(v));
    }
    if (buf.empty()) {
      state = gate_state::waiting;
      return;
    }
    out = std::exchange(buf, {});
    ready(gate_state::waiting);
  }

  void on_exhausted() {
    done = true;
    if (state == gate_state::open && (split_mode || !buf.empty())) {
      out = std::exchange(buf, {});
      ready(gate_state::waiting);
    }
  }

  void ready(gate_state next) noexcept {
    state = gate_state::ready;
    after_emit = next;
  }

  seq<T> src;
  pred_fn<T> open;
  pred_fn<T> close;
  bool const open_included;
  bool const close_included;
  bool const split_mode;

  gate_state state{gate_state::waiting};
  gate_state after_emit{gate_state::waiting};
  std::vector<T> buf; ///< segment being collected
  std::vector<T> out; ///< completed segment, valid in ready state
  bool started{false};
  bool done{false};
};
} // namespace seqflow
