#pragma once

#include <cstddef>

// Size and property boilerplate for adapters that forward both unchanged (or with props revoked) from `src`.
#ifndef SEQFLOW_SEQ_DEFAULTS
#define SEQFLOW_SEQ_DEFAULTS(PropsExpr__)                                                                              \
  size_t estimate_size() const noexcept override { return src.estimate_size(); }                                      \
  seq_props props() const noexcept override { return (PropsExpr__); }
#endif
