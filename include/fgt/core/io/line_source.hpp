// File: include/fgt/core/io/line_source.hpp
#pragma once

#include "fgt/core/status.hpp"
#include "fgt/core/types.hpp"

namespace fgt {

// Pull-based, non-restartable stream of raw lines with their source position.
class ILineSource {
 public:
  virtual ~ILineSource() = default;

  // Returns:
  //  - OK on success and fills `out`
  //  - out_of_range("eof") when a finite source is exhausted
  //  - deadline_exceeded when a polling source ran out of time without a full line
  //  - other error codes on failure
  virtual Status next(SourceLine* out) = 0;
};

}  // namespace fgt
