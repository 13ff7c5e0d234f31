#pragma once
#include "kb/ids/Id.hpp"
#include <string>

namespace kb {

struct CaptureError {
  std::string code;     // e.g. "NotFoundError", "InvalidStateError"
  std::string message;  // human text
};

struct CaptureResult {
  bool ok{true};
  CaptureError err{};

  static CaptureResult success() { return {}; }
  static CaptureResult failure(const std::string& code, const std::string& message) {
    return {false, {code, message}};
  }
};

// Native pointer-capture primitives of one rendered element.
// Implemented by the host UI layer; a draggable holds it non-owning once mounted.
class PointerCaptureTarget {
public:
  virtual ~PointerCaptureTarget() = default;

  virtual CaptureResult setPointerCapture(PointerId id) = 0;
  virtual CaptureResult releasePointerCapture(PointerId id) = 0;
  virtual bool hasPointerCapture(PointerId id) const = 0;
};

} // namespace kb
