#include <string_view>
#include "common/frame_error.hpp"

namespace mbframer {

std::string_view ToString(FrameError error) noexcept {
  switch (error) {
    case FrameError::kNotEnoughData:
      return "NotEnoughData";
    case FrameError::kBadLength:
      return "BadLength";
    case FrameError::kBadErrorCheck:
      return "BadErrorCheck";
    case FrameError::kBadFuncCode:
      return "BadFuncCode";
  }
  return "Unknown";
}

}  // namespace mbframer
