#include <mpchat/common.h>

namespace mpchat {

const char*
validation_error_name(ValidationError kind)
{
  switch (kind) {
    case ValidationError::contradictory_intent:
      return "contradictory_intent";
    case ValidationError::empty_delta:
      return "empty_delta";
    case ValidationError::overlapping_delta:
      return "overlapping_delta";
  }

  return "unknown";
}

ChannelControlError::ChannelControlError(ValidationError kind,
                                         const std::string& what)
  : InvalidParameterError(std::string(validation_error_name(kind)) + ": " +
                          what)
  , _kind(kind)
{
}

} // namespace mpchat
