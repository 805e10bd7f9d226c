#include "relay-codes.h"

namespace ns3 {

namespace dtnrelay {

std::string 
ErrorCodeToString (ErrorCode code)
{
  switch (code)
    {
      case ErrorCode::NONE:
        return "None";
      case ErrorCode::CONFIG_ERROR:
        return "ConfigError";
      case ErrorCode::UNKNOWN_LINK:
        return "UnknownLinkError";
      case ErrorCode::NO_PATH:
        return "NoPathError";
      case ErrorCode::BUFFER_FULL:
        return "BufferFullError";
      default:
        return "UnknownError_" + std::to_string (static_cast<unsigned> (code));
    }
}

std::string 
SimulationStatusToString (SimulationStatus status)
{
  switch (status)
    {
      case SimulationStatus::DELIVERED:
        return "Delivered";
      case SimulationStatus::FAILED:
        return "Failed";
      default:
        return "UnknownStatus_" + std::to_string (static_cast<unsigned> (status));
    }
}

std::string 
FailureReasonToString (FailureReason reason)
{
  switch (reason)
    {
      case FailureReason::NONE:
        return "None";
      case FailureReason::NO_PATH:
        return "NoPath";
      case FailureReason::EXHAUSTED:
        return "Exhausted";
      case FailureReason::TIMEOUT:
        return "Timeout";
      case FailureReason::CANCELLED:
        return "Cancelled";
      case FailureReason::CONFIG_ERROR:
        return "ConfigError";
      default:
        return "UnknownReason_" + std::to_string (static_cast<unsigned> (reason));
    }
}

std::string 
PathStatusToString (PathStatus status)
{
  switch (status)
    {
      case PathStatus::SELECTED:
        return "Selected";
      case PathStatus::REROUTED:
        return "Rerouted";
      case PathStatus::FAILED:
        return "Failed";
      case PathStatus::DELIVERED:
        return "Delivered";
      default:
        return "UnknownPathStatus_" + std::to_string (static_cast<unsigned> (status));
    }
}

} // namespace dtnrelay

} // namespace ns3
