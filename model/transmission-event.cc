#include "transmission-event.h"
#include <sstream>

namespace ns3 {

namespace dtnrelay {

std::string 
EventTypeToString (EventType type)
{
  switch (type)
    {
      case EventType::PATH_SELECTED:
        return "PathSelected";
      case EventType::HOP_STARTED:
        return "HopStarted";
      case EventType::HOP_COMMITTED:
        return "HopCommitted";
      case EventType::LINK_DISRUPTED:
        return "LinkDisrupted";
      case EventType::REROUTED:
        return "Rerouted";
      case EventType::REROUTE_UNAVAILABLE:
        return "RerouteUnavailable";
      case EventType::RETRY_FAILED:
        return "RetryFailed";
      case EventType::RECOVERED:
        return "Recovered";
      case EventType::RETRIES_EXHAUSTED:
        return "RetriesExhausted";
      case EventType::DELIVERED:
        return "Delivered";
      case EventType::FAILED:
        return "Failed";
      default:
        return "UnknownEvent_" + std::to_string (static_cast<unsigned> (type));
    }
}

std::string 
TransmissionEvent::GetAttribute (const std::string& key) const
{
  auto it = attributes.find (key);
  if (it == attributes.end ())
    {
      return "";
    }
  return it->second;
}

std::string 
TransmissionEvent::ToString () const
{
  std::stringstream ss;
  ss << "[" << timestamp.GetSeconds () << "s] " << EventTypeToString (type);
  for (const auto& pair : attributes)
    {
      ss << " " << pair.first << "=" << pair.second;
    }
  return ss.str ();
}

} // namespace dtnrelay

} // namespace ns3
