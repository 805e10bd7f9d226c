#include "simulation-state.h"

#include <algorithm>

namespace ns3 {

namespace dtnrelay {

std::string 
EngineStateToString (EngineState state)
{
  switch (state)
    {
      case EngineState::SELECT_PATH:
        return "SelectPath";
      case EngineState::ADVANCE_HOP:
        return "AdvanceHop";
      case EngineState::LINK_CHECK:
        return "LinkCheck";
      case EngineState::DISRUPTED:
        return "Disrupted";
      case EngineState::RECOVERY_RETRY:
        return "RecoveryRetry";
      case EngineState::REROUTE:
        return "Reroute";
      case EngineState::DELIVERED:
        return "Delivered";
      case EngineState::FAILED:
        return "Failed";
      default:
        return "UnknownState_" + std::to_string (static_cast<unsigned> (state));
    }
}

SimulationState::SimulationState (Ptr<Bundle> b, const TopologyGraph& topology, Time startTime)
  : bundle (b),
    state (EngineState::SELECT_PATH),
    location (BundleLocation::AT_NODE),
    currentNode (b->GetSource ()),
    hopIndex (0),
    disruptedLinks (topology),
    start (startTime),
    clock (startTime),
    totalDelay (Seconds (0)),
    totalRetransmissions (0),
    disruptionCount (0),
    storageEvents (0),
    pathsAvailable (0),
    status (SimulationStatus::FAILED),
    reason (FailureReason::NONE),
    peakOccupancy (0)
{
  traversed.push_back (currentNode);
}

std::string 
SimulationState::GetNextHop () const
{
  if (hopIndex + 1 >= activePath.nodes.size ())
    {
      return "";
    }
  return activePath.nodes[hopIndex + 1];
}

uint32_t 
SimulationState::GetRetries (const std::string& a, const std::string& b) const
{
  auto it = retryCounters.find (LinkKey (a, b));
  if (it == retryCounters.end ())
    {
      return 0;
    }
  return it->second;
}

bool 
SimulationState::WasTraversed (const std::string& node) const
{
  if (node == currentNode)
    {
      return false;
    }
  return std::find (traversed.begin (), traversed.end (), node) != traversed.end ();
}

bool 
SimulationState::IsTerminal () const
{
  return state == EngineState::DELIVERED || state == EngineState::FAILED;
}

} // namespace dtnrelay

} // namespace ns3
