#include "stats-recorder.h"
#include "ns3/log.h"

#include <sstream>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("StatsRecorder");

namespace dtnrelay {

std::string 
StatsRecord::ToString () const
{
  std::stringstream ss;
  
  ss << "StatsRecord(";
  ss << "status=" << SimulationStatusToString (status);
  if (status == SimulationStatus::FAILED)
    {
      ss << ", reason=" << FailureReasonToString (reason);
    }
  ss << ", bundle=" << bundleId.ToString ();
  ss << ", delay=" << totalDelay.GetSeconds () << "s";
  ss << ", elapsed=" << elapsedTime.GetSeconds () << "s";
  ss << ", retransmissions=" << totalRetransmissions;
  ss << ", disruptions=" << disruptionCount;
  ss << ", stored=" << storageEvents;
  ss << ", paths=" << pathsAttempted << "/" << pathsAvailable;
  ss << ", hops=" << hopCount;
  ss << ", distance=" << FormatDistance (totalDistance);
  ss << ", path=";
  for (size_t i = 0; i < finalPath.size (); ++i)
    {
      ss << (i > 0 ? " -> " : "") << finalPath[i];
    }
  ss << ")";
  
  return ss.str ();
}

StatsRecorder::StatsRecorder ()
  : m_totalRecoveryTime (Seconds (0)),
    m_recoveries (0)
{
}

void 
StatsRecorder::RecordEvent (const TransmissionEvent& event)
{
  NS_LOG_FUNCTION (this << EventTypeToString (event.type));
  
  m_eventCounts[event.type]++;
  
  if (event.type == EventType::LINK_DISRUPTED)
    {
      LinkKey key (event.GetAttribute ("from"), event.GetAttribute ("to"));
      m_openDisruptions.emplace (key, event.timestamp);
    }
  else if (event.type == EventType::RECOVERED)
    {
      LinkKey key (event.GetAttribute ("from"), event.GetAttribute ("to"));
      auto it = m_openDisruptions.find (key);
      if (it != m_openDisruptions.end ())
        {
          m_totalRecoveryTime += event.timestamp - it->second;
          m_recoveries++;
          m_openDisruptions.erase (it);
        }
    }
}

StatsRecord 
StatsRecorder::Build (const SimulationState& state, const TopologyGraph& topology) const
{
  NS_LOG_FUNCTION (this);
  
  StatsRecord record;
  record.status = state.status;
  record.reason = state.reason;
  record.bundleId = state.bundle->GetId ();
  record.source = state.bundle->GetSource ();
  record.destination = state.bundle->GetDestination ();
  record.totalDelay = state.totalDelay;
  record.elapsedTime = state.clock - state.start;
  record.totalRetransmissions = state.totalRetransmissions;
  record.disruptionCount = state.disruptionCount;
  record.storageEvents = state.storageEvents;
  record.finalPath = state.traversed;
  record.hopCount = state.traversed.empty () ? 0 : static_cast<uint32_t> (state.traversed.size () - 1);
  record.totalDistance = topology.GetPathDistance (state.traversed);
  record.pathHistory = state.pathHistory;
  record.pathsAttempted = static_cast<uint32_t> (state.pathHistory.size ());
  record.pathsAvailable = state.pathsAvailable;
  record.bufferOccupancy = state.bufferSnapshot;
  record.maxStoredBundles = state.peakOccupancy;
  record.disruptedLinks = state.disruptionLog;
  record.recoveries = m_recoveries;
  record.averageRecoveryTime = m_recoveries > 0
    ? m_totalRecoveryTime.GetSeconds () / m_recoveries
    : 0.0;
  record.eventCount = GetEventCount ();
  
  return record;
}

uint32_t 
StatsRecorder::GetEventCount () const
{
  uint32_t total = 0;
  for (const auto& pair : m_eventCounts)
    {
      total += pair.second;
    }
  return total;
}

uint32_t 
StatsRecorder::GetEventCount (EventType type) const
{
  auto it = m_eventCounts.find (type);
  return it == m_eventCounts.end () ? 0 : it->second;
}

void 
StatsRecorder::Reset ()
{
  m_eventCounts.clear ();
  m_openDisruptions.clear ();
  m_totalRecoveryTime = Seconds (0);
  m_recoveries = 0;
}

} // namespace dtnrelay

} // namespace ns3
