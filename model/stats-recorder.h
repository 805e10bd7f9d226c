#ifndef DTNRELAY_STATS_RECORDER_H
#define DTNRELAY_STATS_RECORDER_H

#include "ns3/nstime.h"
#include "ns3/ptr.h"
#include "ns3/simple-ref-count.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "bundle-id.h"
#include "relay-codes.h"
#include "simulation-state.h"
#include "topology-graph.h"
#include "transmission-event.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Immutable result of one simulation run
 */
struct StatsRecord
{
  SimulationStatus status {SimulationStatus::FAILED};  //!< Delivered or Failed
  FailureReason reason {FailureReason::NONE};      //!< Reason code, NONE when delivered
  BundleID bundleId;                               //!< Bundle carried
  std::string source;                              //!< Source node
  std::string destination;                         //!< Destination node
  Time totalDelay;                                 //!< Sum of committed hop delays
  Time elapsedTime;                                //!< Logical time including retries
  uint32_t totalRetransmissions {0};               //!< Recovery attempts
  uint32_t disruptionCount {0};                    //!< Disrupted hop attempts
  uint32_t storageEvents {0};                      //!< Bundles placed in a buffer
  std::vector<std::string> finalPath;              //!< Nodes traversed, source first
  uint32_t hopCount {0};                           //!< Committed hops
  double totalDistance {0.0};                      //!< Kilometres along finalPath
  std::vector<PathAttempt> pathHistory;            //!< Path switches
  uint32_t pathsAttempted {0};                     //!< Entries in pathHistory
  uint32_t pathsAvailable {0};                     //!< Paths enumerated at SelectPath
  std::map<std::string, uint32_t> bufferOccupancy; //!< Per-node occupancy at termination
  uint32_t maxStoredBundles {0};                   //!< Highest occupancy at any node
  std::vector<LinkKey> disruptedLinks;             //!< Links disrupted during the run
  uint32_t recoveries {0};                         //!< Successful recoveries
  double averageRecoveryTime {0.0};                //!< Seconds from disruption to recovery
  uint32_t eventCount {0};                         //!< Transitions observed
  
  bool IsDelivered () const { return status == SimulationStatus::DELIVERED; }
  
  /**
   * \brief Get string representation
   * \return One-line summary
   */
  std::string ToString () const;
};

/**
 * \ingroup dtnrelay
 * \brief Aggregates engine events into a StatsRecord
 *
 * Pure aggregation, no decisions: counts transitions as they are
 * observed and folds the terminal simulation state into the record.
 */
class StatsRecorder : public SimpleRefCount<StatsRecorder>
{
public:
  StatsRecorder ();
  
  /**
   * \brief Observe one transition
   * \param event Engine event
   */
  void RecordEvent (const TransmissionEvent& event);
  
  /**
   * \brief Build the result record
   * \param state Terminal simulation state
   * \param topology Topology used to measure the final path
   * \return Result record
   */
  StatsRecord Build (const SimulationState& state, const TopologyGraph& topology) const;
  
  uint32_t GetEventCount () const;
  uint32_t GetEventCount (EventType type) const;
  
  /**
   * \brief Forget everything observed so far
   */
  void Reset ();

private:
  std::map<EventType, uint32_t> m_eventCounts;     //!< Transitions per type
  std::map<LinkKey, Time> m_openDisruptions;       //!< Disruption start per link awaiting recovery
  Time m_totalRecoveryTime;                        //!< Sum of disruption-to-recovery intervals
  uint32_t m_recoveries;                           //!< Number of recoveries
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_STATS_RECORDER_H */
