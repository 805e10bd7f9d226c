#ifndef DTNRELAY_SIMULATION_STATE_H
#define DTNRELAY_SIMULATION_STATE_H

#include "ns3/nstime.h"
#include "ns3/ptr.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "bundle.h"
#include "disrupted-link-set.h"
#include "relay-codes.h"
#include "routing-engine.h"
#include "topology-graph.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \brief States of the transmission state machine
 */
enum class EngineState : uint8_t {
  SELECT_PATH = 0,
  ADVANCE_HOP = 1,
  LINK_CHECK = 2,
  DISRUPTED = 3,
  RECOVERY_RETRY = 4,
  REROUTE = 5,
  DELIVERED = 6,
  FAILED = 7
};

std::string EngineStateToString (EngineState state);

/**
 * \brief Where the bundle is while the run is in progress
 */
enum class BundleLocation : uint8_t {
  AT_NODE = 0,                     //!< Held at the current node, not buffered
  BUFFERED = 1,                    //!< In the current node's buffer
  DELIVERED = 2,                   //!< Terminal, at the destination
  FAILED = 3                       //!< Terminal, marked failed
};

/**
 * \ingroup dtnrelay
 * \brief One entry of the path attempt history
 */
struct PathAttempt
{
  uint32_t attemptIndex {0};       //!< 1-based attempt number
  Path path;                       //!< Path from the node where it was chosen
  PathStatus status {PathStatus::SELECTED};  //!< Outcome of the attempt
};

/**
 * \ingroup dtnrelay
 * \brief Mutable state of one transmission run
 *
 * Owned by a single TransmissionEngine::Simulate call and never shared
 * across runs.
 */
struct SimulationState
{
  /**
   * \brief Constructor
   * \param b Bundle to carry
   * \param topology Topology the disruption overlay refers to
   * \param startTime Logical start time
   */
  SimulationState (Ptr<Bundle> b, const TopologyGraph& topology, Time startTime);
  
  /**
   * \brief Get the node after the current one on the active path
   * \return Next hop, empty if the current node ends the path
   */
  std::string GetNextHop () const;
  
  /**
   * \brief Get the retry counter of a link
   * \param a One endpoint
   * \param b Other endpoint
   * \return Retries consumed on the link
   */
  uint32_t GetRetries (const std::string& a, const std::string& b) const;
  
  /**
   * \brief Check whether a node was already traversed before the current one
   * \param node Node identifier
   * \return true if the bundle has left that node earlier in the run
   */
  bool WasTraversed (const std::string& node) const;
  
  bool IsTerminal () const;
  
  Ptr<Bundle> bundle;                              //!< Bundle being carried
  EngineState state;                               //!< Current state
  BundleLocation location;                         //!< Where the bundle is
  std::string currentNode;                         //!< Node holding the bundle
  std::string nextHop;                             //!< Hop under test in LinkCheck
  Path activePath;                                 //!< Path being followed
  uint32_t hopIndex;                               //!< Position of currentNode in activePath
  std::vector<std::string> traversed;              //!< Nodes visited so far, in order
  DisruptedLinkSet disruptedLinks;                 //!< Current disruption overlay
  std::map<LinkKey, uint32_t> retryCounters;       //!< Retries consumed per link
  std::set<LinkKey> exhaustedLinks;                //!< Links whose retry budget ran out
  std::vector<PathAttempt> pathHistory;            //!< Every path switch
  std::vector<LinkKey> disruptionLog;              //!< Links disrupted during the run, first occurrence order
  
  Time start;                                      //!< Logical start time
  Time clock;                                      //!< Current logical time
  Time totalDelay;                                 //!< Sum of committed hop delays
  uint32_t totalRetransmissions;                   //!< Recovery attempts
  uint32_t disruptionCount;                        //!< Disrupted hop attempts
  uint32_t storageEvents;                          //!< Bundles placed in a buffer
  uint32_t pathsAvailable;                         //!< Paths enumerated at SelectPath
  
  SimulationStatus status;                         //!< Terminal status
  FailureReason reason;                            //!< Terminal reason
  std::map<std::string, uint32_t> bufferSnapshot;  //!< Occupancy at termination
  uint32_t peakOccupancy;                          //!< Highest occupancy at termination
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_SIMULATION_STATE_H */
