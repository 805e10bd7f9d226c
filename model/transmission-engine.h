#ifndef DTNRELAY_TRANSMISSION_ENGINE_H
#define DTNRELAY_TRANSMISSION_ENGINE_H

#include "ns3/callback.h"
#include "ns3/nstime.h"
#include "ns3/object.h"
#include "ns3/ptr.h"
#include "ns3/simple-ref-count.h"
#include "ns3/traced-callback.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "buffer-store.h"
#include "bundle.h"
#include "disruption-model.h"
#include "routing-engine.h"
#include "simulation-state.h"
#include "stats-recorder.h"
#include "topology-graph.h"
#include "transmission-event.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Cancellation signal shared between a caller and a running engine
 */
class CancellationToken : public SimpleRefCount<CancellationToken>
{
public:
  CancellationToken ();
  
  void Cancel ();
  void Reset ();
  bool IsCancelled () const;

private:
  std::atomic<bool> m_cancelled;   //!< Raised flag
};

/**
 * \ingroup dtnrelay
 * \brief Store-and-forward state machine driving one bundle to its destination
 *
 * The engine asks the routing engine for ranked paths, advances hop by
 * hop, consults the disruption model once per hop attempt, buffers the
 * bundle on disruption, reroutes around disrupted links and retries the
 * link when no alternative exists. Every transition emits exactly one
 * TransmissionEvent on the "Transition" trace source.
 *
 * Logical time only accumulates; the engine never sleeps or blocks.
 */
class TransmissionEngine : public Object
{
public:
  /**
   * \brief Get the type ID
   * \return Type ID
   */
  static TypeId GetTypeId ();
  
  /**
   * \brief Default constructor
   */
  TransmissionEngine ();
  
  /**
   * \brief Destructor
   */
  virtual ~TransmissionEngine ();
  
  /**
   * TracedCallback signature for engine transitions.
   *
   * \param [in] event The transition
   */
  typedef void (*TransitionTracedCallback) (const TransmissionEvent& event);
  
  void SetTopology (Ptr<TopologyGraph> topology);
  Ptr<TopologyGraph> GetTopology () const;
  void SetRoutingEngine (Ptr<RoutingEngine> routing);
  Ptr<RoutingEngine> GetRoutingEngine () const;
  void SetDisruptionModel (Ptr<DisruptionModel> model);
  Ptr<DisruptionModel> GetDisruptionModel () const;
  void SetBufferStore (Ptr<BufferStore> store);
  Ptr<BufferStore> GetBufferStore () const;
  
  /**
   * \brief Set the cancellation signal checked at every state boundary
   * \param token Cancellation token
   */
  void SetCancellationToken (Ptr<CancellationToken> token);
  
  /**
   * \brief Register an observer of every transition
   * \param sink Callback invoked after each transition
   */
  void AddTransitionSink (Callback<void, const TransmissionEvent&> sink);
  
  /**
   * \brief Drive one bundle from its source to its destination
   * \param bundle Bundle to carry
   * \return Result record of the run
   */
  StatsRecord Simulate (Ptr<Bundle> bundle);
  
  /**
   * \brief Create a bundle and drive it to its destination
   * \param source Source node
   * \param destination Destination node
   * \param payload Payload data
   * \return Result record of the run
   */
  StatsRecord Simulate (const std::string& source,
                        const std::string& destination,
                        const std::vector<uint8_t>& payload);
  
  uint32_t GetMaxRetriesPerLink () const;
  uint32_t GetMaxAlternatePaths () const;
  
  /**
   * \brief Get statistics
   * \return Statistics string
   */
  std::string GetStats () const;

protected:
  void DoDispose () override;

private:
  /// Handlers for the non-terminal states; each performs exactly one transition
  void DoSelectPath (SimulationState& state);
  void DoAdvanceHop (SimulationState& state);
  void DoLinkCheck (SimulationState& state);
  void DoDisrupted (SimulationState& state);
  void DoRecoveryRetry (SimulationState& state);
  void DoReroute (SimulationState& state);
  
  /**
   * \brief Terminate the run if cancelled or out of time
   * \param state Run state
   * \return true if the run was terminated
   */
  bool CheckInterrupt (SimulationState& state);
  
  /**
   * \brief Look up alternatives from the current node
   *
   * Paths through traversed nodes or over a link whose retries were
   * exhausted are never returned.
   *
   * \param state Run state
   * \param retryDisrupted Accept disrupted first hops that still have retry budget
   * \param alternatives Output ranked alternatives
   * \return Routing status
   */
  ErrorCode FindAlternatives (const SimulationState& state,
                              bool retryDisrupted,
                              std::vector<Path>& alternatives) const;
  
  /**
   * \brief Make a path active and record it in the history
   * \param state Run state
   * \param path New path starting at the current node
   * \param status History status of the new entry
   */
  void SwitchPath (SimulationState& state, const Path& path, PathStatus status);
  
  /**
   * \brief Remove the bundle from the current node's buffer if present
   * \param state Run state
   */
  void ReleaseFromBuffer (SimulationState& state);
  
  /**
   * \brief Enter a terminal failure
   * \param state Run state
   * \param reason Failure reason
   */
  void Fail (SimulationState& state, FailureReason reason);
  
  /**
   * \brief Emit one transition event
   * \param state Run state supplying the timestamp
   * \param type Event type
   * \param attributes Event details
   */
  void Emit (const SimulationState& state,
             EventType type,
             std::map<std::string, std::string> attributes);
  
  Ptr<TopologyGraph> m_topology;                   //!< Shared immutable topology
  Ptr<RoutingEngine> m_routing;                    //!< Path enumeration and ranking
  Ptr<DisruptionModel> m_disruption;               //!< Per-hop disruption draws
  Ptr<BufferStore> m_buffer;                       //!< Store-and-forward buffers
  Ptr<CancellationToken> m_cancel;                 //!< Optional cancellation signal
  Ptr<StatsRecorder> m_recorder;                   //!< Recorder of the current run
  
  uint32_t m_maxRetriesPerLink;                    //!< Retries per link before reroute or failure
  uint32_t m_maxAlternatePaths;                    //!< Alternatives requested per routing query
  Time m_retryInterval;                            //!< Logical time consumed by one retry
  Time m_timeBudget;                               //!< Logical time budget, zero for none
  
  uint64_t m_runs;                                 //!< Number of runs
  uint64_t m_delivered;                            //!< Number of delivered bundles
  
  TracedCallback<const TransmissionEvent&> m_transitionTrace;  //!< Trace for transitions
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_TRANSMISSION_ENGINE_H */
