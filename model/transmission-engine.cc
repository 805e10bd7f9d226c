#include "transmission-engine.h"
#include "ns3/log.h"
#include "ns3/nstime.h"
#include "ns3/simulator.h"
#include "ns3/trace-source-accessor.h"
#include "ns3/uinteger.h"

#include <algorithm>
#include <sstream>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("TransmissionEngine");

namespace dtnrelay {

namespace {

std::string 
FormatSeconds (Time t)
{
  std::stringstream ss;
  ss << t.GetSeconds ();
  return ss.str ();
}

} // namespace

// CancellationToken implementation

CancellationToken::CancellationToken ()
  : m_cancelled (false)
{
}

void 
CancellationToken::Cancel ()
{
  m_cancelled.store (true);
}

void 
CancellationToken::Reset ()
{
  m_cancelled.store (false);
}

bool 
CancellationToken::IsCancelled () const
{
  return m_cancelled.load ();
}

// TransmissionEngine implementation

NS_OBJECT_ENSURE_REGISTERED (TransmissionEngine);

TypeId 
TransmissionEngine::GetTypeId ()
{
  static TypeId tid = TypeId ("ns3::dtnrelay::TransmissionEngine")
    .SetParent<Object> ()
    .SetGroupName ("DtnRelay")
    .AddConstructor<TransmissionEngine> ()
    .AddAttribute ("MaxRetriesPerLink",
                   "Recovery attempts on one link before rerouting or failing",
                   UintegerValue (3),
                   MakeUintegerAccessor (&TransmissionEngine::m_maxRetriesPerLink),
                   MakeUintegerChecker<uint32_t> ())
    .AddAttribute ("MaxAlternatePaths",
                   "Number of ranked alternatives requested per routing query",
                   UintegerValue (3),
                   MakeUintegerAccessor (&TransmissionEngine::m_maxAlternatePaths),
                   MakeUintegerChecker<uint32_t> (1))
    .AddAttribute ("RetryInterval",
                   "Logical time consumed by one retransmission attempt",
                   TimeValue (Seconds (60)),
                   MakeTimeAccessor (&TransmissionEngine::m_retryInterval),
                   MakeTimeChecker (Seconds (0)))
    .AddAttribute ("TimeBudget",
                   "Logical time budget of one run; zero disables the budget",
                   TimeValue (Seconds (0)),
                   MakeTimeAccessor (&TransmissionEngine::m_timeBudget),
                   MakeTimeChecker (Seconds (0)))
    .AddTraceSource ("Transition",
                     "Trace source fired once per state machine transition",
                     MakeTraceSourceAccessor (&TransmissionEngine::m_transitionTrace),
                     "ns3::dtnrelay::TransmissionEngine::TransitionTracedCallback")
  ;
  return tid;
}

TransmissionEngine::TransmissionEngine ()
  : m_maxRetriesPerLink (3),
    m_maxAlternatePaths (3),
    m_retryInterval (Seconds (60)),
    m_timeBudget (Seconds (0)),
    m_runs (0),
    m_delivered (0)
{
  NS_LOG_FUNCTION (this);
}

TransmissionEngine::~TransmissionEngine ()
{
  NS_LOG_FUNCTION (this);
}

void 
TransmissionEngine::DoDispose ()
{
  NS_LOG_FUNCTION (this);
  m_topology = nullptr;
  m_routing = nullptr;
  m_disruption = nullptr;
  m_buffer = nullptr;
  m_cancel = nullptr;
  m_recorder = nullptr;
  Object::DoDispose ();
}

void 
TransmissionEngine::SetTopology (Ptr<TopologyGraph> topology)
{
  NS_LOG_FUNCTION (this << topology);
  m_topology = topology;
}

Ptr<TopologyGraph> 
TransmissionEngine::GetTopology () const
{
  return m_topology;
}

void 
TransmissionEngine::SetRoutingEngine (Ptr<RoutingEngine> routing)
{
  NS_LOG_FUNCTION (this << routing);
  m_routing = routing;
}

Ptr<RoutingEngine> 
TransmissionEngine::GetRoutingEngine () const
{
  return m_routing;
}

void 
TransmissionEngine::SetDisruptionModel (Ptr<DisruptionModel> model)
{
  NS_LOG_FUNCTION (this << model);
  m_disruption = model;
}

Ptr<DisruptionModel> 
TransmissionEngine::GetDisruptionModel () const
{
  return m_disruption;
}

void 
TransmissionEngine::SetBufferStore (Ptr<BufferStore> store)
{
  NS_LOG_FUNCTION (this << store);
  m_buffer = store;
}

Ptr<BufferStore> 
TransmissionEngine::GetBufferStore () const
{
  return m_buffer;
}

void 
TransmissionEngine::SetCancellationToken (Ptr<CancellationToken> token)
{
  NS_LOG_FUNCTION (this << token);
  m_cancel = token;
}

void 
TransmissionEngine::AddTransitionSink (Callback<void, const TransmissionEvent&> sink)
{
  NS_LOG_FUNCTION (this);
  m_transitionTrace.ConnectWithoutContext (sink);
}

uint32_t 
TransmissionEngine::GetMaxRetriesPerLink () const
{
  return m_maxRetriesPerLink;
}

uint32_t 
TransmissionEngine::GetMaxAlternatePaths () const
{
  return m_maxAlternatePaths;
}

StatsRecord 
TransmissionEngine::Simulate (const std::string& source,
                              const std::string& destination,
                              const std::vector<uint8_t>& payload)
{
  NS_LOG_FUNCTION (this << source << destination << payload.size ());
  return Simulate (Bundle::NewBundle (source, destination, payload));
}

StatsRecord 
TransmissionEngine::Simulate (Ptr<Bundle> bundle)
{
  NS_LOG_FUNCTION (this << bundle);
  
  if (!bundle || !m_topology || !m_routing || !m_disruption || !m_buffer)
    {
      NS_LOG_ERROR ("ConfigError: engine is missing a bundle or a component");
      StatsRecord rejected;
      rejected.reason = FailureReason::CONFIG_ERROR;
      if (bundle)
        {
          rejected.bundleId = bundle->GetId ();
          rejected.source = bundle->GetSource ();
          rejected.destination = bundle->GetDestination ();
        }
      return rejected;
    }
  
  if (!m_topology->HasNode (bundle->GetSource ()) || !m_topology->HasNode (bundle->GetDestination ()))
    {
      NS_LOG_ERROR ("ConfigError: unknown source " << bundle->GetSource ()
                    << " or destination " << bundle->GetDestination ());
      StatsRecord rejected;
      rejected.reason = FailureReason::CONFIG_ERROR;
      rejected.bundleId = bundle->GetId ();
      rejected.source = bundle->GetSource ();
      rejected.destination = bundle->GetDestination ();
      return rejected;
    }
  
  m_runs++;
  if (m_recorder)
    {
      m_recorder->Reset ();
    }
  else
    {
      m_recorder = Create<StatsRecorder> ();
    }
  for (const auto& node : m_topology->GetNodes ())
    {
      m_buffer->AddNode (node);
    }
  
  SimulationState state (bundle, *m_topology, Simulator::Now ());
  NS_LOG_INFO ("Starting transmission of " << bundle->ToString ());
  
  while (!state.IsTerminal ())
    {
      if (CheckInterrupt (state))
        {
          break;
        }
      
      switch (state.state)
        {
          case EngineState::SELECT_PATH:
            DoSelectPath (state);
            break;
          case EngineState::ADVANCE_HOP:
            DoAdvanceHop (state);
            break;
          case EngineState::LINK_CHECK:
            DoLinkCheck (state);
            break;
          case EngineState::DISRUPTED:
            DoDisrupted (state);
            break;
          case EngineState::RECOVERY_RETRY:
            DoRecoveryRetry (state);
            break;
          case EngineState::REROUTE:
            DoReroute (state);
            break;
          default:
            break;
        }
    }
  
  state.bufferSnapshot = m_buffer->Snapshot ();
  state.peakOccupancy = m_buffer->GetPeakOccupancy ();
  
  StatsRecord record = m_recorder->Build (state, *m_topology);
  if (record.IsDelivered ())
    {
      m_delivered++;
    }
  
  NS_LOG_INFO (record.ToString ());
  return record;
}

bool 
TransmissionEngine::CheckInterrupt (SimulationState& state)
{
  if (m_cancel && m_cancel->IsCancelled ())
    {
      NS_LOG_WARN ("Run cancelled in state " << EngineStateToString (state.state));
      Fail (state, FailureReason::CANCELLED);
      return true;
    }
  
  if (!m_timeBudget.IsZero () && state.clock - state.start > m_timeBudget)
    {
      NS_LOG_WARN ("Time budget of " << m_timeBudget.GetSeconds () << "s exceeded");
      Fail (state, FailureReason::TIMEOUT);
      return true;
    }
  
  if (state.bundle->IsExpired (state.clock))
    {
      NS_LOG_WARN ("Bundle " << state.bundle->GetId ().ToString () << " expired");
      Fail (state, FailureReason::TIMEOUT);
      return true;
    }
  
  return false;
}

void 
TransmissionEngine::DoSelectPath (SimulationState& state)
{
  NS_LOG_FUNCTION (this << state.currentNode);
  
  // Nothing is disrupted or traversed yet, so the enumeration is the ranking
  std::vector<Path> ranked;
  if (m_routing->EnumeratePaths (state.currentNode, state.bundle->GetDestination (), ranked) != ErrorCode::NONE)
    {
      Fail (state, FailureReason::NO_PATH);
      return;
    }
  state.pathsAvailable = static_cast<uint32_t> (ranked.size ());
  uint32_t candidates = std::min (state.pathsAvailable, m_maxAlternatePaths);
  
  SwitchPath (state, ranked.front (), PathStatus::SELECTED);
  state.state = EngineState::ADVANCE_HOP;
  
  std::stringstream score;
  score << m_routing->Score (state.activePath);
  Emit (state, EventType::PATH_SELECTED,
        {{"path", state.activePath.ToString ()},
         {"score", score.str ()},
         {"candidates", std::to_string (candidates)},
         {"available", std::to_string (state.pathsAvailable)}});
}

void 
TransmissionEngine::DoAdvanceHop (SimulationState& state)
{
  NS_LOG_FUNCTION (this << state.currentNode);
  
  if (state.currentNode == state.bundle->GetDestination ())
    {
      ReleaseFromBuffer (state);
      state.location = BundleLocation::DELIVERED;
      state.status = SimulationStatus::DELIVERED;
      state.reason = FailureReason::NONE;
      state.state = EngineState::DELIVERED;
      if (!state.pathHistory.empty ())
        {
          state.pathHistory.back ().status = PathStatus::DELIVERED;
        }
      
      Emit (state, EventType::DELIVERED,
            {{"node", state.currentNode},
             {"totalDelay", FormatSeconds (state.totalDelay)},
             {"hops", std::to_string (state.traversed.size () - 1)}});
      return;
    }
  
  std::string next = state.GetNextHop ();
  if (next.empty ())
    {
      NS_LOG_ERROR ("Active path " << state.activePath.ToString () << " ends before "
                    << state.bundle->GetDestination ());
      Fail (state, FailureReason::NO_PATH);
      return;
    }
  
  state.nextHop = next;
  state.state = EngineState::LINK_CHECK;
  Emit (state, EventType::HOP_STARTED,
        {{"from", state.currentNode},
         {"to", next},
         {"hop", std::to_string (state.traversed.size ())}});
}

void 
TransmissionEngine::DoLinkCheck (SimulationState& state)
{
  NS_LOG_FUNCTION (this << state.currentNode << state.nextHop);
  
  const std::string from = state.currentNode;
  const std::string to = state.nextHop;
  
  // The only disruption draw of this hop attempt
  if (m_disruption->CheckHop (from, to))
    {
      state.disruptedLinks.Add (from, to);
      state.disruptionCount++;
      LinkKey key (from, to);
      if (std::find (state.disruptionLog.begin (), state.disruptionLog.end (), key) == state.disruptionLog.end ())
        {
          state.disruptionLog.push_back (key);
        }
      
      const BundleID& id = state.bundle->GetId ();
      bool alreadyStored = m_buffer->Has (from, id);
      ErrorCode stored = m_buffer->Store (from, state.bundle);
      if (stored == ErrorCode::NONE)
        {
          if (!alreadyStored)
            {
              state.storageEvents++;
            }
          state.location = BundleLocation::BUFFERED;
        }
      else
        {
          NS_LOG_WARN ("Bundle held in custody at " << from << ": "
                       << ErrorCodeToString (stored));
          state.location = BundleLocation::AT_NODE;
        }
      
      state.state = EngineState::DISRUPTED;
      Emit (state, EventType::LINK_DISRUPTED,
            {{"from", from},
             {"to", to},
             {"stored", stored == ErrorCode::NONE ? "true" : "false"},
             {"buffer", std::to_string (m_buffer->Count (from))}});
      return;
    }
  
  std::optional<LinkInfo> link = m_topology->GetLink (from, to);
  if (!link)
    {
      Fail (state, FailureReason::NO_PATH);
      return;
    }
  
  ReleaseFromBuffer (state);
  state.totalDelay += link->delay;
  state.clock += link->delay;
  state.currentNode = to;
  state.nextHop.clear ();
  state.hopIndex++;
  state.traversed.push_back (to);
  state.location = BundleLocation::AT_NODE;
  state.state = EngineState::ADVANCE_HOP;
  
  Emit (state, EventType::HOP_COMMITTED,
        {{"from", from},
         {"to", to},
         {"delay", FormatSeconds (link->delay)},
         {"totalDelay", FormatSeconds (state.totalDelay)}});
}

void 
TransmissionEngine::DoDisrupted (SimulationState& state)
{
  NS_LOG_FUNCTION (this << state.currentNode << state.nextHop);
  
  std::vector<Path> alternatives;
  if (FindAlternatives (state, false, alternatives) == ErrorCode::NONE && !alternatives.empty ())
    {
      // Rerouting does not consume a retry
      SwitchPath (state, alternatives.front (), PathStatus::REROUTED);
      std::string disrupted = state.nextHop;
      state.nextHop.clear ();
      state.state = EngineState::ADVANCE_HOP;
      Emit (state, EventType::REROUTED,
            {{"from", state.currentNode},
             {"avoiding", disrupted},
             {"path", state.activePath.ToString ()},
             {"attempt", std::to_string (state.pathHistory.size ())},
             {"cause", "disruption"}});
      return;
    }
  
  state.state = EngineState::RECOVERY_RETRY;
  Emit (state, EventType::REROUTE_UNAVAILABLE,
        {{"from", state.currentNode},
         {"to", state.nextHop}});
}

void 
TransmissionEngine::DoRecoveryRetry (SimulationState& state)
{
  NS_LOG_FUNCTION (this << state.currentNode << state.nextHop);
  
  const std::string from = state.currentNode;
  const std::string to = state.nextHop;
  uint32_t retries = state.GetRetries (from, to);
  
  if (retries >= m_maxRetriesPerLink)
    {
      if (!state.pathHistory.empty ())
        {
          state.pathHistory.back ().status = PathStatus::FAILED;
        }
      state.exhaustedLinks.insert (LinkKey (from, to));
      state.state = EngineState::REROUTE;
      Emit (state, EventType::RETRIES_EXHAUSTED,
            {{"from", from},
             {"to", to},
             {"retries", std::to_string (retries)}});
      return;
    }
  
  retries = ++state.retryCounters[LinkKey (from, to)];
  state.totalRetransmissions++;
  state.clock += m_retryInterval;
  
  if (m_disruption->CheckRecovery (from, to))
    {
      state.disruptedLinks.Remove (from, to);
      ReleaseFromBuffer (state);
      state.nextHop.clear ();
      state.state = EngineState::ADVANCE_HOP;
      Emit (state, EventType::RECOVERED,
            {{"from", from},
             {"to", to},
             {"attempt", std::to_string (retries)}});
      return;
    }
  
  Emit (state, EventType::RETRY_FAILED,
        {{"from", from},
         {"to", to},
         {"attempt", std::to_string (retries)},
         {"max", std::to_string (m_maxRetriesPerLink)}});
}

void 
TransmissionEngine::DoReroute (SimulationState& state)
{
  NS_LOG_FUNCTION (this << state.currentNode);
  
  std::vector<Path> alternatives;
  if (FindAlternatives (state, true, alternatives) == ErrorCode::NONE && !alternatives.empty ())
    {
      SwitchPath (state, alternatives.front (), PathStatus::REROUTED);
      state.nextHop.clear ();
      state.state = EngineState::ADVANCE_HOP;
      Emit (state, EventType::REROUTED,
            {{"from", state.currentNode},
             {"path", state.activePath.ToString ()},
             {"attempt", std::to_string (state.pathHistory.size ())},
             {"cause", "exhausted"}});
      return;
    }
  
  NS_LOG_INFO ("No path with retry budget left at " << state.currentNode);
  Fail (state, FailureReason::EXHAUSTED);
}

ErrorCode 
TransmissionEngine::FindAlternatives (const SimulationState& state,
                                      bool retryDisrupted,
                                      std::vector<Path>& alternatives) const
{
  auto reject = [&state] (const Path& path)
    {
      for (size_t i = 0; i < path.nodes.size (); ++i)
        {
          if (state.WasTraversed (path.nodes[i]))
            {
              return true;
            }
          if (i + 1 < path.nodes.size ()
              && state.exhaustedLinks.count (LinkKey (path.nodes[i], path.nodes[i + 1])) > 0)
            {
              return true;
            }
        }
      return false;
    };
  
  // A link routed around earlier keeps its retry budget
  DisruptedLinkSet none (*m_topology);
  return m_routing->SelectAlternatives (state.currentNode,
                                        state.bundle->GetDestination (),
                                        retryDisrupted ? none : state.disruptedLinks,
                                        m_maxAlternatePaths,
                                        alternatives,
                                        reject);
}

void 
TransmissionEngine::SwitchPath (SimulationState& state, const Path& path, PathStatus status)
{
  state.activePath = path;
  state.hopIndex = 0;
  
  PathAttempt attempt;
  attempt.attemptIndex = static_cast<uint32_t> (state.pathHistory.size () + 1);
  attempt.path = path;
  attempt.status = status;
  state.pathHistory.push_back (attempt);
  
  NS_LOG_INFO ("Attempt " << attempt.attemptIndex << " (" << PathStatusToString (status)
               << "): " << path.ToString ());
}

void 
TransmissionEngine::ReleaseFromBuffer (SimulationState& state)
{
  if (m_buffer->Remove (state.currentNode, state.bundle->GetId ()))
    {
      NS_LOG_LOGIC ("Released bundle from buffer of " << state.currentNode);
    }
  state.location = BundleLocation::AT_NODE;
}

void 
TransmissionEngine::Fail (SimulationState& state, FailureReason reason)
{
  state.state = EngineState::FAILED;
  state.status = SimulationStatus::FAILED;
  state.reason = reason;
  
  // A failed bundle stays in the buffer it was stored in, if any
  std::string buffered = m_buffer->Has (state.currentNode, state.bundle->GetId ()) ? "true" : "false";
  state.location = BundleLocation::FAILED;
  
  Emit (state, EventType::FAILED,
        {{"node", state.currentNode},
         {"reason", FailureReasonToString (reason)},
         {"buffered", buffered}});
}

void 
TransmissionEngine::Emit (const SimulationState& state,
                          EventType type,
                          std::map<std::string, std::string> attributes)
{
  TransmissionEvent event;
  event.type = type;
  event.timestamp = state.clock;
  event.attributes = std::move (attributes);
  event.attributes["bundle"] = state.bundle->GetId ().ToString ();
  
  NS_LOG_INFO (event.ToString ());
  
  if (m_recorder)
    {
      m_recorder->RecordEvent (event);
    }
  m_transitionTrace (event);
}

std::string 
TransmissionEngine::GetStats () const
{
  std::stringstream ss;
  
  ss << "TransmissionEngine(";
  ss << "runs=" << m_runs;
  ss << ", delivered=" << m_delivered;
  ss << ", maxRetriesPerLink=" << m_maxRetriesPerLink;
  ss << ", maxAlternatePaths=" << m_maxAlternatePaths;
  ss << ")";
  
  return ss.str ();
}

} // namespace dtnrelay

} // namespace ns3
