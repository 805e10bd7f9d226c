#include "routing-engine.h"
#include "ns3/log.h"
#include "ns3/uinteger.h"

#include <algorithm>
#include <map>
#include <queue>
#include <sstream>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("RoutingEngine");

namespace dtnrelay {

// Path implementation

uint32_t 
Path::GetHopCount () const
{
  return nodes.empty () ? 0 : static_cast<uint32_t> (nodes.size () - 1);
}

bool 
Path::Contains (const std::string& node) const
{
  return std::find (nodes.begin (), nodes.end (), node) != nodes.end ();
}

std::string 
Path::ToString () const
{
  std::stringstream ss;
  for (size_t i = 0; i < nodes.size (); ++i)
    {
      if (i > 0)
        {
          ss << " -> ";
        }
      ss << nodes[i];
    }
  return ss.str ();
}

// RoutingEngine implementation

NS_OBJECT_ENSURE_REGISTERED (RoutingEngine);

TypeId 
RoutingEngine::GetTypeId ()
{
  static TypeId tid = TypeId ("ns3::dtnrelay::RoutingEngine")
    .SetParent<Object> ()
    .SetGroupName ("DtnRelay")
    .AddConstructor<RoutingEngine> ()
    .AddAttribute ("MaxDepth",
                   "Maximum number of hops of an enumerated path",
                   UintegerValue (8),
                   MakeUintegerAccessor (&RoutingEngine::m_maxDepth),
                   MakeUintegerChecker<uint32_t> (1))
    .AddAttribute ("MaxPaths",
                   "Maximum number of paths collected by one enumeration",
                   UintegerValue (1000),
                   MakeUintegerAccessor (&RoutingEngine::m_maxPaths),
                   MakeUintegerChecker<uint32_t> (1))
  ;
  return tid;
}

RoutingEngine::RoutingEngine ()
  : m_maxDepth (8),
    m_maxPaths (1000),
    m_enumerations (0),
    m_truncated (0)
{
  NS_LOG_FUNCTION (this);
}

RoutingEngine::~RoutingEngine ()
{
  NS_LOG_FUNCTION (this);
}

void 
RoutingEngine::DoDispose ()
{
  NS_LOG_FUNCTION (this);
  m_topology = nullptr;
  Object::DoDispose ();
}

void 
RoutingEngine::SetTopology (Ptr<TopologyGraph> topology)
{
  NS_LOG_FUNCTION (this << topology);
  m_topology = topology;
}

Ptr<TopologyGraph> 
RoutingEngine::GetTopology () const
{
  return m_topology;
}

ErrorCode 
RoutingEngine::EnumeratePaths (const std::string& source,
                               const std::string& destination,
                               uint32_t maxDepth,
                               std::vector<Path>& paths) const
{
  NS_LOG_FUNCTION (this << source << destination << maxDepth);
  
  paths.clear ();
  m_enumerations++;
  
  if (!m_topology)
    {
      NS_LOG_ERROR ("Topology not set");
      return ErrorCode::NO_PATH;
    }
  
  if (!m_topology->HasNode (source) || !m_topology->HasNode (destination))
    {
      NS_LOG_ERROR ("NoPathError: unknown endpoint " << source << " or " << destination);
      return ErrorCode::NO_PATH;
    }
  
  uint32_t visited = Search (source, destination, maxDepth, nullptr,
                             [&paths] (const Path& path)
                             {
                               paths.push_back (path);
                               return true;
                             });
  
  if (visited >= m_maxPaths)
    {
      NS_LOG_WARN ("Enumeration " << source << " -> " << destination
                   << " stopped at the " << m_maxPaths << " best paths");
      m_truncated++;
    }
  
  if (paths.empty ())
    {
      NS_LOG_INFO ("NoPathError: no path from " << source << " to " << destination
                   << " within " << maxDepth << " hops");
      return ErrorCode::NO_PATH;
    }
  
  NS_LOG_INFO ("Found " << paths.size () << " possible paths from " << source
               << " to " << destination);
  return ErrorCode::NONE;
}

ErrorCode 
RoutingEngine::EnumeratePaths (const std::string& source,
                               const std::string& destination,
                               std::vector<Path>& paths) const
{
  return EnumeratePaths (source, destination, m_maxDepth, paths);
}

bool 
RoutingEngine::HasRoute (const std::string& source,
                         const std::string& destination,
                         uint32_t maxDepth) const
{
  std::map<std::string, uint32_t> hops;
  std::queue<std::string> pending;
  hops[source] = 0;
  pending.push (source);
  
  while (!pending.empty ())
    {
      std::string node = pending.front ();
      pending.pop ();
      if (node == destination)
        {
          return true;
        }
      uint32_t depth = hops[node];
      if (depth >= maxDepth)
        {
          continue;
        }
      for (const auto& neighbor : m_topology->GetNeighbors (node))
        {
          if (hops.count (neighbor) == 0)
            {
              hops[neighbor] = depth + 1;
              pending.push (neighbor);
            }
        }
    }
  
  return false;
}

uint32_t 
RoutingEngine::Search (const std::string& source,
                       const std::string& destination,
                       uint32_t maxDepth,
                       const DisruptedLinkSet* blockedFirstHop,
                       const std::function<bool (const Path&)>& visit) const
{
  // Worst path on top
  auto ranksLater = [this] (const Path& a, const Path& b)
    {
      return Precedes (b, a);
    };
  std::priority_queue<Path, std::vector<Path>, decltype (ranksLater)> frontier (ranksLater);
  
  Path origin;
  origin.nodes.push_back (source);
  origin.cumulativeDelay = Seconds (0);
  frontier.push (origin);
  
  uint32_t visited = 0;
  while (!frontier.empty () && visited < m_maxPaths)
    {
      Path path = frontier.top ();
      frontier.pop ();
      
      const std::string last = path.nodes.back ();
      if (last == destination)
        {
          visited++;
          if (!visit (path))
            {
              break;
            }
          continue;
        }
      
      if (path.GetHopCount () >= maxDepth)
        {
          continue;
        }
      
      for (const auto& neighbor : m_topology->GetNeighbors (last))
        {
          if (path.Contains (neighbor))
            {
              continue;
            }
          if (blockedFirstHop && path.nodes.size () == 1 && blockedFirstHop->Contains (last, neighbor))
            {
              NS_LOG_LOGIC ("Skipping first hop " << last << " -> " << neighbor << ": disrupted");
              continue;
            }
          frontier.push (Extend (path, neighbor));
        }
    }
  
  return visited;
}

Path 
RoutingEngine::Extend (const Path& path, const std::string& next) const
{
  Path extended = path;
  extended.nodes.push_back (next);
  if (path.nodes.empty ())
    {
      return extended;
    }
  
  std::optional<LinkInfo> link = m_topology->GetLink (path.nodes.back (), next);
  if (!link)
    {
      return extended;
    }
  
  extended.cumulativeDelay += link->delay;
  if (link->distance.distanceClass == DistanceClass::DEEP_SPACE)
    {
      extended.reliability *= DEEP_SPACE_LINK_RELIABILITY;
    }
  else
    {
      extended.reliability *= NEAR_LINK_RELIABILITY;
    }
  return extended;
}

Path 
RoutingEngine::MakePath (const std::vector<std::string>& nodes) const
{
  Path path;
  path.cumulativeDelay = Seconds (0);
  for (const auto& node : nodes)
    {
      path = Extend (path, node);
    }
  return path;
}

double 
RoutingEngine::Score (const Path& path) const
{
  return path.cumulativeDelay.GetSeconds () * (1.0 / path.reliability);
}

bool 
RoutingEngine::Precedes (const Path& a, const Path& b) const
{
  double scoreA = Score (a);
  double scoreB = Score (b);
  if (scoreA != scoreB)
    {
      return scoreA < scoreB;
    }
  if (a.nodes.size () != b.nodes.size ())
    {
      return a.nodes.size () < b.nodes.size ();
    }
  return a.nodes < b.nodes;
}

ErrorCode 
RoutingEngine::SelectAlternatives (const std::string& source,
                                   const std::string& destination,
                                   const DisruptedLinkSet& disruptedLinks,
                                   uint32_t k,
                                   std::vector<Path>& alternatives,
                                   std::function<bool (const Path&)> reject) const
{
  NS_LOG_FUNCTION (this << source << destination << disruptedLinks.Size () << k);
  
  alternatives.clear ();
  m_enumerations++;
  
  if (!m_topology)
    {
      NS_LOG_ERROR ("Topology not set");
      return ErrorCode::NO_PATH;
    }
  
  if (!m_topology->HasNode (source) || !m_topology->HasNode (destination)
      || !HasRoute (source, destination, m_maxDepth))
    {
      NS_LOG_INFO ("NoPathError: no path from " << source << " to " << destination
                   << " within " << m_maxDepth << " hops");
      return ErrorCode::NO_PATH;
    }
  
  if (k == 0)
    {
      return ErrorCode::NONE;
    }
  
  uint32_t refused = 0;
  uint32_t visited = Search (source, destination, m_maxDepth, &disruptedLinks,
                             [&] (const Path& path)
                             {
                               if (reject && reject (path))
                                 {
                                   NS_LOG_LOGIC ("Discarding " << path.ToString () << ": rejected by caller");
                                   refused++;
                                   return true;
                                 }
                               alternatives.push_back (path);
                               return alternatives.size () < k;
                             });
  
  if (visited >= m_maxPaths && alternatives.size () < k)
    {
      NS_LOG_WARN ("Alternative search from " << source << " stopped after "
                   << m_maxPaths << " paths");
      m_truncated++;
    }
  
  for (const auto& path : alternatives)
    {
      NS_LOG_DEBUG ("Path: " << path.ToString () << " delay=" << path.cumulativeDelay.GetSeconds ()
                    << "s reliability=" << path.reliability << " score=" << Score (path));
    }
  
  if (alternatives.empty ())
    {
      NS_LOG_INFO ("All candidates from " << source << " were filtered out ("
                   << refused << " refused)");
    }
  
  return ErrorCode::NONE;
}

std::string 
RoutingEngine::GetStats () const
{
  std::stringstream ss;
  
  ss << "RoutingEngine(";
  ss << "maxDepth=" << m_maxDepth;
  ss << ", enumerations=" << m_enumerations;
  ss << ", truncated=" << m_truncated;
  ss << ")";
  
  return ss.str ();
}

} // namespace dtnrelay

} // namespace ns3
