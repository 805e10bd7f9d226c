#include "topology-graph.h"
#include "ns3/log.h"

#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("TopologyGraph");

namespace dtnrelay {

std::optional<LinkDistance> 
LinkDistance::Parse (const std::string& text)
{
  // "<value> km" is a near link, "<value> M km" a deep-space link
  static const std::regex distanceRegex ("^\\s*([0-9]+(\\.[0-9]+)?)\\s*(M\\s*)?km\\s*$");
  
  std::smatch match;
  if (!std::regex_match (text, match, distanceRegex))
    {
      return std::nullopt;
    }
  
  LinkDistance distance;
  distance.kilometres = std::stod (match[1].str ());
  if (match[3].matched)
    {
      distance.kilometres *= 1e6;
      distance.distanceClass = DistanceClass::DEEP_SPACE;
    }
  else
    {
      distance.distanceClass = DistanceClass::NEAR;
    }
  return distance;
}

std::string 
FormatDistance (double kilometres)
{
  std::stringstream ss;
  ss << std::fixed << std::setprecision (1);
  if (kilometres >= 1e6)
    {
      ss << kilometres / 1e6 << "M km";
    }
  else if (kilometres >= 1e3)
    {
      ss << kilometres / 1e3 << "k km";
    }
  else
    {
      ss << kilometres << " km";
    }
  return ss.str ();
}

LinkKey::LinkKey (const std::string& a, const std::string& b)
  : first (std::min (a, b)),
    second (std::max (a, b))
{
}

bool 
LinkKey::operator== (const LinkKey& other) const
{
  return first == other.first && second == other.second;
}

bool 
LinkKey::operator< (const LinkKey& other) const
{
  if (first != other.first)
    {
      return first < other.first;
    }
  return second < other.second;
}

std::string 
LinkKey::ToString () const
{
  return first + "<->" + second;
}

TopologyGraph::TopologyGraph ()
{
}

Ptr<TopologyGraph> 
TopologyGraph::Build (const TopologyDescription& description)
{
  NS_LOG_FUNCTION (description.nodes.size () << description.links.size ());
  
  Ptr<TopologyGraph> graph = Create<TopologyGraph> ();
  
  for (const auto& node : description.nodes)
    {
      if (node.id.empty ())
        {
          NS_LOG_ERROR ("ConfigError: node with empty identifier");
          return nullptr;
        }
      if (graph->m_adjacency.count (node.id) > 0)
        {
          NS_LOG_ERROR ("ConfigError: duplicate node " << node.id);
          return nullptr;
        }
      graph->m_nodes.push_back (node.id);
      graph->m_adjacency[node.id];
    }
  
  for (const auto& link : description.links)
    {
      if (!graph->HasNode (link.source) || !graph->HasNode (link.target))
        {
          NS_LOG_ERROR ("ConfigError: link " << link.source << " - " << link.target
                        << " references an unknown node");
          return nullptr;
        }
      if (link.source == link.target)
        {
          NS_LOG_ERROR ("ConfigError: self loop at " << link.source);
          return nullptr;
        }
      if (!(link.delay >= 0.0))
        {
          NS_LOG_ERROR ("ConfigError: link " << link.source << " - " << link.target
                        << " has invalid delay " << link.delay);
          return nullptr;
        }
      
      std::optional<LinkDistance> distance = LinkDistance::Parse (link.distance);
      if (!distance)
        {
          NS_LOG_ERROR ("ConfigError: link " << link.source << " - " << link.target
                        << " has malformed distance '" << link.distance << "'");
          return nullptr;
        }
      
      LinkKey key (link.source, link.target);
      if (graph->m_links.count (key) > 0)
        {
          NS_LOG_ERROR ("ConfigError: duplicate link " << key.ToString ());
          return nullptr;
        }
      
      LinkInfo info;
      info.source = link.source;
      info.target = link.target;
      info.delay = Seconds (link.delay);
      info.distance = *distance;
      graph->m_links.emplace (key, info);
      
      graph->m_adjacency[link.source].push_back (link.target);
      graph->m_adjacency[link.target].push_back (link.source);
    }
  
  for (auto& entry : graph->m_adjacency)
    {
      std::sort (entry.second.begin (), entry.second.end ());
    }
  
  NS_LOG_INFO ("Built topology with " << graph->GetNNodes () << " nodes and "
               << graph->GetNLinks () << " links");
  return graph;
}

bool 
TopologyGraph::HasNode (const std::string& node) const
{
  return m_adjacency.find (node) != m_adjacency.end ();
}

bool 
TopologyGraph::HasLink (const std::string& a, const std::string& b) const
{
  return m_links.find (LinkKey (a, b)) != m_links.end ();
}

std::vector<std::string> 
TopologyGraph::GetNeighbors (const std::string& node) const
{
  auto it = m_adjacency.find (node);
  if (it == m_adjacency.end ())
    {
      NS_LOG_WARN ("Neighbor lookup for unknown node " << node);
      return std::vector<std::string> ();
    }
  return it->second;
}

std::optional<LinkInfo> 
TopologyGraph::GetLink (const std::string& a, const std::string& b) const
{
  auto it = m_links.find (LinkKey (a, b));
  if (it == m_links.end ())
    {
      NS_LOG_ERROR ("UnknownLinkError: no link between " << a << " and " << b);
      return std::nullopt;
    }
  return it->second;
}

std::vector<LinkInfo> 
TopologyGraph::GetLinks () const
{
  std::vector<LinkInfo> result;
  result.reserve (m_links.size ());
  for (const auto& pair : m_links)
    {
      result.push_back (pair.second);
    }
  return result;
}

uint32_t 
TopologyGraph::GetNNodes () const
{
  return static_cast<uint32_t> (m_nodes.size ());
}

uint32_t 
TopologyGraph::GetNLinks () const
{
  return static_cast<uint32_t> (m_links.size ());
}

double 
TopologyGraph::GetPathDistance (const std::vector<std::string>& nodes) const
{
  double total = 0.0;
  for (size_t i = 0; i + 1 < nodes.size (); ++i)
    {
      auto it = m_links.find (LinkKey (nodes[i], nodes[i + 1]));
      if (it != m_links.end ())
        {
          total += it->second.distance.kilometres;
        }
    }
  return total;
}

} // namespace dtnrelay

} // namespace ns3
