#ifndef DTNRELAY_TOPOLOGY_GRAPH_H
#define DTNRELAY_TOPOLOGY_GRAPH_H

#include "ns3/nstime.h"
#include "ns3/ptr.h"
#include "ns3/simple-ref-count.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ns3 {

namespace dtnrelay {

/**
 * \brief Distance class of a link, used only to bias reliability
 */
enum class DistanceClass : uint8_t {
  NEAR = 0,                        //!< Plain distance ("<value> km")
  DEEP_SPACE = 1                   //!< Scaled distance ("<value> M km")
};

/**
 * \ingroup dtnrelay
 * \brief Parsed link distance
 */
struct LinkDistance
{
  double kilometres;               //!< Distance in kilometres
  DistanceClass distanceClass;     //!< Near or deep-space
  
  /**
   * \brief Parse a tagged distance string
   * \param text Distance such as "384400 km" or "225 M km"
   * \return Parsed distance or empty optional if malformed
   */
  static std::optional<LinkDistance> Parse (const std::string& text);
};

/**
 * \brief Render a distance for reports
 * \param kilometres Distance in kilometres
 * \return "x.x km", "x.xk km" or "x.xM km"
 */
std::string FormatDistance (double kilometres);

/**
 * \brief Node entry of an externally parsed topology
 */
struct NodeDescription
{
  std::string id;                  //!< Node identifier
};

/**
 * \brief Link entry of an externally parsed topology
 */
struct LinkDescription
{
  std::string source;              //!< First endpoint
  std::string target;              //!< Second endpoint
  double delay;                    //!< One-way delay in seconds
  std::string distance;            //!< Tagged distance string
};

/**
 * \ingroup dtnrelay
 * \brief Topology as supplied by an external loader
 */
struct TopologyDescription
{
  std::vector<NodeDescription> nodes;  //!< Nodes
  std::vector<LinkDescription> links;  //!< Undirected links
};

/**
 * \ingroup dtnrelay
 * \brief Unordered node pair naming one undirected link
 */
struct LinkKey
{
  LinkKey (const std::string& a, const std::string& b);
  
  bool operator== (const LinkKey& other) const;
  bool operator< (const LinkKey& other) const;
  std::string ToString () const;
  
  std::string first;               //!< Lexicographically smaller endpoint
  std::string second;              //!< Lexicographically larger endpoint
};

/**
 * \ingroup dtnrelay
 * \brief Attributes of one link
 */
struct LinkInfo
{
  std::string source;              //!< First endpoint as declared
  std::string target;              //!< Second endpoint as declared
  Time delay;                      //!< One-way delay
  LinkDistance distance;           //!< Distance and class
};

/**
 * \ingroup dtnrelay
 * \brief Immutable undirected weighted graph of nodes and links
 *
 * The graph is built once and never mutated afterwards. Installed
 * engines read it through their own reference, and a run observes it
 * without touching the reference count, so engines sharing one graph may
 * simulate concurrently. Installing and disposing engines copies the
 * (non-atomic) reference and must stay on one thread.
 */
class TopologyGraph : public SimpleRefCount<TopologyGraph>
{
public:
  /**
   * \brief Construct an empty graph, see Build
   */
  TopologyGraph ();
  
  /**
   * \brief Build a graph from a parsed topology
   * \param description Nodes and links
   * \return Graph, or null if the description is malformed (ConfigError)
   */
  static Ptr<TopologyGraph> Build (const TopologyDescription& description);
  
  bool HasNode (const std::string& node) const;
  bool HasLink (const std::string& a, const std::string& b) const;
  
  /**
   * \brief Get neighbors of a node
   * \param node Node identifier
   * \return Neighbors in lexicographic order, empty for unknown nodes
   */
  std::vector<std::string> GetNeighbors (const std::string& node) const;
  
  /**
   * \brief Look up the attributes of a link
   * \param a One endpoint
   * \param b Other endpoint
   * \return Link attributes or empty optional (UnknownLinkError)
   */
  std::optional<LinkInfo> GetLink (const std::string& a, const std::string& b) const;
  
  /**
   * \brief Get all nodes in declaration order
   * \return Node identifiers
   */
  const std::vector<std::string>& GetNodes () const { return m_nodes; }
  
  /**
   * \brief Get all links
   * \return Links ordered by their key
   */
  std::vector<LinkInfo> GetLinks () const;
  
  uint32_t GetNNodes () const;
  uint32_t GetNLinks () const;
  
  /**
   * \brief Sum the distance of consecutive links along a node sequence
   * \param nodes Node sequence
   * \return Distance in kilometres; hops without a link contribute nothing
   */
  double GetPathDistance (const std::vector<std::string>& nodes) const;

private:
  std::vector<std::string> m_nodes;                             //!< Nodes in declaration order
  std::map<std::string, std::vector<std::string>> m_adjacency;  //!< Sorted neighbor lists
  std::map<LinkKey, LinkInfo> m_links;                          //!< Link attributes
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_TOPOLOGY_GRAPH_H */
