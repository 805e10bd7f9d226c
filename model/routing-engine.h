#ifndef DTNRELAY_ROUTING_ENGINE_H
#define DTNRELAY_ROUTING_ENGINE_H

#include "ns3/object.h"
#include "ns3/nstime.h"
#include "ns3/ptr.h"

#include <functional>
#include <string>
#include <vector>

#include "disrupted-link-set.h"
#include "relay-codes.h"
#include "topology-graph.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Simple path annotated for ranking
 */
struct Path
{
  std::vector<std::string> nodes;  //!< Distinct nodes from source to destination
  Time cumulativeDelay;            //!< Sum of link delays
  double reliability {1.0};        //!< Product of per-hop reliabilities
  
  /**
   * \brief Get number of hops
   * \return Number of links traversed
   */
  uint32_t GetHopCount () const;
  
  /**
   * \brief Check whether a node lies on the path
   * \param node Node identifier
   * \return true if the node appears on the path
   */
  bool Contains (const std::string& node) const;
  
  /**
   * \brief Get string representation
   * \return Nodes joined by " -> "
   */
  std::string ToString () const;
};

/**
 * \ingroup dtnrelay
 * \brief Enumerates, scores and ranks simple paths over a topology
 *
 * Paths are searched best-first: extending a path never lowers its
 * score, so complete paths come out in ranking order and the MaxPaths
 * cap only ever drops the worst ones.
 */
class RoutingEngine : public Object
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
  RoutingEngine ();
  
  /**
   * \brief Destructor
   */
  virtual ~RoutingEngine ();
  
  /**
   * \brief Set the topology to route over
   * \param topology Topology graph
   */
  void SetTopology (Ptr<TopologyGraph> topology);
  
  /**
   * \brief Get the topology
   * \return Topology graph
   */
  Ptr<TopologyGraph> GetTopology () const;
  
  /**
   * \brief Enumerate all simple paths up to a bounded depth
   * \param source Source node
   * \param destination Destination node
   * \param maxDepth Maximum number of hops
   * \param paths Output, annotated paths ascending by score
   * \return NO_PATH if no path exists within the bound, NONE otherwise
   */
  ErrorCode EnumeratePaths (const std::string& source,
                            const std::string& destination,
                            uint32_t maxDepth,
                            std::vector<Path>& paths) const;
  
  /**
   * \brief Enumerate all simple paths using the MaxDepth attribute
   * \param source Source node
   * \param destination Destination node
   * \param paths Output, annotated paths ascending by score
   * \return NO_PATH if no path exists within the bound, NONE otherwise
   */
  ErrorCode EnumeratePaths (const std::string& source,
                            const std::string& destination,
                            std::vector<Path>& paths) const;
  
  /**
   * \brief Score a path, lower is preferred
   *
   * The score is the cumulative delay in seconds divided by the path
   * reliability.
   *
   * \param path Annotated path
   * \return Score
   */
  double Score (const Path& path) const;
  
  /**
   * \brief Ranking order: score, then hop count, then node names
   * \param a First path
   * \param b Second path
   * \return true if a ranks before b
   */
  bool Precedes (const Path& a, const Path& b) const;
  
  /**
   * \brief Annotate a node sequence with delay and reliability
   * \param nodes Node sequence
   * \return Annotated path; hops without a link are skipped
   */
  Path MakePath (const std::vector<std::string>& nodes) const;
  
  /**
   * \brief Select the best alternatives around disrupted links
   *
   * Paths whose first hop is disrupted, or that the optional reject
   * predicate refuses, are discarded. The search stops once k paths are
   * accepted, so refused candidates never crowd out acceptable ones.
   *
   * \param source Source node
   * \param destination Destination node
   * \param disruptedLinks Current disruption overlay
   * \param k Maximum number of alternatives
   * \param alternatives Output, at most k paths ascending by score
   * \param reject Optional predicate discarding further candidates
   * \return NO_PATH only when the topology has no route at all
   */
  ErrorCode SelectAlternatives (const std::string& source,
                                const std::string& destination,
                                const DisruptedLinkSet& disruptedLinks,
                                uint32_t k,
                                std::vector<Path>& alternatives,
                                std::function<bool (const Path&)> reject = nullptr) const;
  
  /**
   * \brief Get routing stats
   * \return Statistics string
   */
  std::string GetStats () const;
  
  static constexpr double NEAR_LINK_RELIABILITY = 0.9;        //!< Reliability of a near hop
  static constexpr double DEEP_SPACE_LINK_RELIABILITY = 0.7;  //!< Reliability of a deep-space hop

protected:
  void DoDispose () override;

private:
  /**
   * \brief Check reachability within a hop bound
   * \param source Source node
   * \param destination Destination node
   * \param maxDepth Maximum number of hops
   * \return true if some path of at most maxDepth hops exists
   */
  bool HasRoute (const std::string& source,
                 const std::string& destination,
                 uint32_t maxDepth) const;
  
  /**
   * \brief Append one hop to a path, updating its annotations
   * \param path Path to extend
   * \param next Node appended
   * \return Extended path
   */
  Path Extend (const Path& path, const std::string& next) const;
  
  /**
   * \brief Best-first search over simple paths
   *
   * Complete paths are handed to visit in ranking order until visit
   * returns false, the frontier is empty, or MaxPaths complete paths
   * have been visited.
   *
   * \param source Source node
   * \param destination Destination node
   * \param maxDepth Maximum number of hops
   * \param blockedFirstHop Optional overlay whose links may not be the first hop
   * \param visit Consumer of complete paths
   * \return Number of complete paths visited
   */
  uint32_t Search (const std::string& source,
                   const std::string& destination,
                   uint32_t maxDepth,
                   const DisruptedLinkSet* blockedFirstHop,
                   const std::function<bool (const Path&)>& visit) const;
  
  Ptr<TopologyGraph> m_topology;         //!< Topology
  uint32_t m_maxDepth;                   //!< Default search depth in hops
  uint32_t m_maxPaths;                   //!< Cap on enumerated paths per query
  mutable uint64_t m_enumerations;       //!< Number of enumeration queries
  mutable uint64_t m_truncated;          //!< Queries stopped by the path cap
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_ROUTING_ENGINE_H */
