#ifndef DTNRELAY_DISRUPTED_LINK_SET_H
#define DTNRELAY_DISRUPTED_LINK_SET_H

#include <set>
#include <string>
#include <vector>

#include "topology-graph.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Overlay of links that are currently unusable
 *
 * Membership is transient and always a subset of the links of the
 * underlying topology; the topology itself is never mutated. The set only
 * observes the topology, which must outlive it.
 */
class DisruptedLinkSet
{
public:
  /**
   * \brief Constructor
   * \param topology Topology whose links may be marked disrupted
   */
  explicit DisruptedLinkSet (const TopologyGraph& topology);
  
  /**
   * \brief Mark a link disrupted
   * \param a One endpoint
   * \param b Other endpoint
   * \return false if the topology has no such link
   */
  bool Add (const std::string& a, const std::string& b);
  
  /**
   * \brief Clear the disruption of a link
   * \param a One endpoint
   * \param b Other endpoint
   * \return true if the link was marked disrupted
   */
  bool Remove (const std::string& a, const std::string& b);
  
  bool Contains (const std::string& a, const std::string& b) const;
  size_t Size () const { return m_links.size (); }
  bool IsEmpty () const { return m_links.empty (); }
  void Clear () { m_links.clear (); }
  
  /**
   * \brief Get the disrupted links
   * \return Links in key order
   */
  std::vector<LinkKey> GetLinks () const;

private:
  const TopologyGraph* m_topology; //!< Observed topology
  std::set<LinkKey> m_links;       //!< Disrupted links
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_DISRUPTED_LINK_SET_H */
