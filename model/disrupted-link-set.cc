#include "disrupted-link-set.h"
#include "ns3/log.h"

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("DisruptedLinkSet");

namespace dtnrelay {

DisruptedLinkSet::DisruptedLinkSet (const TopologyGraph& topology)
  : m_topology (&topology)
{
}

bool 
DisruptedLinkSet::Add (const std::string& a, const std::string& b)
{
  NS_LOG_FUNCTION (this << a << b);
  
  if (!m_topology->HasLink (a, b))
    {
      NS_LOG_ERROR ("Refusing to mark missing link " << a << " - " << b << " disrupted");
      return false;
    }
  
  m_links.insert (LinkKey (a, b));
  return true;
}

bool 
DisruptedLinkSet::Remove (const std::string& a, const std::string& b)
{
  NS_LOG_FUNCTION (this << a << b);
  return m_links.erase (LinkKey (a, b)) > 0;
}

bool 
DisruptedLinkSet::Contains (const std::string& a, const std::string& b) const
{
  return m_links.find (LinkKey (a, b)) != m_links.end ();
}

std::vector<LinkKey> 
DisruptedLinkSet::GetLinks () const
{
  return std::vector<LinkKey> (m_links.begin (), m_links.end ());
}

} // namespace dtnrelay

} // namespace ns3
