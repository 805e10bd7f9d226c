#include "bundle.h"
#include "ns3/simulator.h"

#include <atomic>
#include <sstream>

namespace ns3 {

namespace dtnrelay {

Bundle::Bundle (const BundleID& id,
                const std::string& destination,
                const std::vector<uint8_t>& payload,
                Time lifetime)
  : m_id (id),
    m_destination (destination),
    m_payload (payload),
    m_lifetime (lifetime)
{
}

Ptr<Bundle> 
Bundle::NewBundle (const std::string& source,
                   const std::string& destination,
                   const std::vector<uint8_t>& payload,
                   Time lifetime)
{
  BundleID id (source, Simulator::Now (), AllocateSequenceNumber ());
  return Create<Bundle> (id, destination, payload, lifetime);
}

uint64_t 
Bundle::AllocateSequenceNumber ()
{
  static std::atomic<uint64_t> next (0);
  return next.fetch_add (1);
}

uint32_t 
Bundle::GetSize () const
{
  return static_cast<uint32_t> (m_payload.size ());
}

bool 
Bundle::IsExpired (Time now) const
{
  if (m_lifetime.IsZero ())
    {
      // Zero lifetime means the bundle never expires
      return false;
    }
  return now > GetCreationTime () + m_lifetime;
}

std::string 
Bundle::ToString () const
{
  std::stringstream ss;
  
  ss << "Bundle(id=" << m_id.ToString ()
     << ", src=" << GetSource ()
     << ", dst=" << m_destination
     << ", size=" << GetSize ()
     << ", lifetime=" << m_lifetime.GetSeconds () << "s"
     << ")";
  
  return ss.str ();
}

} // namespace dtnrelay

} // namespace ns3
