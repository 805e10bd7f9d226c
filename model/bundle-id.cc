#include "bundle-id.h"
#include <sstream>

namespace ns3 {

namespace dtnrelay {

BundleID::BundleID ()
  : m_creationTime (Seconds (0)),
    m_sequenceNumber (0)
{
}

BundleID::BundleID (const std::string& source, 
                    Time creationTime, 
                    uint64_t sequenceNumber)
  : m_source (source),
    m_creationTime (creationTime),
    m_sequenceNumber (sequenceNumber)
{
}

bool 
BundleID::operator== (const BundleID& other) const
{
  return m_source == other.m_source &&
         m_creationTime == other.m_creationTime &&
         m_sequenceNumber == other.m_sequenceNumber;
}

bool 
BundleID::operator!= (const BundleID& other) const
{
  return !(*this == other);
}

bool 
BundleID::operator< (const BundleID& other) const
{
  if (m_source != other.m_source)
    {
      return m_source < other.m_source;
    }
  
  if (m_creationTime != other.m_creationTime)
    {
      return m_creationTime < other.m_creationTime;
    }
  
  return m_sequenceNumber < other.m_sequenceNumber;
}

std::string 
BundleID::ToString () const
{
  std::stringstream ss;
  ss << m_source << "@" 
     << m_creationTime.GetSeconds () << "#" 
     << m_sequenceNumber;
  return ss.str ();
}

size_t 
BundleID::Hash () const
{
  size_t hash = std::hash<std::string>{} (m_source);
  hash ^= std::hash<int64_t>{} (m_creationTime.GetTimeStep ()) << 1;
  hash ^= std::hash<uint64_t>{} (m_sequenceNumber) << 1;
  return hash;
}

} // namespace dtnrelay

} // namespace ns3
