#ifndef DTNRELAY_BUNDLE_ID_H
#define DTNRELAY_BUNDLE_ID_H

#include "ns3/nstime.h"

#include <cstdint>
#include <string>
#include <functional>

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Identity of a bundle within one simulation
 *
 * Identification is based on the source node, the creation time and a
 * sequence number that separates bundles created at the same instant.
 */
class BundleID
{
public:
  BundleID ();
  
  /**
   * \param source Source node identifier
   * \param creationTime Creation time
   * \param sequenceNumber Sequence number
   */
  BundleID (const std::string& source, 
            Time creationTime, 
            uint64_t sequenceNumber);
  
  bool operator== (const BundleID& other) const;
  bool operator!= (const BundleID& other) const;
  
  /// Orders by source, then creation time, then sequence number
  bool operator< (const BundleID& other) const;
  
  const std::string& GetSource () const { return m_source; }
  Time GetCreationTime () const { return m_creationTime; }
  uint64_t GetSequenceNumber () const { return m_sequenceNumber; }
  
  /// \return source@seconds#sequence
  std::string ToString () const;
  
  size_t Hash () const;

private:
  std::string m_source;            //!< Source node
  Time m_creationTime;             //!< Creation time
  uint64_t m_sequenceNumber;       //!< Sequence number
};

} // namespace dtnrelay

} // namespace ns3

namespace std {

template<>
struct hash<ns3::dtnrelay::BundleID>
{
  size_t operator() (const ns3::dtnrelay::BundleID& id) const
  {
    return id.Hash ();
  }
};

} // namespace std

#endif /* DTNRELAY_BUNDLE_ID_H */
