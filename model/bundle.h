#ifndef DTNRELAY_BUNDLE_H
#define DTNRELAY_BUNDLE_H

#include "ns3/nstime.h"
#include "ns3/ptr.h"
#include "ns3/simple-ref-count.h"

#include <cstdint>
#include <string>
#include <vector>

#include "bundle-id.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief A bundle carried end-to-end by store-and-forward relay
 *
 * A bundle is created once per simulation run and never modified
 * afterwards. Its location is tracked by the transmission engine, not by
 * the bundle itself.
 */
class Bundle : public SimpleRefCount<Bundle>
{
public:
  /**
   * \brief Constructor
   * \param id Bundle ID
   * \param destination Destination node
   * \param payload Payload data
   * \param lifetime Bundle lifetime, zero never expires
   */
  Bundle (const BundleID& id,
          const std::string& destination,
          const std::vector<uint8_t>& payload,
          Time lifetime);
  
  /**
   * \brief Create a new bundle stamped with the current simulation time
   *
   * The sequence number is drawn from a process-wide counter, so two
   * bundles created at the same time never share an ID.
   *
   * \param source Source node
   * \param destination Destination node
   * \param payload Payload data
   * \param lifetime Bundle lifetime, zero never expires
   * \return A new bundle object
   */
  static Ptr<Bundle> NewBundle (const std::string& source,
                                const std::string& destination,
                                const std::vector<uint8_t>& payload,
                                Time lifetime = Seconds (0));
  
  /**
   * \brief Allocate the next process-wide bundle sequence number
   * \return Sequence number, unique within the process
   */
  static uint64_t AllocateSequenceNumber ();
  
  const BundleID& GetId () const { return m_id; }
  const std::string& GetSource () const { return m_id.GetSource (); }
  const std::string& GetDestination () const { return m_destination; }
  const std::vector<uint8_t>& GetPayload () const { return m_payload; }
  Time GetCreationTime () const { return m_id.GetCreationTime (); }
  Time GetLifetime () const { return m_lifetime; }
  
  /**
   * \brief Get bundle size
   * \return Payload size in bytes
   */
  uint32_t GetSize () const;
  
  /**
   * \brief Check whether the lifetime has elapsed
   * \param now Time to check against
   * \return true if creation time plus lifetime lies before now
   */
  bool IsExpired (Time now) const;
  
  /**
   * \brief Get string representation
   * \return String representation of the bundle
   */
  std::string ToString () const;

private:
  BundleID m_id;                   //!< Bundle ID
  std::string m_destination;       //!< Destination node
  std::vector<uint8_t> m_payload;  //!< Opaque payload
  Time m_lifetime;                 //!< Lifetime
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_BUNDLE_H */
