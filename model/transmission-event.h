#ifndef DTNRELAY_TRANSMISSION_EVENT_H
#define DTNRELAY_TRANSMISSION_EVENT_H

#include "ns3/nstime.h"

#include <cstdint>
#include <map>
#include <string>

namespace ns3 {

namespace dtnrelay {

/**
 * \brief Transition performed by the transmission engine
 */
enum class EventType : uint8_t {
  PATH_SELECTED = 0,               //!< SelectPath chose the initial path
  HOP_STARTED = 1,                 //!< AdvanceHop picked the next hop
  HOP_COMMITTED = 2,               //!< LinkCheck passed, bundle moved one hop
  LINK_DISRUPTED = 3,              //!< LinkCheck failed, bundle stored
  REROUTED = 4,                    //!< Active path switched
  REROUTE_UNAVAILABLE = 5,         //!< No alternative avoids the disruption
  RETRY_FAILED = 6,                //!< Retransmission attempt did not recover the link
  RECOVERED = 7,                   //!< Retransmission attempt recovered the link
  RETRIES_EXHAUSTED = 8,           //!< Per-link retry limit reached
  DELIVERED = 9,                   //!< Bundle reached its destination
  FAILED = 10                      //!< Run terminated without delivery
};

/**
 * \brief Convert event type to string
 * \param type Event type
 * \return String representation
 */
std::string EventTypeToString (EventType type);

/**
 * \ingroup dtnrelay
 * \brief Timestamped record of one engine transition
 */
struct TransmissionEvent
{
  EventType type;                                  //!< Transition
  Time timestamp;                                  //!< Logical time of the transition
  std::map<std::string, std::string> attributes;   //!< Transition details
  
  /**
   * \brief Get an attribute
   * \param key Attribute name
   * \return Attribute value, empty if absent
   */
  std::string GetAttribute (const std::string& key) const;
  
  /**
   * \brief Get string representation
   * \return "[t s] TYPE key=value ..."
   */
  std::string ToString () const;
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_TRANSMISSION_EVENT_H */
