#ifndef DTNRELAY_HELPER_H
#define DTNRELAY_HELPER_H

#include "ns3/attribute.h"
#include "ns3/callback.h"
#include "ns3/nstime.h"
#include "ns3/object-factory.h"
#include "ns3/ptr.h"

#include <cstdint>
#include <string>
#include <vector>

#include "../model/buffer-store.h"
#include "../model/bundle.h"
#include "../model/disruption-model.h"
#include "../model/routing-engine.h"
#include "../model/stats-recorder.h"
#include "../model/topology-graph.h"
#include "../model/transmission-engine.h"
#include "../model/transmission-event.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Parameters of one simulation run
 */
struct SimulationConfig
{
  double errorRate = 0.0;                  //!< Probability of a transmission error per hop attempt
  double disruptionRate = 0.0;             //!< Probability of a link disruption per hop attempt
  uint32_t maxRetriesPerLink = 3;          //!< Recovery attempts per link
  uint32_t maxAlternatePaths = 3;          //!< Alternatives per routing query
  uint32_t bufferCapacityPerNode = 10;     //!< Bundles per node buffer
  uint32_t maxDepth = 8;                   //!< Hop limit of path enumeration
  Time retryInterval = Seconds (60);       //!< Logical time of one retry
  Time timeBudget = Seconds (0);           //!< Logical time budget, zero for none
  int64_t stream = 0;                      //!< Random stream, negative keeps the default

  /**
   * \brief Check every parameter against its range
   * \param error Output, description of the first invalid parameter
   * \return true if the configuration is usable
   */
  bool Validate (std::string& error) const;
};

/**
 * \ingroup dtnrelay
 * \brief Helper wiring engines, buffer stores and disruption models
 *        onto a shared topology
 *
 * Every call to Install or Simulate creates private component instances,
 * so runs on one topology never share mutable state.
 */
class DtnRelayHelper
{
public:
  /**
   * \brief Constructor
   */
  DtnRelayHelper ();
  
  /**
   * \brief Set the routing engine type
   * \param routingType Type of routing engine to use
   * \param n0 First attribute name
   * \param v0 First attribute value
   * \param n1 Second attribute name
   * \param v1 Second attribute value
   * \param n2 Third attribute name
   * \param v2 Third attribute value
   * \param n3 Fourth attribute name
   * \param v3 Fourth attribute value
   */
  void SetRoutingEngine (std::string routingType,
                         std::string n0 = "", const AttributeValue &v0 = EmptyAttributeValue (),
                         std::string n1 = "", const AttributeValue &v1 = EmptyAttributeValue (),
                         std::string n2 = "", const AttributeValue &v2 = EmptyAttributeValue (),
                         std::string n3 = "", const AttributeValue &v3 = EmptyAttributeValue ());
  
  /**
   * \brief Set the disruption model type
   * \param modelType Type of disruption model to use
   * \param n0 First attribute name
   * \param v0 First attribute value
   * \param n1 Second attribute name
   * \param v1 Second attribute value
   * \param n2 Third attribute name
   * \param v2 Third attribute value
   * \param n3 Fourth attribute name
   * \param v3 Fourth attribute value
   */
  void SetDisruptionModel (std::string modelType,
                           std::string n0 = "", const AttributeValue &v0 = EmptyAttributeValue (),
                           std::string n1 = "", const AttributeValue &v1 = EmptyAttributeValue (),
                           std::string n2 = "", const AttributeValue &v2 = EmptyAttributeValue (),
                           std::string n3 = "", const AttributeValue &v3 = EmptyAttributeValue ());
  
  /**
   * \brief Set the buffer store type
   * \param storeType Type of buffer store to use
   * \param n0 First attribute name
   * \param v0 First attribute value
   * \param n1 Second attribute name
   * \param v1 Second attribute value
   * \param n2 Third attribute name
   * \param v2 Third attribute value
   * \param n3 Fourth attribute name
   * \param v3 Fourth attribute value
   */
  void SetBufferStore (std::string storeType,
                       std::string n0 = "", const AttributeValue &v0 = EmptyAttributeValue (),
                       std::string n1 = "", const AttributeValue &v1 = EmptyAttributeValue (),
                       std::string n2 = "", const AttributeValue &v2 = EmptyAttributeValue (),
                       std::string n3 = "", const AttributeValue &v3 = EmptyAttributeValue ());
  
  /**
   * \brief Observe every engine this helper creates
   * \param sink Callback invoked after each transition
   */
  void AddTransitionSink (Callback<void, const TransmissionEvent&> sink);
  
  /**
   * \brief Set a cancellation signal shared by every engine this helper creates
   * \param token Cancellation token
   */
  void SetCancellationToken (Ptr<CancellationToken> token);
  
  /**
   * \brief Create a fully wired engine on a topology
   * \param topology Shared topology
   * \param config Run parameters, applied over the factory attributes
   * \param store Buffer store to use, a new one is created if null
   * \return Engine, or nullptr if the configuration is invalid
   */
  Ptr<TransmissionEngine> Install (Ptr<TopologyGraph> topology,
                                   const SimulationConfig& config,
                                   Ptr<BufferStore> store = nullptr) const;
  
  /**
   * \brief Run one bundle through a private engine
   * \param topology Shared topology
   * \param source Source node
   * \param destination Destination node
   * \param payload Payload data
   * \param config Run parameters
   * \return Result record; reason ConfigError if nothing could run
   */
  StatsRecord Simulate (Ptr<TopologyGraph> topology,
                        const std::string& source,
                        const std::string& destination,
                        const std::vector<uint8_t>& payload,
                        const SimulationConfig& config) const;
  
  /**
   * \brief Run an existing bundle through a private engine
   * \param topology Shared topology
   * \param bundle Bundle to carry
   * \param config Run parameters
   * \return Result record; reason ConfigError if nothing could run
   */
  StatsRecord Simulate (Ptr<TopologyGraph> topology,
                        Ptr<Bundle> bundle,
                        const SimulationConfig& config) const;
  
  /**
   * \brief Description of the Mars to Earth relay network
   *
   * Two rovers reach two orbiters over short surface links, the orbiters
   * hand over to relay satellites across deep space and the relays
   * downlink to two earth stations.
   *
   * \return Topology description
   */
  static TopologyDescription MarsEarthTopology ();

private:
  /**
   * \brief Set up to four attributes on a factory
   */
  static void SetFactoryAttributes (ObjectFactory& factory,
                                    std::string n0, const AttributeValue &v0,
                                    std::string n1, const AttributeValue &v1,
                                    std::string n2, const AttributeValue &v2,
                                    std::string n3, const AttributeValue &v3);
  
  ObjectFactory m_engineFactory;       //!< Transmission engine factory
  ObjectFactory m_routingFactory;      //!< Routing engine factory
  ObjectFactory m_disruptionFactory;   //!< Disruption model factory
  ObjectFactory m_storeFactory;        //!< Buffer store factory
  
  std::vector<Callback<void, const TransmissionEvent&>> m_sinks;  //!< Observers attached to each engine
  Ptr<CancellationToken> m_cancel;                                //!< Shared cancellation signal
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_HELPER_H */
