#include "dtn-relay-helper.h"
#include "ns3/double.h"
#include "ns3/log.h"
#include "ns3/uinteger.h"

#include <cmath>
#include <sstream>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("DtnRelayHelper");

namespace dtnrelay {

namespace {

bool 
IsRate (double rate)
{
  return !std::isnan (rate) && rate >= 0.0 && rate <= 1.0;
}

StatsRecord 
RejectedRecord (Ptr<Bundle> bundle)
{
  StatsRecord record;
  record.status = SimulationStatus::FAILED;
  record.reason = FailureReason::CONFIG_ERROR;
  if (bundle)
    {
      record.bundleId = bundle->GetId ();
      record.source = bundle->GetSource ();
      record.destination = bundle->GetDestination ();
    }
  return record;
}

} // namespace

bool 
SimulationConfig::Validate (std::string& error) const
{
  std::stringstream ss;
  
  if (!IsRate (errorRate))
    {
      ss << "errorRate " << errorRate << " outside [0, 1]";
    }
  else if (!IsRate (disruptionRate))
    {
      ss << "disruptionRate " << disruptionRate << " outside [0, 1]";
    }
  else if (bufferCapacityPerNode == 0)
    {
      ss << "bufferCapacityPerNode must be at least 1";
    }
  else if (maxAlternatePaths == 0)
    {
      ss << "maxAlternatePaths must be at least 1";
    }
  else if (maxDepth == 0)
    {
      ss << "maxDepth must be at least 1";
    }
  else if (retryInterval.IsStrictlyNegative ())
    {
      ss << "retryInterval is negative";
    }
  else if (timeBudget.IsStrictlyNegative ())
    {
      ss << "timeBudget is negative";
    }
  
  error = ss.str ();
  return error.empty ();
}

DtnRelayHelper::DtnRelayHelper ()
{
  NS_LOG_FUNCTION (this);
  
  m_engineFactory.SetTypeId ("ns3::dtnrelay::TransmissionEngine");
  m_routingFactory.SetTypeId ("ns3::dtnrelay::RoutingEngine");
  m_disruptionFactory.SetTypeId ("ns3::dtnrelay::DisruptionModel");
  m_storeFactory.SetTypeId ("ns3::dtnrelay::BufferStore");
}

void 
DtnRelayHelper::SetFactoryAttributes (ObjectFactory& factory,
                                      std::string n0, const AttributeValue &v0,
                                      std::string n1, const AttributeValue &v1,
                                      std::string n2, const AttributeValue &v2,
                                      std::string n3, const AttributeValue &v3)
{
  if (n0 != "")
    {
      factory.Set (n0, v0);
    }
  if (n1 != "")
    {
      factory.Set (n1, v1);
    }
  if (n2 != "")
    {
      factory.Set (n2, v2);
    }
  if (n3 != "")
    {
      factory.Set (n3, v3);
    }
}

void 
DtnRelayHelper::SetRoutingEngine (std::string routingType,
                                  std::string n0, const AttributeValue &v0,
                                  std::string n1, const AttributeValue &v1,
                                  std::string n2, const AttributeValue &v2,
                                  std::string n3, const AttributeValue &v3)
{
  NS_LOG_FUNCTION (this << routingType);
  
  m_routingFactory.SetTypeId (routingType);
  SetFactoryAttributes (m_routingFactory, n0, v0, n1, v1, n2, v2, n3, v3);
}

void 
DtnRelayHelper::SetDisruptionModel (std::string modelType,
                                    std::string n0, const AttributeValue &v0,
                                    std::string n1, const AttributeValue &v1,
                                    std::string n2, const AttributeValue &v2,
                                    std::string n3, const AttributeValue &v3)
{
  NS_LOG_FUNCTION (this << modelType);
  
  m_disruptionFactory.SetTypeId (modelType);
  SetFactoryAttributes (m_disruptionFactory, n0, v0, n1, v1, n2, v2, n3, v3);
}

void 
DtnRelayHelper::SetBufferStore (std::string storeType,
                                std::string n0, const AttributeValue &v0,
                                std::string n1, const AttributeValue &v1,
                                std::string n2, const AttributeValue &v2,
                                std::string n3, const AttributeValue &v3)
{
  NS_LOG_FUNCTION (this << storeType);
  
  m_storeFactory.SetTypeId (storeType);
  SetFactoryAttributes (m_storeFactory, n0, v0, n1, v1, n2, v2, n3, v3);
}

void 
DtnRelayHelper::AddTransitionSink (Callback<void, const TransmissionEvent&> sink)
{
  NS_LOG_FUNCTION (this);
  m_sinks.push_back (sink);
}

void 
DtnRelayHelper::SetCancellationToken (Ptr<CancellationToken> token)
{
  NS_LOG_FUNCTION (this << token);
  m_cancel = token;
}

Ptr<TransmissionEngine> 
DtnRelayHelper::Install (Ptr<TopologyGraph> topology,
                         const SimulationConfig& config,
                         Ptr<BufferStore> store) const
{
  NS_LOG_FUNCTION (this << topology);
  
  if (!topology)
    {
      NS_LOG_ERROR ("ConfigError: cannot install on a null topology");
      return nullptr;
    }
  
  std::string error;
  if (!config.Validate (error))
    {
      NS_LOG_ERROR ("ConfigError: " << error);
      return nullptr;
    }
  
  Ptr<RoutingEngine> routing = m_routingFactory.Create<RoutingEngine> ();
  if (!routing)
    {
      NS_LOG_ERROR ("Failed to create RoutingEngine");
      return nullptr;
    }
  routing->SetAttribute ("MaxDepth", UintegerValue (config.maxDepth));
  routing->SetTopology (topology);
  
  Ptr<DisruptionModel> disruption = m_disruptionFactory.Create<DisruptionModel> ();
  if (!disruption)
    {
      NS_LOG_ERROR ("Failed to create DisruptionModel");
      return nullptr;
    }
  disruption->SetAttribute ("ErrorRate", DoubleValue (config.errorRate));
  disruption->SetAttribute ("DisruptionRate", DoubleValue (config.disruptionRate));
  if (config.stream >= 0)
    {
      disruption->AssignStreams (config.stream);
    }
  
  if (!store)
    {
      store = m_storeFactory.Create<BufferStore> ();
      if (!store)
        {
          NS_LOG_ERROR ("Failed to create BufferStore");
          return nullptr;
        }
      store->SetAttribute ("Capacity", UintegerValue (config.bufferCapacityPerNode));
    }
  
  Ptr<TransmissionEngine> engine = m_engineFactory.Create<TransmissionEngine> ();
  if (!engine)
    {
      NS_LOG_ERROR ("Failed to create TransmissionEngine");
      return nullptr;
    }
  engine->SetAttribute ("MaxRetriesPerLink", UintegerValue (config.maxRetriesPerLink));
  engine->SetAttribute ("MaxAlternatePaths", UintegerValue (config.maxAlternatePaths));
  engine->SetAttribute ("RetryInterval", TimeValue (config.retryInterval));
  engine->SetAttribute ("TimeBudget", TimeValue (config.timeBudget));
  
  engine->SetTopology (topology);
  engine->SetRoutingEngine (routing);
  engine->SetDisruptionModel (disruption);
  engine->SetBufferStore (store);
  if (m_cancel)
    {
      engine->SetCancellationToken (m_cancel);
    }
  for (const auto& sink : m_sinks)
    {
      engine->AddTransitionSink (sink);
    }
  
  return engine;
}

StatsRecord 
DtnRelayHelper::Simulate (Ptr<TopologyGraph> topology,
                          const std::string& source,
                          const std::string& destination,
                          const std::vector<uint8_t>& payload,
                          const SimulationConfig& config) const
{
  NS_LOG_FUNCTION (this << source << destination);
  return Simulate (topology, Bundle::NewBundle (source, destination, payload), config);
}

StatsRecord 
DtnRelayHelper::Simulate (Ptr<TopologyGraph> topology,
                          Ptr<Bundle> bundle,
                          const SimulationConfig& config) const
{
  NS_LOG_FUNCTION (this << topology << bundle);
  
  Ptr<TransmissionEngine> engine = Install (topology, config);
  if (!engine)
    {
      return RejectedRecord (bundle);
    }
  
  StatsRecord record = engine->Simulate (bundle);
  engine->Dispose ();
  return record;
}

TopologyDescription 
DtnRelayHelper::MarsEarthTopology ()
{
  TopologyDescription desc;
  
  for (const char* id : {"mars_rover_1", "mars_rover_2", "mars_base",
                         "mars_orbiter_1", "mars_orbiter_2",
                         "relay_satellite_1", "relay_satellite_2",
                         "earth_station_1", "earth_station_2"})
    {
      desc.nodes.push_back ({id});
    }
  
  // Surface and low orbit around Mars
  desc.links.push_back ({"mars_rover_1", "mars_orbiter_1", 1.5, "400 km"});
  desc.links.push_back ({"mars_rover_1", "mars_base", 0.5, "50 km"});
  desc.links.push_back ({"mars_rover_2", "mars_orbiter_2", 1.5, "400 km"});
  desc.links.push_back ({"mars_rover_2", "mars_base", 0.5, "50 km"});
  desc.links.push_back ({"mars_base", "mars_orbiter_1", 1.2, "350 km"});
  desc.links.push_back ({"mars_orbiter_1", "mars_orbiter_2", 2.0, "600 km"});
  
  // Interplanetary trunk
  desc.links.push_back ({"mars_orbiter_1", "relay_satellite_1", 480.0, "140M km"});
  desc.links.push_back ({"mars_orbiter_2", "relay_satellite_2", 520.0, "155M km"});
  
  // Earth side
  desc.links.push_back ({"relay_satellite_1", "relay_satellite_2", 0.2, "60000 km"});
  desc.links.push_back ({"relay_satellite_1", "earth_station_1", 0.12, "36000 km"});
  desc.links.push_back ({"relay_satellite_2", "earth_station_2", 0.12, "36000 km"});
  desc.links.push_back ({"relay_satellite_1", "earth_station_2", 0.15, "42000 km"});
  
  return desc;
}

} // namespace dtnrelay

} // namespace ns3
