/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */

#include "ns3/core-module.h"

#include "dtn-relay-helper.h"

#include <iostream>

using namespace ns3;
using namespace ns3::dtnrelay;

NS_LOG_COMPONENT_DEFINE ("DtnRelayExample");

static void
PrintTransition (const TransmissionEvent& event)
{
  std::cout << "  " << event.ToString () << std::endl;
}

int 
main (int argc, char *argv[])
{
  std::string source = "mars_rover_1";
  std::string destination = "earth_station_1";
  std::string message = "Hello from Mars";
  std::string outage = "";
  uint32_t runs = 1;
  uint32_t maxPaths = 1000;
  bool verbose = false;
  bool trace = true;
  SimulationConfig config;
  config.errorRate = 0.1;
  config.disruptionRate = 0.2;

  CommandLine cmd (__FILE__);
  cmd.AddValue ("source", "Source node", source);
  cmd.AddValue ("destination", "Destination node", destination);
  cmd.AddValue ("message", "Bundle payload", message);
  cmd.AddValue ("outage", "Link forced down for the whole run, as node1,node2", outage);
  cmd.AddValue ("runs", "Number of bundles sent over the shared topology", runs);
  cmd.AddValue ("errorRate", "Transmission error probability per hop", config.errorRate);
  cmd.AddValue ("disruptionRate", "Link disruption probability per hop", config.disruptionRate);
  cmd.AddValue ("maxRetries", "Recovery attempts per link", config.maxRetriesPerLink);
  cmd.AddValue ("maxAlternatePaths", "Alternatives per routing query", config.maxAlternatePaths);
  cmd.AddValue ("bufferCapacity", "Bundles per node buffer", config.bufferCapacityPerNode);
  cmd.AddValue ("maxDepth", "Hop limit of path enumeration", config.maxDepth);
  cmd.AddValue ("maxPaths", "Paths collected by one enumeration", maxPaths);
  cmd.AddValue ("retryInterval", "Logical time of one retry", config.retryInterval);
  cmd.AddValue ("timeBudget", "Logical time budget, 0s for none", config.timeBudget);
  cmd.AddValue ("stream", "Random stream of the disruption model", config.stream);
  cmd.AddValue ("verbose", "Enable engine logging", verbose);
  cmd.AddValue ("trace", "Print every transition", trace);
  cmd.Parse (argc, argv);

  if (verbose)
    {
      LogComponentEnable ("DtnRelayExample", LOG_LEVEL_INFO);
      LogComponentEnable ("TransmissionEngine", LOG_LEVEL_INFO);
      LogComponentEnable ("DisruptionModel", LOG_LEVEL_INFO);
      LogComponentEnable ("BufferStore", LOG_LEVEL_WARN);
    }

  Ptr<TopologyGraph> topology = TopologyGraph::Build (DtnRelayHelper::MarsEarthTopology ());
  if (!topology)
    {
      NS_LOG_ERROR ("Reference topology rejected");
      return 1;
    }

  DtnRelayHelper helper;
  helper.SetRoutingEngine ("ns3::dtnrelay::RoutingEngine", "MaxPaths", UintegerValue (maxPaths));
  if (trace)
    {
      helper.AddTransitionSink (MakeCallback (&PrintTransition));
    }

  std::vector<uint8_t> payload (message.begin (), message.end ());
  uint32_t delivered = 0;

  for (uint32_t run = 0; run < runs; ++run)
    {
      SimulationConfig runConfig = config;
      runConfig.stream = config.stream + run;

      Ptr<TransmissionEngine> engine = helper.Install (topology, runConfig);
      if (!engine)
        {
          NS_LOG_ERROR ("Invalid configuration");
          return 1;
        }

      if (!outage.empty ())
        {
          std::string::size_type comma = outage.find (',');
          if (comma == std::string::npos)
            {
              NS_LOG_ERROR ("Outage must be given as node1,node2");
              return 1;
            }
          engine->GetDisruptionModel ()->ForceDisruption (outage.substr (0, comma),
                                                          outage.substr (comma + 1));
        }

      std::cout << "Run " << run << ": " << source << " -> " << destination << std::endl;
      StatsRecord record = engine->Simulate (Bundle::NewBundle (source, destination, payload));
      NS_LOG_INFO (engine->GetStats ());
      NS_LOG_INFO (engine->GetRoutingEngine ()->GetStats ());
      NS_LOG_INFO (engine->GetDisruptionModel ()->GetStats ());
      NS_LOG_INFO (engine->GetBufferStore ()->GetStats ());
      engine->Dispose ();

      std::cout << record.ToString () << std::endl;
      if (record.IsDelivered ())
        {
          delivered++;
          std::cout << "  distance: " << FormatDistance (record.totalDistance) << std::endl;
        }
    }

  std::cout << "Delivered " << delivered << " of " << runs << " bundles" << std::endl;

  Simulator::Destroy ();
  return 0;
}
