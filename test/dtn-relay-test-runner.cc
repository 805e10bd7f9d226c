/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */

#include "ns3/test.h"

int 
main (int argc, char *argv[])
{
  return ns3::TestRunner::Run (argc, argv);
}
