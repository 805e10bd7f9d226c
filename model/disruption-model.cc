#include "disruption-model.h"
#include "ns3/double.h"
#include "ns3/log.h"

#include <sstream>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("DisruptionModel");

namespace dtnrelay {

NS_OBJECT_ENSURE_REGISTERED (DisruptionModel);

TypeId 
DisruptionModel::GetTypeId ()
{
  static TypeId tid = TypeId ("ns3::dtnrelay::DisruptionModel")
    .SetParent<Object> ()
    .SetGroupName ("DtnRelay")
    .AddConstructor<DisruptionModel> ()
    .AddAttribute ("ErrorRate",
                   "Probability that a hop attempt fails with a transmission error",
                   DoubleValue (0.0),
                   MakeDoubleAccessor (&DisruptionModel::SetErrorRate,
                                       &DisruptionModel::GetErrorRate),
                   MakeDoubleChecker<double> (0.0, 1.0))
    .AddAttribute ("DisruptionRate",
                   "Probability that a hop attempt finds the link disrupted",
                   DoubleValue (0.0),
                   MakeDoubleAccessor (&DisruptionModel::SetDisruptionRate,
                                       &DisruptionModel::GetDisruptionRate),
                   MakeDoubleChecker<double> (0.0, 1.0))
  ;
  return tid;
}

DisruptionModel::DisruptionModel ()
  : m_errorRate (0.0),
    m_disruptionRate (0.0),
    m_hopChecks (0),
    m_disruptions (0),
    m_recoveryChecks (0),
    m_recoveries (0)
{
  NS_LOG_FUNCTION (this);
  m_rng = CreateObject<UniformRandomVariable> ();
}

DisruptionModel::~DisruptionModel ()
{
  NS_LOG_FUNCTION (this);
}

void 
DisruptionModel::DoDispose ()
{
  NS_LOG_FUNCTION (this);
  m_rng = nullptr;
  Object::DoDispose ();
}

bool 
DisruptionModel::CheckHop (const std::string& a, const std::string& b)
{
  NS_LOG_FUNCTION (this << a << b);
  
  m_hopChecks++;
  
  // Both trials are always drawn so the stream advances identically
  bool error = m_rng->GetValue (0.0, 1.0) < m_errorRate;
  bool disruption = m_rng->GetValue (0.0, 1.0) < m_disruptionRate;
  bool forced = IsForced (a, b);
  
  if (error || disruption || forced)
    {
      m_disruptions++;
      NS_LOG_INFO ("Hop " << a << " -> " << b << " disrupted (error=" << error
                   << ", disruption=" << disruption << ", forced=" << forced << ")");
      return true;
    }
  
  return false;
}

bool 
DisruptionModel::CheckRecovery (const std::string& a, const std::string& b)
{
  NS_LOG_FUNCTION (this << a << b);
  
  m_recoveryChecks++;
  
  double draw = m_rng->GetValue (0.0, 1.0);
  if (IsForced (a, b))
    {
      return false;
    }
  
  if (draw > GetRecoveryThreshold ())
    {
      m_recoveries++;
      NS_LOG_INFO ("Link " << a << " - " << b << " recovered");
      return true;
    }
  
  return false;
}

void 
DisruptionModel::ForceDisruption (const std::string& a, const std::string& b)
{
  NS_LOG_FUNCTION (this << a << b);
  m_forced.insert (LinkKey (a, b));
}

void 
DisruptionModel::ClearForcedDisruptions ()
{
  NS_LOG_FUNCTION (this);
  m_forced.clear ();
}

bool 
DisruptionModel::IsForced (const std::string& a, const std::string& b) const
{
  return m_forced.find (LinkKey (a, b)) != m_forced.end ();
}

void 
DisruptionModel::SetErrorRate (double rate)
{
  NS_LOG_FUNCTION (this << rate);
  m_errorRate = rate;
}

double 
DisruptionModel::GetErrorRate () const
{
  return m_errorRate;
}

void 
DisruptionModel::SetDisruptionRate (double rate)
{
  NS_LOG_FUNCTION (this << rate);
  m_disruptionRate = rate;
}

double 
DisruptionModel::GetDisruptionRate () const
{
  return m_disruptionRate;
}

double 
DisruptionModel::GetRecoveryThreshold () const
{
  return (m_errorRate + m_disruptionRate) / 2.0;
}

int64_t 
DisruptionModel::AssignStreams (int64_t stream)
{
  NS_LOG_FUNCTION (this << stream);
  m_rng->SetStream (stream);
  return 1;
}

std::string 
DisruptionModel::GetStats () const
{
  std::stringstream ss;
  
  ss << "DisruptionModel(";
  ss << "errorRate=" << m_errorRate;
  ss << ", disruptionRate=" << m_disruptionRate;
  ss << ", hopChecks=" << m_hopChecks;
  ss << ", disruptions=" << m_disruptions;
  ss << ", recoveryChecks=" << m_recoveryChecks;
  ss << ", recoveries=" << m_recoveries;
  ss << ", forced=" << m_forced.size ();
  ss << ")";
  
  return ss.str ();
}

} // namespace dtnrelay

} // namespace ns3
