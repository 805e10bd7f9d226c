#ifndef DTNRELAY_DISRUPTION_MODEL_H
#define DTNRELAY_DISRUPTION_MODEL_H

#include "ns3/object.h"
#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"

#include <cstdint>
#include <set>
#include <string>

#include "topology-graph.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Stochastic per-hop disruption and recovery draws
 *
 * Each hop attempt draws one Bernoulli trial against ErrorRate and one
 * against DisruptionRate; either success disrupts the hop. A recovery
 * attempt succeeds when its draw exceeds the midpoint of the two rates.
 * The random source is a private stream, so runs are reproducible once
 * AssignStreams has been called.
 */
class DisruptionModel : public Object
{
public:
  /**
   * \brief Get the type ID
   * \return Type ID
   */
  static TypeId GetTypeId ();
  
  DisruptionModel ();
  virtual ~DisruptionModel ();
  
  /**
   * \brief Decide whether a hop attempt is disrupted
   * \param a Sending node
   * \param b Receiving node
   * \return true if the hop is disrupted
   */
  virtual bool CheckHop (const std::string& a, const std::string& b);
  
  /**
   * \brief Decide whether a disrupted link recovers on retry
   * \param a Sending node
   * \param b Receiving node
   * \return true if the link recovered
   */
  virtual bool CheckRecovery (const std::string& a, const std::string& b);
  
  /**
   * \brief Pin a link as disrupted on every draw; it never recovers
   * \param a One endpoint
   * \param b Other endpoint
   */
  void ForceDisruption (const std::string& a, const std::string& b);
  
  /**
   * \brief Release all pinned links
   */
  void ClearForcedDisruptions ();
  
  /**
   * \brief Check whether a link is pinned
   * \param a One endpoint
   * \param b Other endpoint
   * \return true if the link is pinned
   */
  bool IsForced (const std::string& a, const std::string& b) const;
  
  void SetErrorRate (double rate);
  double GetErrorRate () const;
  void SetDisruptionRate (double rate);
  double GetDisruptionRate () const;
  
  /**
   * \brief Get the recovery threshold
   * \return (ErrorRate + DisruptionRate) / 2
   */
  double GetRecoveryThreshold () const;
  
  /**
   * \brief Assign a fixed random variable stream number
   * \param stream First stream index to use
   * \return Number of streams assigned
   */
  int64_t AssignStreams (int64_t stream);
  
  /**
   * \brief Get statistics
   * \return Statistics string
   */
  std::string GetStats () const;

protected:
  void DoDispose () override;

private:
  double m_errorRate;                    //!< Probability of a transmission error per hop
  double m_disruptionRate;               //!< Probability of a link disruption per hop
  Ptr<UniformRandomVariable> m_rng;      //!< Private random source
  std::set<LinkKey> m_forced;            //!< Links disrupted on every draw
  
  uint64_t m_hopChecks;                  //!< Number of hop checks
  uint64_t m_disruptions;                //!< Number of disrupted hop checks
  uint64_t m_recoveryChecks;             //!< Number of recovery checks
  uint64_t m_recoveries;                 //!< Number of successful recoveries
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_DISRUPTION_MODEL_H */
