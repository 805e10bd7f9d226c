#ifndef DTNRELAY_RELAY_CODES_H
#define DTNRELAY_RELAY_CODES_H

#include <cstdint>
#include <string>

namespace ns3 {

namespace dtnrelay {

/**
 * \brief Error codes returned by operations that can fail for more than one reason
 */
enum class ErrorCode : uint8_t {
  NONE = 0,                        //!< Success
  CONFIG_ERROR = 1,                //!< Malformed topology or parameters
  UNKNOWN_LINK = 2,                //!< Queried node pair has no edge
  NO_PATH = 3,                     //!< No route exists in the topology
  BUFFER_FULL = 4                  //!< Node buffer at capacity
};

/**
 * \brief Convert error code to string
 * \param code Error code
 * \return String representation
 */
std::string ErrorCodeToString (ErrorCode code);

/**
 * \brief Terminal status of one simulation run
 */
enum class SimulationStatus : uint8_t {
  DELIVERED = 0,                   //!< Bundle reached its destination
  FAILED = 1                       //!< Bundle could not be delivered
};

/**
 * \brief Convert simulation status to string
 * \param status Simulation status
 * \return String representation
 */
std::string SimulationStatusToString (SimulationStatus status);

/**
 * \brief Reason attached to a terminal status
 */
enum class FailureReason : uint8_t {
  NONE = 0,                        //!< Delivered, no failure
  NO_PATH = 1,                     //!< No route from the current node
  EXHAUSTED = 2,                   //!< Retries and alternatives used up
  TIMEOUT = 3,                     //!< Logical time budget or lifetime exceeded
  CANCELLED = 4,                   //!< Cancellation signal raised
  CONFIG_ERROR = 5                 //!< Rejected before the run started
};

/**
 * \brief Convert failure reason to string
 * \param reason Failure reason
 * \return String representation
 */
std::string FailureReasonToString (FailureReason reason);

/**
 * \brief Status of one entry in the path attempt history
 */
enum class PathStatus : uint8_t {
  SELECTED = 0,                    //!< Initial path chosen at SelectPath
  REROUTED = 1,                    //!< Path switched in after a disruption
  FAILED = 2,                      //!< Path abandoned after retry exhaustion
  DELIVERED = 3                    //!< Path that carried the bundle to its destination
};

/**
 * \brief Convert path status to string
 * \param status Path status
 * \return String representation
 */
std::string PathStatusToString (PathStatus status);

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_RELAY_CODES_H */
