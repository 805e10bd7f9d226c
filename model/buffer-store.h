#ifndef DTNRELAY_BUFFER_STORE_H
#define DTNRELAY_BUFFER_STORE_H

#include "ns3/object.h"
#include "ns3/ptr.h"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bundle.h"
#include "bundle-id.h"
#include "relay-codes.h"

namespace ns3 {

namespace dtnrelay {

/**
 * \ingroup dtnrelay
 * \brief Per-node bounded FIFO store of undelivered bundles
 *
 * Capacity is a hard cap on the number of bundles held by one node. A
 * bundle is held by at most one node at a time: storing it at a node
 * moves it out of any other node's buffer.
 */
class BufferStore : public Object
{
public:
  /**
   * \brief Get the type ID
   * \return Type ID
   */
  static TypeId GetTypeId ();
  
  /**
   * \brief Default constructor
   */
  BufferStore ();
  
  /**
   * \brief Destructor
   */
  virtual ~BufferStore ();
  
  /**
   * \brief Register a node so it appears in snapshots while empty
   * \param node Node identifier
   */
  void AddNode (const std::string& node);
  
  /**
   * \brief Append a bundle to a node's buffer
   * \param node Node identifier
   * \param bundle Bundle to store
   * \return BUFFER_FULL if the node is at capacity, NONE otherwise
   *         (including when the bundle is already stored there)
   */
  ErrorCode Store (const std::string& node, Ptr<Bundle> bundle);
  
  /**
   * \brief Remove a bundle from a node's buffer
   * \param node Node identifier
   * \param id Bundle ID
   * \return true if the bundle was removed, false if it was not there
   */
  bool Remove (const std::string& node, const BundleID& id);
  
  /**
   * \brief Check if a node holds a bundle
   * \param node Node identifier
   * \param id Bundle ID
   * \return true if the bundle is buffered at the node
   */
  bool Has (const std::string& node, const BundleID& id) const;
  
  /**
   * \brief Find the node holding a bundle
   * \param id Bundle ID
   * \return Node identifier or empty optional if not buffered anywhere
   */
  std::optional<std::string> Locate (const BundleID& id) const;
  
  /**
   * \brief Get the oldest bundle of a node without removing it
   * \param node Node identifier
   * \return Bundle or null if the buffer is empty
   */
  Ptr<Bundle> Peek (const std::string& node) const;
  
  /**
   * \brief Remove and return the oldest bundle of a node
   * \param node Node identifier
   * \return Bundle or null if the buffer is empty
   */
  Ptr<Bundle> Pop (const std::string& node);
  
  /**
   * \brief Get all bundles of a node in FIFO order
   * \param node Node identifier
   * \return Bundles, oldest first
   */
  std::vector<Ptr<Bundle>> GetAll (const std::string& node) const;
  
  uint32_t Count (const std::string& node) const;
  uint32_t GetTotalCount () const;
  bool IsFull (const std::string& node) const;
  
  void SetCapacity (uint32_t capacity);
  uint32_t GetCapacity () const;
  
  /**
   * \brief Get read-only occupancy counts
   * \return Bundle count per registered or used node
   */
  std::map<std::string, uint32_t> Snapshot () const;
  
  /**
   * \brief Get the highest occupancy observed at any node
   * \return Maximum bundle count
   */
  uint32_t GetPeakOccupancy () const;
  
  /**
   * \brief Get statistics
   * \return Statistics string
   */
  std::string GetStats () const;

protected:
  void DoDispose () override;

private:
  uint32_t m_capacity;                                          //!< Maximum bundles per node
  std::map<std::string, std::deque<Ptr<Bundle>>> m_buffers;     //!< FIFO per node
  std::unordered_map<BundleID, std::string> m_locations;        //!< Node holding each bundle
  uint32_t m_peakOccupancy;                                     //!< High-water mark
  uint64_t m_pushCount;                                         //!< Number of stored bundles
  uint64_t m_removeCount;                                       //!< Number of removed bundles
  uint64_t m_rejectCount;                                       //!< Number of BUFFER_FULL rejections
};

} // namespace dtnrelay

} // namespace ns3

#endif /* DTNRELAY_BUFFER_STORE_H */
