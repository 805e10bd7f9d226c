#include "buffer-store.h"
#include "ns3/log.h"
#include "ns3/uinteger.h"

#include <algorithm>
#include <sstream>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("BufferStore");

namespace dtnrelay {

NS_OBJECT_ENSURE_REGISTERED (BufferStore);

TypeId 
BufferStore::GetTypeId ()
{
  static TypeId tid = TypeId ("ns3::dtnrelay::BufferStore")
    .SetParent<Object> ()
    .SetGroupName ("DtnRelay")
    .AddConstructor<BufferStore> ()
    .AddAttribute ("Capacity",
                   "Maximum number of bundles buffered per node",
                   UintegerValue (10),
                   MakeUintegerAccessor (&BufferStore::SetCapacity,
                                         &BufferStore::GetCapacity),
                   MakeUintegerChecker<uint32_t> (1))
  ;
  return tid;
}

BufferStore::BufferStore ()
  : m_capacity (10),
    m_peakOccupancy (0),
    m_pushCount (0),
    m_removeCount (0),
    m_rejectCount (0)
{
  NS_LOG_FUNCTION (this);
}

BufferStore::~BufferStore ()
{
  NS_LOG_FUNCTION (this);
}

void 
BufferStore::DoDispose ()
{
  NS_LOG_FUNCTION (this);
  m_buffers.clear ();
  m_locations.clear ();
  Object::DoDispose ();
}

void 
BufferStore::AddNode (const std::string& node)
{
  m_buffers[node];
}

ErrorCode 
BufferStore::Store (const std::string& node, Ptr<Bundle> bundle)
{
  NS_LOG_FUNCTION (this << node << bundle);
  
  if (!bundle)
    {
      NS_LOG_ERROR ("Invalid bundle");
      return ErrorCode::CONFIG_ERROR;
    }
  
  const BundleID& id = bundle->GetId ();
  auto located = m_locations.find (id);
  if (located != m_locations.end () && located->second == node)
    {
      NS_LOG_WARN ("Bundle " << id.ToString () << " already buffered at " << node);
      return ErrorCode::NONE;
    }
  
  std::deque<Ptr<Bundle>>& queue = m_buffers[node];
  if (queue.size () >= m_capacity)
    {
      NS_LOG_WARN ("BufferFullError: " << node << " holds " << queue.size ()
                   << " of " << m_capacity << " bundles");
      m_rejectCount++;
      return ErrorCode::BUFFER_FULL;
    }
  
  if (located != m_locations.end ())
    {
      // Only one node may hold the bundle
      std::string previous = located->second;
      NS_LOG_INFO ("Moving bundle " << id.ToString () << " from " << previous
                   << " to " << node);
      Remove (previous, id);
    }
  
  queue.push_back (bundle);
  m_locations[id] = node;
  m_pushCount++;
  m_peakOccupancy = std::max (m_peakOccupancy, static_cast<uint32_t> (queue.size ()));
  
  NS_LOG_INFO ("Stored bundle " << id.ToString () << " at " << node
               << " (" << queue.size () << "/" << m_capacity << ")");
  return ErrorCode::NONE;
}

bool 
BufferStore::Remove (const std::string& node, const BundleID& id)
{
  NS_LOG_FUNCTION (this << node << id.ToString ());
  
  auto it = m_buffers.find (node);
  if (it == m_buffers.end ())
    {
      return false;
    }
  
  std::deque<Ptr<Bundle>>& queue = it->second;
  for (auto entry = queue.begin (); entry != queue.end (); ++entry)
    {
      if ((*entry)->GetId () == id)
        {
          queue.erase (entry);
          m_locations.erase (id);
          m_removeCount++;
          return true;
        }
    }
  
  return false;
}

bool 
BufferStore::Has (const std::string& node, const BundleID& id) const
{
  auto it = m_locations.find (id);
  return it != m_locations.end () && it->second == node;
}

std::optional<std::string> 
BufferStore::Locate (const BundleID& id) const
{
  auto it = m_locations.find (id);
  if (it == m_locations.end ())
    {
      return std::nullopt;
    }
  return it->second;
}

Ptr<Bundle> 
BufferStore::Peek (const std::string& node) const
{
  auto it = m_buffers.find (node);
  if (it == m_buffers.end () || it->second.empty ())
    {
      return nullptr;
    }
  return it->second.front ();
}

Ptr<Bundle> 
BufferStore::Pop (const std::string& node)
{
  NS_LOG_FUNCTION (this << node);
  
  Ptr<Bundle> bundle = Peek (node);
  if (bundle)
    {
      Remove (node, bundle->GetId ());
    }
  return bundle;
}

std::vector<Ptr<Bundle>> 
BufferStore::GetAll (const std::string& node) const
{
  auto it = m_buffers.find (node);
  if (it == m_buffers.end ())
    {
      return std::vector<Ptr<Bundle>> ();
    }
  return std::vector<Ptr<Bundle>> (it->second.begin (), it->second.end ());
}

uint32_t 
BufferStore::Count (const std::string& node) const
{
  auto it = m_buffers.find (node);
  if (it == m_buffers.end ())
    {
      return 0;
    }
  return static_cast<uint32_t> (it->second.size ());
}

uint32_t 
BufferStore::GetTotalCount () const
{
  return static_cast<uint32_t> (m_locations.size ());
}

bool 
BufferStore::IsFull (const std::string& node) const
{
  return Count (node) >= m_capacity;
}

void 
BufferStore::SetCapacity (uint32_t capacity)
{
  NS_LOG_FUNCTION (this << capacity);
  m_capacity = capacity;
}

uint32_t 
BufferStore::GetCapacity () const
{
  return m_capacity;
}

std::map<std::string, uint32_t> 
BufferStore::Snapshot () const
{
  std::map<std::string, uint32_t> occupancy;
  for (const auto& pair : m_buffers)
    {
      occupancy[pair.first] = static_cast<uint32_t> (pair.second.size ());
    }
  return occupancy;
}

uint32_t 
BufferStore::GetPeakOccupancy () const
{
  return m_peakOccupancy;
}

std::string 
BufferStore::GetStats () const
{
  std::stringstream ss;
  
  ss << "BufferStore(";
  ss << "count=" << m_locations.size ();
  ss << ", capacity=" << m_capacity;
  ss << ", pushed=" << m_pushCount;
  ss << ", removed=" << m_removeCount;
  ss << ", rejected=" << m_rejectCount;
  ss << ", peak=" << m_peakOccupancy;
  ss << ")";
  
  return ss.str ();
}

} // namespace dtnrelay

} // namespace ns3
