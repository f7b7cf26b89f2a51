/*
 * Copyright (c) 2024 Pu Yang
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation;
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 * Authors: Pu Yang  <puyang@uvic.ca>
 */

#include "intradomain-router.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/trace-source-accessor.h"

#include <iomanip>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("IntradomainRouter");

NS_OBJECT_ENSURE_REGISTERED(IntradomainRouter);

TypeId
IntradomainRouter::GetTypeId(void)
{
    static TypeId tid =
        TypeId("ns3::IntradomainRouter")
            .SetParent<Object>()
            .SetGroupName("Intradomain")
            .AddTraceSource("RouteChange",
                            "A forwarding table entry was installed or replaced.",
                            MakeTraceSourceAccessor(&IntradomainRouter::m_routeChange),
                            "ns3::IntradomainRouter::RouteChangeTracedCallback");
    return tid;
}

IntradomainRouter::IntradomainRouter()
    : m_routerId(0)
{
    NS_LOG_FUNCTION(this);
}

IntradomainRouter::~IntradomainRouter()
{
    NS_LOG_FUNCTION(this);
}

void
IntradomainRouter::SetRouterId(RouterId id)
{
    NS_LOG_FUNCTION(this << id);
    m_routerId = id;
}

RouterId
IntradomainRouter::GetRouterId(void) const
{
    return m_routerId;
}

void
IntradomainRouter::SetClock(Ptr<TickClock> clock)
{
    NS_LOG_FUNCTION(this << clock);
    m_clock = clock;
}

Ptr<TickClock>
IntradomainRouter::GetClock(void) const
{
    return m_clock;
}

void
IntradomainRouter::AddLink(Ptr<IntradomainRouter> neighbor, uint32_t cost)
{
    NS_LOG_FUNCTION(this << neighbor << cost);
    NS_ABORT_MSG_IF(!neighbor, "Router " << m_routerId << ": link to a null neighbor");
    RouterId id = neighbor->GetRouterId();
    NS_ABORT_MSG_IF(id == m_routerId, "Router " << m_routerId << ": link to itself");

    if (m_links.find(id) == m_links.end())
    {
        m_neighbors.push_back(neighbor);
    }
    m_links[id] = cost;
    NS_LOG_LOGIC("Router " << m_routerId << " linked to " << id << " cost " << cost);
}

const LinkCostMap&
IntradomainRouter::GetLinks(void) const
{
    return m_links;
}

bool
IntradomainRouter::GetLinkCost(RouterId neighbor, uint32_t& cost) const
{
    auto it = m_links.find(neighbor);
    if (it == m_links.end())
    {
        return false;
    }
    cost = it->second;
    return true;
}

uint32_t
IntradomainRouter::GetNNeighbors(void) const
{
    return m_neighbors.size();
}

Ptr<IntradomainRouter>
IntradomainRouter::GetNeighbor(uint32_t i) const
{
    NS_ASSERT_MSG(i < m_neighbors.size(), "neighbor index " << i << " out of range");
    return m_neighbors[i];
}

const ForwardingTable&
IntradomainRouter::GetForwardingTable(void) const
{
    return m_fwdTable;
}

bool
IntradomainRouter::LookupNextHop(RouterId dst, RouterId& nextHop) const
{
    auto it = m_fwdTable.find(dst);
    if (it == m_fwdTable.end())
    {
        return false;
    }
    nextHop = it->second;
    return true;
}

uint32_t
IntradomainRouter::GetNRoutes(void) const
{
    return m_fwdTable.size();
}

void
IntradomainRouter::PrintRoutingTable(Ptr<OutputStreamWrapper> stream) const
{
    NS_LOG_FUNCTION(this << stream);
    std::ostream* os = stream->GetStream();
    // Copy the current ostream state
    std::ios oldState(nullptr);
    oldState.copyfmt(*os);

    *os << std::resetiosflags(std::ios::adjustfield) << std::setiosflags(std::ios::left);
    *os << "Router: " << m_routerId << ", Tick: " << (m_clock ? m_clock->ReadTick() : 0) << ", "
        << GetInstanceTypeId().GetName() << " forwarding table" << std::endl;
    *os << "  Destination  NextHop" << std::endl;
    for (const auto& entry : m_fwdTable)
    {
        *os << "  " << std::setw(13) << entry.first << std::setw(7) << entry.second << std::endl;
    }
    *os << std::endl;
    // Restore the previous ostream state
    (*os).copyfmt(oldState);
}

void
IntradomainRouter::DoDispose(void)
{
    NS_LOG_FUNCTION(this);
    // neighbors hold handles on each other
    m_neighbors.clear();
    m_clock = nullptr;
    Object::DoDispose();
}

void
IntradomainRouter::SetNextHop(RouterId dst, RouterId nextHop)
{
    NS_LOG_FUNCTION(this << dst << nextHop);
    m_fwdTable[dst] = nextHop;
    m_routeChange(dst, nextHop);
}

uint64_t
IntradomainRouter::ReadTick(void) const
{
    NS_ABORT_MSG_IF(!m_clock, "Router " << m_routerId << " has no clock attached");
    return m_clock->ReadTick();
}

} // namespace ns3
