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

#include "ls-router.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/trace-source-accessor.h"
#include "ns3/uinteger.h"

#include <iomanip>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("LsRouter");

NS_OBJECT_ENSURE_REGISTERED(LsRouter);

TypeId
LsRouter::GetTypeId(void)
{
    static TypeId tid =
        TypeId("ns3::LsRouter")
            .SetParent<IntradomainRouter>()
            .SetGroupName("Intradomain")
            .AddConstructor<LsRouter>()
            .AddAttribute("BroadcastInterval",
                          "Tick at which flooding stops and routes are computed. It must be "
                          "long enough for every LSA to reach every router.",
                          UintegerValue(1000),
                          MakeUintegerAccessor(&LsRouter::m_broadcastInterval),
                          MakeUintegerChecker<uint64_t>())
            .AddTraceSource("LsaFlood",
                            "An LSA was sent to a neighbor.",
                            MakeTraceSourceAccessor(&LsRouter::m_lsaFloodTrace),
                            "ns3::LsRouter::LsaFloodTracedCallback")
            .AddTraceSource("RoutesComputed",
                            "The forwarding table was computed from the collected LSAs.",
                            MakeTraceSourceAccessor(&LsRouter::m_routesComputedTrace),
                            "ns3::LsRouter::RoutesComputedTracedCallback");
    return tid;
}

LsRouter::LsRouter()
    : m_broadcastComplete(false),
      m_routesComputed(false),
      m_broadcastInterval(1000),
      m_spt()
{
    NS_LOG_FUNCTION(this);
}

LsRouter::~LsRouter()
{
    NS_LOG_FUNCTION(this);
}

void
LsRouter::InitializeAlgorithm(void)
{
    NS_LOG_FUNCTION(this);
    m_lsaTable.Install(GetRouterId(), GetLinks());
    SetNextHop(GetRouterId(), GetRouterId());
}

void
LsRouter::RunOneTick(void)
{
    NS_LOG_FUNCTION(this);
    uint64_t now = ReadTick();
    if (now >= m_broadcastInterval && !m_routesComputed)
    {
        NS_LOG_INFO("Router " << GetRouterId() << " closes flooding at tick " << now << " with "
                              << m_lsaTable.GetNLsas() << " LSAs");
        m_broadcastComplete = true;
        ComputeRoutes();
        m_routesComputed = true;
        return;
    }
    else if (now < m_broadcastInterval)
    {
        FloodPendingLsas();
    }
}

void
LsRouter::FloodPendingLsas(void)
{
    NS_LOG_FUNCTION(this);
    for (RouterId originator : m_lsaTable.GetPendingOriginators())
    {
        LinkCostMap lsa;
        bool found = m_lsaTable.Lookup(originator, lsa);
        NS_ABORT_MSG_IF(!found, "pending LSA of " << originator << " vanished");
        for (uint32_t i = 0; i < GetNNeighbors(); i++)
        {
            Ptr<LsRouter> neighbor = DynamicCast<LsRouter>(GetNeighbor(i));
            NS_ABORT_MSG_IF(!neighbor,
                            "Router " << GetRouterId() << ": neighbor "
                                      << GetNeighbor(i)->GetRouterId()
                                      << " does not run link state");
            Send(neighbor, lsa, originator);
        }
        m_lsaTable.MarkBroadcasted(originator);
    }
}

void
LsRouter::Send(Ptr<LsRouter> neighbor, const LinkCostMap& lsa, RouterId originator)
{
    NS_LOG_FUNCTION(this << neighbor << originator);
    m_lsaFloodTrace(originator, neighbor->GetRouterId());
    neighbor->ReceiveLsa(originator, lsa);
}

void
LsRouter::ReceiveLsa(RouterId originator, const LinkCostMap& lsa)
{
    NS_LOG_FUNCTION(this << originator);
    if (m_lsaTable.Install(originator, lsa))
    {
        NS_LOG_LOGIC("Router " << GetRouterId() << " learned the LSA of " << originator);
    }
}

void
LsRouter::ComputeRoutes(void)
{
    NS_LOG_FUNCTION(this);
    m_spt = ComputeShortestPaths(GetRouterId(), m_lsaTable.GetLsas());
    ForwardingTable table = BuildForwardingTable(m_spt);
    for (const auto& entry : table)
    {
        if (entry.first != GetRouterId())
        {
            SetNextHop(entry.first, entry.second);
        }
    }
    NS_LOG_INFO("Router " << GetRouterId() << " computed " << table.size() << " routes");
    m_routesComputedTrace(GetNRoutes());
}

const LsaTable&
LsRouter::GetLsaTable(void) const
{
    return m_lsaTable;
}

bool
LsRouter::IsBroadcastComplete(void) const
{
    return m_broadcastComplete;
}

bool
LsRouter::AreRoutesComputed(void) const
{
    return m_routesComputed;
}

bool
LsRouter::GetDistance(RouterId dst, PathCost& cost) const
{
    if (!m_routesComputed)
    {
        return false;
    }
    auto it = m_spt.distance.find(dst);
    if (it == m_spt.distance.end())
    {
        return false;
    }
    cost = it->second;
    return true;
}

const ShortestPathTree&
LsRouter::GetShortestPathTree(void) const
{
    return m_spt;
}

void
LsRouter::PrintRoutingTable(Ptr<OutputStreamWrapper> stream) const
{
    NS_LOG_FUNCTION(this << stream);
    std::ostream* os = stream->GetStream();
    std::ios oldState(nullptr);
    oldState.copyfmt(*os);

    *os << std::resetiosflags(std::ios::adjustfield) << std::setiosflags(std::ios::left);
    *os << "Router: " << GetRouterId() << ", Tick: " << (GetClock() ? GetClock()->ReadTick() : 0)
        << ", LsRouter forwarding table (" << m_lsaTable.GetNLsas() << " LSAs"
        << (m_routesComputed ? "" : ", not computed yet") << ")" << std::endl;
    *os << "  Destination  NextHop  Cost" << std::endl;
    for (const auto& entry : GetForwardingTable())
    {
        *os << "  " << std::setw(13) << entry.first << std::setw(9) << entry.second;
        auto it = m_spt.distance.find(entry.first);
        if (it != m_spt.distance.end())
        {
            *os << it->second;
        }
        *os << std::endl;
    }
    *os << std::endl;
    (*os).copyfmt(oldState);
}

} // namespace ns3
