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

#include "dv-router.h"

#include "ns3/abort.h"
#include "ns3/boolean.h"
#include "ns3/log.h"
#include "ns3/trace-source-accessor.h"

#include <iomanip>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvRouter");

NS_OBJECT_ENSURE_REGISTERED(DvRouter);

TypeId
DvRouter::GetTypeId(void)
{
    static TypeId tid =
        TypeId("ns3::DvRouter")
            .SetParent<IntradomainRouter>()
            .SetGroupName("Intradomain")
            .AddConstructor<DvRouter>()
            .AddAttribute("AccumulateChanges",
                          "Set to true to keep the change flag raised until the next "
                          "advertisement; set to false to recompute it on every received "
                          "vector, so that a vector bringing no improvement clears it",
                          BooleanValue(true),
                          MakeBooleanAccessor(&DvRouter::m_accumulateChanges),
                          MakeBooleanChecker())
            .AddTraceSource("Advertise",
                            "The distance vector was sent to a neighbor.",
                            MakeTraceSourceAccessor(&DvRouter::m_advertiseTrace),
                            "ns3::DvRouter::AdvertiseTracedCallback")
            .AddTraceSource("DistanceChange",
                            "The cost to a destination improved.",
                            MakeTraceSourceAccessor(&DvRouter::m_distanceChangeTrace),
                            "ns3::DvRouter::DistanceChangeTracedCallback");
    return tid;
}

DvRouter::DvRouter()
    : m_dvChange(true),
      m_accumulateChanges(true)
{
    NS_LOG_FUNCTION(this);
}

DvRouter::~DvRouter()
{
    NS_LOG_FUNCTION(this);
}

void
DvRouter::InitializeAlgorithm(void)
{
    NS_LOG_FUNCTION(this);
    RouterId self = GetRouterId();
    for (const auto& link : GetLinks())
    {
        m_dv[link.first] = link.second;
        SetNextHop(link.first, link.first);
    }
    m_dv[self] = 0;
    SetNextHop(self, self);
    m_dvChange = true;
    NS_LOG_INFO("Router " << self << " booted with " << m_dv.size() << " known destinations");
}

void
DvRouter::RunOneTick(void)
{
    NS_LOG_FUNCTION(this);
    if (m_dvChange)
    {
        NS_LOG_LOGIC("Router " << GetRouterId() << " advertises its vector at tick " << ReadTick());
        for (uint32_t i = 0; i < GetNNeighbors(); i++)
        {
            Ptr<DvRouter> neighbor = DynamicCast<DvRouter>(GetNeighbor(i));
            NS_ABORT_MSG_IF(!neighbor,
                            "Router " << GetRouterId() << ": neighbor "
                                      << GetNeighbor(i)->GetRouterId()
                                      << " does not run distance vector");
            Send(neighbor, m_dv, GetRouterId());
        }
    }
    m_dvChange = false;
}

void
DvRouter::Send(Ptr<DvRouter> neighbor, const DistanceVector& dvAdv, RouterId advRouter)
{
    NS_LOG_FUNCTION(this << neighbor << advRouter);
    m_advertiseTrace(advRouter, neighbor->GetRouterId());
    neighbor->ProcessAdvertisement(dvAdv, advRouter);
}

bool
DvRouter::ProcessAdvertisement(const DistanceVector& dvAdv, RouterId advRouter)
{
    NS_LOG_FUNCTION(this << advRouter << dvAdv.size());
    if (!m_accumulateChanges)
    {
        m_dvChange = false;
    }

    uint32_t linkCost;
    if (!GetLinkCost(advRouter, linkCost))
    {
        NS_LOG_WARN("Router " << GetRouterId() << " ignores a vector from non-neighbor "
                              << advRouter);
        return false;
    }

    bool changed = false;
    for (const auto& adv : dvAdv)
    {
        RouterId dst = adv.first;
        if (adv.second >= INFINITE_COST - linkCost)
        {
            NS_LOG_WARN("Cost to " << dst << " via " << advRouter << " overflows, skipped");
            continue;
        }
        PathCost candidate = adv.second + linkCost;

        auto it = m_dv.find(dst);
        if (it != m_dv.end() && candidate >= it->second)
        {
            continue;
        }
        PathCost oldCost = (it == m_dv.end()) ? INFINITE_COST : it->second;
        NS_LOG_LOGIC("Router " << GetRouterId() << ": " << dst << " now " << candidate << " via "
                               << advRouter << " (was " << oldCost << ")");
        m_dv[dst] = candidate;
        SetNextHop(dst, advRouter);
        m_distanceChangeTrace(dst, oldCost, candidate);
        changed = true;
    }

    if (changed)
    {
        m_dvChange = true;
    }
    return changed;
}

const DvRouter::DistanceVector&
DvRouter::GetDistanceVector(void) const
{
    return m_dv;
}

bool
DvRouter::GetDistance(RouterId dst, PathCost& cost) const
{
    auto it = m_dv.find(dst);
    if (it == m_dv.end())
    {
        return false;
    }
    cost = it->second;
    return true;
}

bool
DvRouter::HasPendingChange(void) const
{
    return m_dvChange;
}

void
DvRouter::PrintRoutingTable(Ptr<OutputStreamWrapper> stream) const
{
    NS_LOG_FUNCTION(this << stream);
    std::ostream* os = stream->GetStream();
    std::ios oldState(nullptr);
    oldState.copyfmt(*os);

    *os << std::resetiosflags(std::ios::adjustfield) << std::setiosflags(std::ios::left);
    *os << "Router: " << GetRouterId() << ", Tick: " << (GetClock() ? GetClock()->ReadTick() : 0)
        << ", DvRouter forwarding table" << std::endl;
    *os << "  Destination  NextHop  Cost" << std::endl;
    for (const auto& entry : m_dv)
    {
        RouterId nextHop = 0;
        if (!LookupNextHop(entry.first, nextHop))
        {
            continue;
        }
        *os << "  " << std::setw(13) << entry.first << std::setw(9) << nextHop << entry.second
            << std::endl;
    }
    *os << std::endl;
    (*os).copyfmt(oldState);
}

} // namespace ns3
