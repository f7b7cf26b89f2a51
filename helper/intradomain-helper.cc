/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */

#include "intradomain-helper.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/simulator.h"

#include <utility>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("IntradomainHelper");

namespace
{

void
InitializeRouters(std::vector<Ptr<IntradomainRouter>> routers)
{
    for (auto& router : routers)
    {
        router->InitializeAlgorithm();
    }
}

void
RunTick(std::vector<Ptr<IntradomainRouter>> routers,
        Ptr<TickClock> clock,
        Ptr<UniformRandomVariable> order)
{
    NS_LOG_LOGIC("Tick " << clock->ReadTick() << " at " << Simulator::Now().As(Time::S));
    if (order && routers.size() > 1)
    {
        for (uint32_t i = routers.size() - 1; i > 0; i--)
        {
            uint32_t j = order->GetInteger(0, i);
            std::swap(routers[i], routers[j]);
        }
    }
    for (auto& router : routers)
    {
        router->RunOneTick();
    }
    clock->Advance();
}

void
PrintAll(std::vector<Ptr<IntradomainRouter>> routers, Ptr<OutputStreamWrapper> stream)
{
    for (const auto& router : routers)
    {
        router->PrintRoutingTable(stream);
    }
}

} // namespace

IntradomainHelper::IntradomainHelper()
    : m_tickInterval(Seconds(1)),
      m_randomTickOrder(false)
{
    m_routerFactory.SetTypeId("ns3::DvRouter");
    m_clock = CreateObject<TickClock>();
    m_tickOrder = CreateObject<UniformRandomVariable>();
}

void
IntradomainHelper::SetRouterType(std::string type)
{
    m_routerFactory.SetTypeId(type);
}

void
IntradomainHelper::Set(std::string name, const AttributeValue& value)
{
    m_routerFactory.Set(name, value);
}

void
IntradomainHelper::SetTickInterval(Time interval)
{
    NS_ABORT_MSG_IF(!interval.IsStrictlyPositive(), "tick interval must be positive");
    m_tickInterval = interval;
}

void
IntradomainHelper::SetRandomTickOrder(bool random)
{
    m_randomTickOrder = random;
}

int64_t
IntradomainHelper::AssignStreams(int64_t stream)
{
    m_tickOrder->SetStream(stream);
    return 1;
}

void
IntradomainHelper::Install(NodeContainer c)
{
    for (auto i = c.Begin(); i != c.End(); ++i)
    {
        Install(*i);
    }
}

Ptr<IntradomainRouter>
IntradomainHelper::Install(Ptr<Node> node)
{
    NS_ABORT_MSG_IF(node->GetObject<IntradomainRouter>(),
                    "Node " << node->GetId() << " already runs a router");
    NS_LOG_LOGIC("Adding " << m_routerFactory.GetTypeId().GetName() << " to node "
                           << node->GetId());
    Ptr<IntradomainRouter> router = m_routerFactory.Create<IntradomainRouter>();
    router->SetRouterId(node->GetId());
    router->SetClock(m_clock);
    node->AggregateObject(router);
    m_routers.push_back(router);
    return router;
}

void
IntradomainHelper::AddLink(Ptr<Node> a, Ptr<Node> b, uint32_t cost)
{
    Ptr<IntradomainRouter> ra = GetRouter(a);
    Ptr<IntradomainRouter> rb = GetRouter(b);
    ra->AddLink(rb, cost);
    rb->AddLink(ra, cost);
}

Ptr<IntradomainRouter>
IntradomainHelper::GetRouter(Ptr<Node> node)
{
    Ptr<IntradomainRouter> router = node->GetObject<IntradomainRouter>();
    NS_ABORT_MSG_IF(!router, "Node " << node->GetId() << " has no router installed");
    return router;
}

Ptr<TickClock>
IntradomainHelper::GetClock(void) const
{
    return m_clock;
}

void
IntradomainHelper::Schedule(uint32_t nTicks)
{
    NS_LOG_FUNCTION(this << nTicks);
    Ptr<UniformRandomVariable> order;
    if (m_randomTickOrder)
    {
        order = m_tickOrder;
    }
    Simulator::Schedule(Seconds(0), &InitializeRouters, m_routers);
    for (uint32_t k = 0; k < nTicks; k++)
    {
        Time at = TimeStep(m_tickInterval.GetTimeStep() * k);
        Simulator::Schedule(at, &RunTick, m_routers, m_clock, order);
    }
}

void
IntradomainHelper::PrintRoutingTableAllAt(Time printTime, Ptr<OutputStreamWrapper> stream) const
{
    Simulator::Schedule(printTime, &PrintAll, m_routers, stream);
}

} // namespace ns3
