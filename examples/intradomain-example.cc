/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
#include "ns3/core-module.h"
#include "ns3/intradomain-module.h"
#include "ns3/network-module.h"
#include "ns3/topology-read-module.h"

#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>

using namespace ns3;

NS_LOG_COMPONENT_DEFINE("IntradomainExample");

/**
 * Follow the forwarding tables hop by hop from src to dst.
 *
 * \param routers router of every node id
 * \param src the source router
 * \param dst the destination router
 * \param cost receives the sum of the link costs along the walk
 * \returns true if dst was reached without a loop or a missing entry
 */
static bool
WalkRoute(const std::map<RouterId, Ptr<IntradomainRouter>>& routers,
          RouterId src,
          RouterId dst,
          PathCost& cost)
{
    std::set<RouterId> visited;
    RouterId at = src;
    cost = 0;
    while (at != dst)
    {
        if (!visited.insert(at).second)
        {
            return false;
        }
        RouterId next;
        uint32_t hopCost;
        Ptr<IntradomainRouter> router = routers.at(at);
        if (!router->LookupNextHop(dst, next) || !router->GetLinkCost(next, hopCost))
        {
            return false;
        }
        cost += hopCost;
        at = next;
    }
    return true;
}

/**
 * \param router a distance-vector or link-state router
 * \param dst the destination
 * \param cost receives the cost the router believes dst is at
 * \returns true if the router knows a cost to dst
 */
static bool
GetAdvertisedDistance(Ptr<IntradomainRouter> router, RouterId dst, PathCost& cost)
{
    Ptr<DvRouter> dv = DynamicCast<DvRouter>(router);
    if (dv)
    {
        return dv->GetDistance(dst, cost);
    }
    Ptr<LsRouter> ls = DynamicCast<LsRouter>(router);
    return ls && ls->GetDistance(dst, cost);
}

int
main(int argc, char* argv[])
{
    std::string protocol("dv");
    std::string topo("");
    std::string format("Inet");
    uint32_t ticks = 0;
    uint32_t broadcastInterval = 50;
    bool shuffle = false;
    bool verbose = false;

    CommandLine cmd(__FILE__);
    cmd.AddValue("protocol", "Routing protocol to run [dv|ls].", protocol);
    cmd.AddValue("topo", "Topology file; empty for the built-in topology.", topo);
    cmd.AddValue("format", "Format of the topology file [Orbis|Inet|Rocketfuel]; links without a weight cost 1.", format);
    cmd.AddValue("ticks", "Number of ticks to run; 0 picks a default.", ticks);
    cmd.AddValue("interval", "Link-state broadcast interval in ticks.", broadcastInterval);
    cmd.AddValue("shuffle", "Run the routers in a random order on every tick.", shuffle);
    cmd.AddValue("verbose", "Enable the logs of the routers.", verbose);
    cmd.Parse(argc, argv);

    if (verbose)
    {
        LogComponentEnable("DvRouter", LOG_LEVEL_INFO);
        LogComponentEnable("LsRouter", LOG_LEVEL_INFO);
    }

    IntradomainHelper domain;
    if (protocol == "dv")
    {
        domain.SetRouterType("ns3::DvRouter");
    }
    else if (protocol == "ls")
    {
        domain.SetRouterType("ns3::LsRouter");
        domain.Set("BroadcastInterval", UintegerValue(broadcastInterval));
    }
    else
    {
        NS_LOG_ERROR("Unknown protocol " << protocol);
        return -1;
    }
    domain.SetRandomTickOrder(shuffle);
    domain.AssignStreams(1);

    // ------------- Build the topology -------------
    NodeContainer nodes;
    if (!topo.empty())
    {
        TopologyReaderHelper topoHelp;
        topoHelp.SetFileName(topo);
        topoHelp.SetFileType(format);
        Ptr<TopologyReader> inFile = topoHelp.GetTopologyReader();
        if (inFile)
        {
            nodes = inFile->Read();
        }
        if (!inFile || inFile->LinksSize() == 0)
        {
            NS_LOG_ERROR("Problems reading the topology file. Failing.");
            return -1;
        }
        domain.Install(nodes);
        for (auto iter = inFile->LinksBegin(); iter != inFile->LinksEnd(); iter++)
        {
            // only the Inet reader sets a weight, other formats get unit costs
            uint32_t cost = 1;
            std::string weight;
            if (iter->GetAttributeFailSafe("Weight", weight))
            {
                std::stringstream ss(weight);
                if (!(ss >> cost))
                {
                    NS_LOG_WARN("Bad weight '" << weight << "' on link "
                                               << iter->GetFromNodeName() << " - "
                                               << iter->GetToNodeName() << ", using 1");
                    cost = 1;
                }
            }
            domain.AddLink(iter->GetFromNode(), iter->GetToNode(), cost);
        }
    }
    else
    {
        nodes.Create(5);
        domain.Install(nodes);
        domain.AddLink(nodes.Get(0), nodes.Get(1), 1);
        domain.AddLink(nodes.Get(1), nodes.Get(2), 1);
        domain.AddLink(nodes.Get(0), nodes.Get(2), 5);
        domain.AddLink(nodes.Get(2), nodes.Get(3), 2);
        domain.AddLink(nodes.Get(3), nodes.Get(4), 1);
        domain.AddLink(nodes.Get(1), nodes.Get(4), 7);
    }
    NS_LOG_INFO("Running " << protocol << " on " << nodes.GetN() << " routers");

    if (ticks == 0)
    {
        ticks = (protocol == "ls") ? broadcastInterval + 1 : 2 * nodes.GetN() + 2;
    }
    domain.Schedule(ticks);

    Ptr<OutputStreamWrapper> stream = Create<OutputStreamWrapper>(&std::cout);
    domain.PrintRoutingTableAllAt(Seconds(ticks), stream);

    Simulator::Stop(Seconds(ticks + 1));
    Simulator::Run();

    std::map<RouterId, Ptr<IntradomainRouter>> routers;
    for (auto i = nodes.Begin(); i != nodes.End(); ++i)
    {
        Ptr<IntradomainRouter> router = IntradomainHelper::GetRouter(*i);
        routers[router->GetRouterId()] = router;
    }
    uint32_t reached = 0;
    uint32_t broken = 0;
    for (const auto& src : routers)
    {
        for (const auto& entry : src.second->GetForwardingTable())
        {
            PathCost walked;
            PathCost expected = 0;
            bool known = GetAdvertisedDistance(src.second, entry.first, expected);
            if (!WalkRoute(routers, src.first, entry.first, walked))
            {
                std::cout << "Route " << src.first << " -> " << entry.first << " is broken"
                          << std::endl;
                broken++;
            }
            else if (!known || walked != expected)
            {
                std::cout << "Route " << src.first << " -> " << entry.first << " costs "
                          << walked << ", the router expects "
                          << (known ? std::to_string(expected) : std::string("nothing"))
                          << std::endl;
                broken++;
            }
            else
            {
                reached++;
            }
        }
    }
    std::cout << reached << " routes delivered at their cost, " << broken << " broken"
              << std::endl;

    Simulator::Destroy();
    return broken == 0 ? 0 : 1;
}
