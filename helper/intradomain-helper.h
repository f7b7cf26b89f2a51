/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */

#ifndef INTRADOMAIN_HELPER_H
#define INTRADOMAIN_HELPER_H

#include "ns3/intradomain-router.h"
#include "ns3/node-container.h"
#include "ns3/node.h"
#include "ns3/nstime.h"
#include "ns3/object-factory.h"
#include "ns3/output-stream-wrapper.h"
#include "ns3/random-variable-stream.h"
#include "ns3/tick-clock.h"

#include <string>
#include <vector>

namespace ns3
{

/**
 * \ingroup intradomain
 *
 * \brief Build a domain of routers on top of a set of nodes and drive it
 * with a tick clock.
 *
 * One router is aggregated to every installed node, its id being the node
 * id.  All the routers of a helper share one TickClock.  Schedule () puts
 * the boot of every router at time zero, followed by one tick per tick
 * interval; during a tick each router runs once, then the clock advances.
 */
class IntradomainHelper
{
  public:
    /**
     * \brief Create a helper that installs ns3::DvRouter by default.
     */
    IntradomainHelper();

    /**
     * \param type the TypeId name of the router, e.g. "ns3::LsRouter"
     */
    void SetRouterType(std::string type);

    /**
     * \param name the name of the attribute to set
     * \param value the value of the attribute to set.
     *
     * This method controls the attributes of the routers created by
     * Install ().
     */
    void Set(std::string name, const AttributeValue& value);

    /**
     * \param interval simulated time between two ticks
     */
    void SetTickInterval(Time interval);

    /**
     * \param random when true the routers run in a new random order on every
     * tick; otherwise they run in installation order
     */
    void SetRandomTickOrder(bool random);

    /**
     * Assign a fixed random variable stream number to the random variable
     * that shuffles the tick order.
     *
     * \param stream first stream index to use
     * \return the number of stream indices assigned by this helper
     */
    int64_t AssignStreams(int64_t stream);

    /**
     * \brief Install a router on every node of a container.
     * \param c the nodes
     */
    void Install(NodeContainer c);

    /**
     * \brief Install a router on a node.
     * \param node the node
     * \returns the new router
     */
    Ptr<IntradomainRouter> Install(Ptr<Node> node);

    /**
     * \brief Connect the routers of two nodes with a link of the given cost
     * in both directions.
     * \param a first node
     * \param b second node
     * \param cost nonnegative link cost
     */
    void AddLink(Ptr<Node> a, Ptr<Node> b, uint32_t cost);

    /**
     * \param node a node with a router installed
     * \returns the router aggregated to node
     */
    static Ptr<IntradomainRouter> GetRouter(Ptr<Node> node);

    /**
     * \returns the clock shared by the routers of this helper
     */
    Ptr<TickClock> GetClock(void) const;

    /**
     * \brief Schedule the boot of every installed router followed by a
     * number of ticks.
     * \param nTicks the number of ticks to run
     */
    void Schedule(uint32_t nTicks);

    /**
     * \brief Print the forwarding table of every installed router at a
     * particular time.
     * \param printTime the time at which the tables are printed
     * \param stream the output stream
     */
    void PrintRoutingTableAllAt(Time printTime, Ptr<OutputStreamWrapper> stream) const;

  private:
    ObjectFactory m_routerFactory;                 //!< router factory
    Ptr<TickClock> m_clock;                        //!< shared clock
    std::vector<Ptr<IntradomainRouter>> m_routers; //!< installed routers
    Time m_tickInterval;                           //!< time between ticks
    bool m_randomTickOrder;                        //!< shuffle routers every tick
    Ptr<UniformRandomVariable> m_tickOrder;        //!< shuffling variable
};

} // namespace ns3

#endif /* INTRADOMAIN_HELPER_H */
