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

#ifndef INTRADOMAIN_ROUTER_H
#define INTRADOMAIN_ROUTER_H

#include "ns3/object.h"
#include "ns3/output-stream-wrapper.h"
#include "ns3/ptr.h"
#include "ns3/tick-clock.h"
#include "ns3/traced-callback.h"

#include <map>
#include <stdint.h>
#include <vector>

// Add a doxygen group for this module.
// If you have more than one file, this should be in only one of them.
/**
 * \defgroup intradomain Distance-vector and link-state routers driven by a
 * shared tick clock
 */

namespace ns3
{

/// Identity of a router inside a simulated domain
typedef uint32_t RouterId;

/// Neighbor (or destination) id to cost
typedef std::map<RouterId, uint32_t> LinkCostMap;

/// Sum of link costs along a path, wide enough for any path of uint32_t links
typedef uint64_t PathCost;

/// Destination id to next-hop id
typedef std::map<RouterId, RouterId> ForwardingTable;

/**
 * \ingroup intradomain
 *
 * \brief Common router record shared by the distance-vector and link-state
 * engines.
 *
 * A router knows its own identity, the cost of each of its direct links, a
 * handle to every neighbor, the shared tick clock and its forwarding table.
 * The concrete protocol fills the forwarding table in from
 * InitializeAlgorithm () and RunOneTick (), which the tick driver calls
 * exactly once at boot and exactly once per tick respectively.
 */
class IntradomainRouter : public Object
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId(void);

    IntradomainRouter();
    ~IntradomainRouter() override;

    /**
     * TracedCallback signature for forwarding table updates.
     *
     * \param [in] dst the destination whose entry changed
     * \param [in] nextHop the new next hop toward dst
     */
    typedef void (*RouteChangeTracedCallback)(RouterId dst, RouterId nextHop);

    /**
     * \brief Set the identity of this router.
     * \param id the router id
     */
    void SetRouterId(RouterId id);

    /**
     * \brief Get the identity of this router.
     * \returns the router id
     */
    RouterId GetRouterId(void) const;

    /**
     * \brief Attach the clock shared by the whole domain.
     * \param clock the tick clock
     */
    void SetClock(Ptr<TickClock> clock);

    /**
     * \returns the tick clock this router reads
     */
    Ptr<TickClock> GetClock(void) const;

    /**
     * \brief Record a direct link to a neighbor.
     *
     * Only one direction is recorded; the caller is responsible for adding
     * the reverse link on the neighbor.  Adding a link to an already known
     * neighbor replaces its cost.
     *
     * \param neighbor the router at the other end of the link
     * \param cost the nonnegative cost of the link
     */
    void AddLink(Ptr<IntradomainRouter> neighbor, uint32_t cost);

    /**
     * \returns the cost of every direct link, keyed by neighbor id
     */
    const LinkCostMap& GetLinks(void) const;

    /**
     * \brief Get the cost of the link to a neighbor.
     * \param neighbor the neighbor id
     * \param cost receives the link cost when the neighbor is known
     * \returns true if neighbor is a direct neighbor
     */
    bool GetLinkCost(RouterId neighbor, uint32_t& cost) const;

    /**
     * \returns the number of direct neighbors
     */
    uint32_t GetNNeighbors(void) const;

    /**
     * \param i index of the neighbor, in the order the links were added
     * \returns the i-th neighbor
     */
    Ptr<IntradomainRouter> GetNeighbor(uint32_t i) const;

    /**
     * \returns the forwarding table built so far
     */
    const ForwardingTable& GetForwardingTable(void) const;

    /**
     * \brief Look up the next hop toward a destination.
     * \param dst the destination router
     * \param nextHop receives the next hop when a route exists
     * \returns true if the forwarding table has an entry for dst
     */
    bool LookupNextHop(RouterId dst, RouterId& nextHop) const;

    /**
     * \returns the number of entries of the forwarding table, including the
     * entry of the router itself
     */
    uint32_t GetNRoutes(void) const;

    /**
     * \brief Populate the local view of the domain at boot.
     */
    virtual void InitializeAlgorithm(void) = 0;

    /**
     * \brief Perform the protocol work of one tick.
     */
    virtual void RunOneTick(void) = 0;

    /**
     * \brief Print the forwarding table.
     * \param stream the output stream
     */
    virtual void PrintRoutingTable(Ptr<OutputStreamWrapper> stream) const;

  protected:
    void DoDispose(void) override;

    /**
     * \brief Install or replace the forwarding entry of a destination.
     * \param dst the destination
     * \param nextHop the next hop toward dst
     */
    void SetNextHop(RouterId dst, RouterId nextHop);

    /**
     * \returns the current tick of the shared clock
     */
    uint64_t ReadTick(void) const;

  private:
    /**
     * \brief Router copy construction is disallowed.
     * \param r object to copy from
     */
    IntradomainRouter(const IntradomainRouter& r);

    /**
     * \brief Router assignment operator is disallowed.
     * \param r object to copy from
     * \returns the copied object
     */
    IntradomainRouter& operator=(const IntradomainRouter& r);

    RouterId m_routerId;                              //!< identity of this router
    Ptr<TickClock> m_clock;                           //!< shared clock
    LinkCostMap m_links;                              //!< neighbor id to link cost
    std::vector<Ptr<IntradomainRouter>> m_neighbors;  //!< neighbor handles
    ForwardingTable m_fwdTable;                       //!< destination to next hop
    TracedCallback<RouterId, RouterId> m_routeChange; //!< forwarding table trace
};

} // namespace ns3

#endif /* INTRADOMAIN_ROUTER_H */
