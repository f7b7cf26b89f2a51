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

#ifndef LS_ROUTER_H
#define LS_ROUTER_H

#include "ns3/intradomain-router.h"
#include "ns3/lsa-table.h"
#include "ns3/shortest-path.h"
#include "ns3/traced-callback.h"

#include <stdint.h>

namespace ns3
{

/**
 * \ingroup intradomain
 *
 * \brief Link-state router.
 *
 * The router goes through three phases:
 *
 * - Flooding, while the clock is below the broadcast interval.  On every
 *   tick each stored LSA that this router has not flooded yet is sent to
 *   every neighbor, once.  LSAs learned in the middle of the window are
 *   therefore still disseminated.
 * - Computing, on the first tick at or past the broadcast interval: one run
 *   of Dijkstra's algorithm over the collected LSAs fills the forwarding
 *   table.
 * - Converged, afterwards: ticks do nothing.
 *
 * The broadcast interval must be long enough for every LSA to reach every
 * router of the topology.
 */
class LsRouter : public IntradomainRouter
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId(void);

    LsRouter();
    ~LsRouter() override;

    /**
     * TracedCallback signature for flooded LSAs.
     *
     * \param [in] originator the router that originated the LSA
     * \param [in] neighbor the neighbor the LSA was sent to
     */
    typedef void (*LsaFloodTracedCallback)(RouterId originator, RouterId neighbor);

    /**
     * TracedCallback signature for the route computation.
     *
     * \param [in] nRoutes number of forwarding entries after the computation
     */
    typedef void (*RoutesComputedTracedCallback)(uint32_t nRoutes);

    /**
     * \brief Seed the LSA table with the router's own links and route to self.
     */
    void InitializeAlgorithm(void) override;

    void RunOneTick(void) override;

    /**
     * \brief Store an LSA delivered by a neighbor.
     *
     * Delivering the LSA of an originator that is already known is
     * harmless: the content of an LSA never changes.
     *
     * \param originator the router that originated the LSA
     * \param lsa the link costs of originator
     */
    void ReceiveLsa(RouterId originator, const LinkCostMap& lsa);

    /**
     * \returns the LSAs known to this router
     */
    const LsaTable& GetLsaTable(void) const;

    /**
     * \returns true once the flooding window has closed
     */
    bool IsBroadcastComplete(void) const;

    /**
     * \returns true once the forwarding table has been computed
     */
    bool AreRoutesComputed(void) const;

    /**
     * \brief Get the cost of the shortest path to a destination.
     * \param dst the destination
     * \param cost receives the cost when dst was reached
     * \returns true if routes are computed and dst is reachable
     */
    bool GetDistance(RouterId dst, PathCost& cost) const;

    /**
     * \returns the tree of the last route computation
     */
    const ShortestPathTree& GetShortestPathTree(void) const;

    void PrintRoutingTable(Ptr<OutputStreamWrapper> stream) const override;

  private:
    /**
     * \brief Flood every stored LSA not flooded yet.
     */
    void FloodPendingLsas(void);

    /**
     * \brief Run the shortest path computation and install the forwarding table.
     */
    void ComputeRoutes(void);

    /**
     * \brief Deliver an LSA to a neighbor.
     * \param neighbor the receiving router
     * \param lsa the LSA
     * \param originator the router that originated the LSA
     */
    void Send(Ptr<LsRouter> neighbor, const LinkCostMap& lsa, RouterId originator);

    LsaTable m_lsaTable;         //!< known LSAs and flooding state
    bool m_broadcastComplete;    //!< flooding window closed
    bool m_routesComputed;       //!< Dijkstra has run
    uint64_t m_broadcastInterval; //!< tick at which flooding stops
    ShortestPathTree m_spt;      //!< result of the route computation

    TracedCallback<RouterId, RouterId> m_lsaFloodTrace; //!< flooded LSAs
    TracedCallback<uint32_t> m_routesComputedTrace;     //!< route computation
};

} // namespace ns3

#endif /* LS_ROUTER_H */
