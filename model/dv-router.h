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

#ifndef DV_ROUTER_H
#define DV_ROUTER_H

#include "ns3/intradomain-router.h"
#include "ns3/traced-callback.h"

#include <map>
#include <stdint.h>

namespace ns3
{

/**
 * \ingroup intradomain
 *
 * \brief Bellman-Ford distance-vector router.
 *
 * The router keeps its best known distance to every destination it has
 * heard of.  A destination missing from the vector is at infinite distance.
 * Whenever the vector changed since the last tick, the whole vector is sent
 * to every neighbor, which relaxes its own vector against it.  Distances
 * never increase, so the routers settle on a fixed point that does not
 * depend on the order in which advertisements are delivered.
 */
class DvRouter : public IntradomainRouter
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId(void);

    DvRouter();
    ~DvRouter() override;

    /// Destination id to best known cost
    typedef std::map<RouterId, PathCost> DistanceVector;

    /// Cost reported for a destination that was not known before
    static constexpr PathCost INFINITE_COST = 0xffffffffffffffffULL;

    /**
     * TracedCallback signature for sent advertisements.
     *
     * \param [in] from the advertising router
     * \param [in] to the neighbor receiving the vector
     */
    typedef void (*AdvertiseTracedCallback)(RouterId from, RouterId to);

    /**
     * TracedCallback signature for distance improvements.
     *
     * \param [in] dst the destination
     * \param [in] oldCost the previous cost, INFINITE_COST if dst was unknown
     * \param [in] newCost the improved cost
     */
    typedef void (*DistanceChangeTracedCallback)(RouterId dst,
                                                 PathCost oldCost,
                                                 PathCost newCost);

    /**
     * \brief Seed the vector with the router itself and its direct neighbors.
     *
     * The first tick after initialization always advertises.
     */
    void InitializeAlgorithm(void) override;

    /**
     * \brief Advertise the full vector to every neighbor if it changed since
     * the previous tick, then clear the change flag.
     */
    void RunOneTick(void) override;

    /**
     * \brief Relax the local vector against a neighbor's vector.
     *
     * Every destination of dvAdv is considered at the cost of the link to
     * advRouter plus the advertised cost.  Unknown destinations are adopted,
     * known ones are replaced only by a strictly cheaper cost.  Destinations
     * absent from dvAdv are left untouched.
     *
     * \param dvAdv the advertised vector
     * \param advRouter the neighbor that advertised it
     * \returns true if this advertisement changed the local vector
     */
    bool ProcessAdvertisement(const DistanceVector& dvAdv, RouterId advRouter);

    /**
     * \returns the current distance vector
     */
    const DistanceVector& GetDistanceVector(void) const;

    /**
     * \brief Get the best known cost to a destination.
     * \param dst the destination
     * \param cost receives the cost when dst is reachable
     * \returns true if dst has a finite known cost
     */
    bool GetDistance(RouterId dst, PathCost& cost) const;

    /**
     * \returns true if the vector changed since it was last advertised
     */
    bool HasPendingChange(void) const;

    void PrintRoutingTable(Ptr<OutputStreamWrapper> stream) const override;

  private:
    /**
     * \brief Deliver a vector to a neighbor.
     * \param neighbor the receiving router
     * \param dvAdv the vector
     * \param advRouter the router the vector belongs to
     */
    void Send(Ptr<DvRouter> neighbor, const DistanceVector& dvAdv, RouterId advRouter);

    DistanceVector m_dv;       //!< best known cost per destination
    bool m_dvChange;           //!< vector changed since the last advertisement
    bool m_accumulateChanges;  //!< keep the change flag across advertisements

    TracedCallback<RouterId, RouterId> m_advertiseTrace;                //!< sent vectors
    TracedCallback<RouterId, PathCost, PathCost> m_distanceChangeTrace; //!< improvements
};

} // namespace ns3

#endif /* DV_ROUTER_H */
