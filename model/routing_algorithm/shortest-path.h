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

#ifndef SHORTEST_PATH_H
#define SHORTEST_PATH_H

#include "ns3/intradomain-router.h"
#include "ns3/lsa-table.h"

#include <map>

namespace ns3
{

/**
 * \ingroup intradomain
 *
 * \brief Result of a single-source shortest path computation.
 *
 * Only routers reached from the root appear in the maps.  The root has a
 * distance of zero and no predecessor.
 */
struct ShortestPathTree
{
    RouterId root;                            //!< source of the computation
    std::map<RouterId, PathCost> distance;    //!< cost from the root
    std::map<RouterId, RouterId> predecessor; //!< last hop before each router
};

/**
 * \brief Run Dijkstra's algorithm over the topology described by a set of LSAs.
 *
 * Vertices are the originators of the LSAs; edges are the links each LSA
 * lists toward another originator.  A link toward a router that did not
 * advertise anything is ignored.  Among routers at the same tentative
 * distance the choice is arbitrary.
 *
 * \param root the router doing the computation
 * \param lsas every known LSA, keyed by originator
 * \returns the shortest path tree rooted at root
 */
ShortestPathTree ComputeShortestPaths(RouterId root, const LsaTable::LsaMap& lsas);

/**
 * \brief Find the neighbor of the root on the path toward dst.
 *
 * Walks the predecessor chain backward from dst until it meets the root.
 * Asking for the root itself, for a router that was not reached, or
 * meeting a cycle in the chain aborts the simulation.
 *
 * \param tree a tree returned by ComputeShortestPaths ()
 * \param dst a destination reached by the tree, other than the root
 * \returns the next hop from the root toward dst
 */
RouterId GetNextHop(const ShortestPathTree& tree, RouterId dst);

/**
 * \brief Derive the next hop of every reached destination.
 *
 * The root maps to itself.
 *
 * \param tree a tree returned by ComputeShortestPaths ()
 * \returns destination to next hop
 */
ForwardingTable BuildForwardingTable(const ShortestPathTree& tree);

} // namespace ns3

#endif // SHORTEST_PATH_H
