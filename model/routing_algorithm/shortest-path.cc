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

#include "shortest-path.h"

#include "ns3/abort.h"
#include "ns3/log.h"

#include <functional>
#include <limits>
#include <queue>
#include <set>
#include <vector>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("ShortestPath");

namespace
{

/// Candidate vertex and its tentative distance from the root
struct Candidate
{
    PathCost distance;
    RouterId vertex;

    bool operator>(const Candidate& other) const
    {
        return distance > other.distance;
    }
};

} // namespace

ShortestPathTree
ComputeShortestPaths(RouterId root, const LsaTable::LsaMap& lsas)
{
    NS_LOG_FUNCTION(root << lsas.size());
    const PathCost infinity = std::numeric_limits<PathCost>::max();

    std::map<RouterId, PathCost> tentative;
    for (const auto& entry : lsas)
    {
        tentative[entry.first] = infinity;
    }
    tentative[root] = 0;

    ShortestPathTree tree;
    tree.root = root;

    std::set<RouterId> settled;
    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> candidates;
    candidates.push(Candidate{0, root});

    while (!candidates.empty())
    {
        Candidate v = candidates.top();
        candidates.pop();
        // a vertex may sit in the queue once per improvement, keep the first
        if (settled.count(v.vertex) || v.distance != tentative[v.vertex])
        {
            continue;
        }
        settled.insert(v.vertex);
        tree.distance[v.vertex] = v.distance;
        NS_LOG_LOGIC("Settled " << v.vertex << " at distance " << v.distance);

        auto lsa = lsas.find(v.vertex);
        if (lsa == lsas.end())
        {
            continue;
        }
        for (const auto& link : lsa->second)
        {
            RouterId w = link.first;
            auto best = tentative.find(w);
            if (best == tentative.end() || settled.count(w))
            {
                continue;
            }
            PathCost candidate = v.distance + link.second;
            if (candidate < best->second)
            {
                best->second = candidate;
                tree.predecessor[w] = v.vertex;
                candidates.push(Candidate{candidate, w});
            }
        }
    }
    return tree;
}

RouterId
GetNextHop(const ShortestPathTree& tree, RouterId dst)
{
    NS_LOG_FUNCTION(tree.root << dst);
    NS_ABORT_MSG_IF(dst == tree.root, "No next hop from router " << dst << " to itself");

    std::set<RouterId> visited;
    RouterId hop = dst;
    for (;;)
    {
        auto prev = tree.predecessor.find(hop);
        NS_ABORT_MSG_IF(prev == tree.predecessor.end(),
                        "Router " << hop << " has no predecessor toward " << tree.root);
        if (prev->second == tree.root)
        {
            return hop;
        }
        NS_ABORT_MSG_IF(!visited.insert(hop).second,
                        "Predecessor cycle through router " << hop << " toward " << dst);
        hop = prev->second;
    }
}

ForwardingTable
BuildForwardingTable(const ShortestPathTree& tree)
{
    NS_LOG_FUNCTION(tree.root);
    ForwardingTable table;
    table[tree.root] = tree.root;
    for (const auto& entry : tree.distance)
    {
        if (entry.first == tree.root)
        {
            continue;
        }
        table[entry.first] = GetNextHop(tree, entry.first);
    }
    return table;
}

} // namespace ns3
