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

#include "lsa-table.h"

#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("LsaTable");

LsaTable::LsaTable()
    : m_lsas(),
      m_broadcasted()
{
    NS_LOG_FUNCTION(this);
}

LsaTable::~LsaTable()
{
    NS_LOG_FUNCTION(this);
}

bool
LsaTable::Install(RouterId originator, const LinkCostMap& lsa)
{
    NS_LOG_FUNCTION(this << originator << lsa.size());
    auto it = m_lsas.find(originator);
    if (it == m_lsas.end())
    {
        m_lsas.emplace(originator, lsa);
        m_broadcasted.emplace(originator, false);
        NS_LOG_LOGIC("New LSA from " << originator << " with " << lsa.size() << " links");
        return true;
    }
    it->second = lsa;
    return false;
}

bool
LsaTable::Lookup(RouterId originator, LinkCostMap& lsa) const
{
    auto it = m_lsas.find(originator);
    if (it == m_lsas.end())
    {
        return false;
    }
    lsa = it->second;
    return true;
}

bool
LsaTable::Contains(RouterId originator) const
{
    return m_lsas.find(originator) != m_lsas.end();
}

uint32_t
LsaTable::GetNLsas(void) const
{
    return m_lsas.size();
}

const LsaTable::LsaMap&
LsaTable::GetLsas(void) const
{
    return m_lsas;
}

bool
LsaTable::IsBroadcasted(RouterId originator) const
{
    auto it = m_broadcasted.find(originator);
    return it != m_broadcasted.end() && it->second;
}

void
LsaTable::MarkBroadcasted(RouterId originator)
{
    NS_LOG_FUNCTION(this << originator);
    m_broadcasted[originator] = true;
}

std::vector<RouterId>
LsaTable::GetPendingOriginators(void) const
{
    std::vector<RouterId> out;
    for (const auto& entry : m_lsas)
    {
        if (!IsBroadcasted(entry.first))
        {
            out.push_back(entry.first);
        }
    }
    return out;
}

void
LsaTable::Print(std::ostream& os) const
{
    os << "*** LsaTable Begin (<originator, flooded>: neighbor/cost ...) ***" << std::endl;
    for (const auto& entry : m_lsas)
    {
        os << "<" << entry.first << ", " << (IsBroadcasted(entry.first) ? "yes" : "no") << ">:";
        for (const auto& link : entry.second)
        {
            os << " " << link.first << "/" << link.second;
        }
        os << std::endl;
    }
    os << "*** LsaTable End ***";
}

std::ostream&
operator<<(std::ostream& os, const LsaTable& table)
{
    table.Print(os);
    return os;
}

} // namespace ns3
