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

#ifndef LSA_TABLE_H
#define LSA_TABLE_H

#include "ns3/intradomain-router.h"

#include <map>
#include <ostream>
#include <vector>

namespace ns3
{

/**
 * \ingroup intradomain
 *
 * \brief Link state advertisements known to one router, together with the
 * flooding bookkeeping of each of them.
 *
 * An LSA is the link-cost map of its originating router.  The table only
 * grows: once an originator is present its entry is never removed, and
 * installing the same originator again simply overwrites it with identical
 * content.
 */
class LsaTable
{
  public:
    /// Originator id to the link-cost map it advertised
    typedef std::map<RouterId, LinkCostMap> LsaMap;

    LsaTable();
    ~LsaTable();

    /**
     * \brief Store the LSA of an originator.
     * \param originator the router whose links are described
     * \param lsa the link costs of originator
     * \returns true if originator was not known before
     */
    bool Install(RouterId originator, const LinkCostMap& lsa);

    /**
     * \brief Get the LSA of an originator.
     * \param originator the originating router
     * \param lsa receives the LSA when present
     * \returns true if an LSA of originator is stored
     */
    bool Lookup(RouterId originator, LinkCostMap& lsa) const;

    /**
     * \param originator the originating router
     * \returns true if an LSA of originator is stored
     */
    bool Contains(RouterId originator) const;

    /**
     * \returns the number of stored LSAs
     */
    uint32_t GetNLsas(void) const;

    /**
     * \returns every stored LSA, keyed by originator
     */
    const LsaMap& GetLsas(void) const;

    /**
     * \param originator the originating router
     * \returns true if the LSA of originator was already flooded by this router
     */
    bool IsBroadcasted(RouterId originator) const;

    /**
     * \brief Remember that the LSA of originator has been flooded.
     * \param originator the originating router
     */
    void MarkBroadcasted(RouterId originator);

    /**
     * \returns the originators whose LSA is stored but not yet flooded, in
     * increasing id order
     */
    std::vector<RouterId> GetPendingOriginators(void) const;

    /**
     * \brief Print the table.
     * \param os the output stream
     */
    void Print(std::ostream& os) const;

  private:
    LsaMap m_lsas;                        //!< stored LSAs
    std::map<RouterId, bool> m_broadcasted; //!< flooding state per originator
};

/**
 * \brief Stream insertion operator.
 * \param os the reference to the output stream
 * \param table the LSA table
 * \returns the reference to the output stream
 */
std::ostream& operator<<(std::ostream& os, const LsaTable& table);

} // namespace ns3

#endif /* LSA_TABLE_H */
