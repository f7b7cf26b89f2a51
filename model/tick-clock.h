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

#ifndef TICK_CLOCK_H
#define TICK_CLOCK_H

#include "ns3/object.h"

#include <stdint.h>

namespace ns3
{

/**
 * \ingroup intradomain
 *
 * \brief Logical clock shared by every router of a simulated domain.
 *
 * The clock only moves forward, one tick at a time, when the tick driver
 * says so.  Routers read it to decide which protocol phase they are in.
 */
class TickClock : public Object
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId(void);

    TickClock();
    ~TickClock() override;

    /**
     * \brief Read the current tick count.
     * \returns the number of ticks completed so far
     */
    uint64_t ReadTick(void) const;

    /**
     * \brief Move the clock to the next tick.
     */
    void Advance(void);

  private:
    uint64_t m_tick; //!< current tick
};

} // namespace ns3

#endif /* TICK_CLOCK_H */
