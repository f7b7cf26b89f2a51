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

#include "tick-clock.h"

#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("TickClock");

NS_OBJECT_ENSURE_REGISTERED(TickClock);

TypeId
TickClock::GetTypeId(void)
{
    static TypeId tid = TypeId("ns3::TickClock")
                            .SetParent<Object>()
                            .SetGroupName("Intradomain")
                            .AddConstructor<TickClock>();
    return tid;
}

TickClock::TickClock()
    : m_tick(0)
{
    NS_LOG_FUNCTION(this);
}

TickClock::~TickClock()
{
    NS_LOG_FUNCTION(this);
}

uint64_t
TickClock::ReadTick(void) const
{
    return m_tick;
}

void
TickClock::Advance(void)
{
    NS_LOG_FUNCTION(this);
    m_tick++;
    NS_LOG_LOGIC("clock now at tick " << m_tick);
}

} // namespace ns3
