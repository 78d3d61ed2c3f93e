#include <map>
#include <set>
#include <string>
#include <vector>

#include "MembershipTable.hpp"

#include "MembershipEvent.hpp"

//=============================================================================================
MembershipTable::MembershipTable()
{
}

//=============================================================================================
MembershipTable::~MembershipTable()
{
}

//=============================================================================================
// Applies a join or leave to the table and reports whether the device's set of networks just
// became non-empty or empty
//=============================================================================================
MembershipTable::EdgeCondition MembershipTable::apply(const MembershipEvent& event)
{
    std::map<std::string, std::set<std::string> >::iterator membership =
        memberships.find(event.device_id);

    if (event.kind == MembershipEvent::JOINED)
    {
        if (membership == memberships.end())
        {
            memberships[event.device_id].insert(event.network_id);
            return BECAME_NONEMPTY;
        }

        // Already present through some network; joining another one (or the same one again)
        // changes nothing about presence
        membership->second.insert(event.network_id);
        return NONE;
    }

    // Duplicate or out-of-order disconnects are possible, so leaving a network this device
    // isn't on is quietly ignored
    if (membership == memberships.end() || membership->second.erase(event.network_id) == 0)
    {
        return NONE;
    }

    if (membership->second.empty())
    {
        memberships.erase(membership);
        return BECAME_EMPTY;
    }

    return NONE;
}

//=============================================================================================
bool MembershipTable::isPresent(const std::string& device_id) const
{
    return memberships.find(device_id) != memberships.end();
}

//=============================================================================================
void MembershipTable::getNetworks(const std::string&     device_id,
                                  std::set<std::string>& networks) const
{
    networks.clear();

    std::map<std::string, std::set<std::string> >::const_iterator membership =
        memberships.find(device_id);
    if (membership != memberships.end())
    {
        networks = membership->second;
    }
}

//=============================================================================================
void MembershipTable::getDevices(std::vector<std::string>& devices) const
{
    devices.clear();

    for (std::map<std::string, std::set<std::string> >::const_iterator iter =
             memberships.begin();
         iter != memberships.end();
         ++iter)
    {
        devices.push_back(iter->first);
    }
}

//=============================================================================================
unsigned int MembershipTable::size() const
{
    return memberships.size();
}

//=============================================================================================
void MembershipTable::clear()
{
    memberships.clear();
}
