#if !defined MEMBERSHIP_TABLE_HPP
#define MEMBERSHIP_TABLE_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "MembershipEvent.hpp"

// Tracks, per device, the set of monitored networks it is currently joined to.  A device with
// no networks has no entry.
class MembershipTable
{
public:

    // What applying an event did to the size of a device's network set
    enum EdgeCondition
    {
        NONE,
        BECAME_NONEMPTY,
        BECAME_EMPTY
    };

    MembershipTable();
    ~MembershipTable();

    // Adds or removes the event's network from the device's set.  Removing a network the device
    // isn't joined to is a no-op.
    EdgeCondition apply(const MembershipEvent& event);

    // Is the device joined to at least one network?
    bool isPresent(const std::string& device_id) const;

    void getNetworks(const std::string& device_id, std::set<std::string>& networks) const;

    void getDevices(std::vector<std::string>& devices) const;

    unsigned int size() const;

    void clear();

private:

    std::map<std::string, std::set<std::string> > memberships;
};

#endif
