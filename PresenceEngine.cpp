#include <chrono>
#include <exception>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "PresenceEngine.hpp"

#include "BootstrapReconciler.hpp"
#include "DebounceScheduler.hpp"
#include "Log.hpp"
#include "MembershipEvent.hpp"
#include "MembershipTable.hpp"
#include "PresenceNotifier.hpp"

//=============================================================================================
PresenceEngine::PresenceEngine(const std::chrono::seconds& connect_delay,
                               const std::chrono::seconds& disconnect_delay,
                               PresenceNotifier&           notifier,
                               Log&                        log) :
    scheduler(connect_delay, disconnect_delay),
    notifier(notifier),
    log(log)
{
}

//=============================================================================================
PresenceEngine::~PresenceEngine()
{
}

//=============================================================================================
// Table first, then the scheduler; only the first join and the last leave reach the scheduler
//=============================================================================================
void PresenceEngine::handleEvent(const MembershipEvent& event)
{
    MembershipTable::EdgeCondition edge = membership_table.apply(event);

    std::set<std::string> networks;
    membership_table.getNetworks(event.device_id, networks);

    std::ostringstream message_stream;
    message_stream << (event.kind == MembershipEvent::JOINED ? "Connect" : "Disconnect")
                   << " of " << event.device_id << " on " << event.network_id
                   << ", now connected to:";
    for (std::set<std::string>::const_iterator network = networks.begin();
         network != networks.end();
         ++network)
    {
        message_stream << " " << *network;
    }
    if (networks.empty())
    {
        message_stream << " nothing";
    }
    log.write(message_stream.str());

    scheduler.handleEdge(event.device_id, edge, event.timestamp);
}

//=============================================================================================
unsigned int PresenceEngine::processExpired(const TimePoint& now)
{
    std::vector<DebounceScheduler::Transition> fired;
    scheduler.fireExpired(now, fired);

    unsigned int failures = 0;
    for (std::vector<DebounceScheduler::Transition>::const_iterator transition = fired.begin();
         transition != fired.end();
         ++transition)
    {
        if (!sendNotification(transition->device_id, transition->home))
        {
            failures++;
        }
    }

    return failures;
}

//=============================================================================================
bool PresenceEngine::getNextDeadline(TimePoint& deadline) const
{
    return scheduler.getNextDeadline(deadline);
}

//=============================================================================================
bool PresenceEngine::bootstrap(BootstrapReconciler&            reconciler,
                               const std::vector<std::string>& networks,
                               std::vector<std::string>&       seeded)
{
    bool all_answered = reconciler.reconcile(networks, membership_table, seeded);

    // Whoever was already connected is treated as announced
    for (std::vector<std::string>::const_iterator device = seeded.begin();
         device != seeded.end();
         ++device)
    {
        scheduler.markConfirmedHome(*device);
    }

    return all_answered;
}

//=============================================================================================
// Compares the table against what hostapd reports now
//=============================================================================================
bool PresenceEngine::resync(BootstrapReconciler&            reconciler,
                            const std::vector<std::string>& networks,
                            const TimePoint&                now)
{
    std::map<std::string, std::set<std::string> > observed;
    bool all_answered = reconciler.queryStations(networks, observed);

    std::vector<MembershipEvent> joins;
    std::vector<MembershipEvent> leaves;

    std::vector<std::string> devices;
    membership_table.getDevices(devices);

    for (std::vector<std::string>::const_iterator device = devices.begin();
         device != devices.end();
         ++device)
    {
        std::set<std::string> networks_joined;
        membership_table.getNetworks(*device, networks_joined);

        for (std::set<std::string>::const_iterator network = networks_joined.begin();
             network != networks_joined.end();
             ++network)
        {
            // Networks that didn't answer tell us nothing
            std::map<std::string, std::set<std::string> >::const_iterator stations =
                observed.find(*network);
            if (stations != observed.end() &&
                stations->second.find(*device) == stations->second.end())
            {
                MembershipEvent event;
                event.device_id  = *device;
                event.network_id = *network;
                event.kind       = MembershipEvent::LEFT;
                event.timestamp  = now;
                leaves.push_back(event);
            }
        }
    }

    for (std::map<std::string, std::set<std::string> >::const_iterator stations =
             observed.begin();
         stations != observed.end();
         ++stations)
    {
        for (std::set<std::string>::const_iterator device = stations->second.begin();
             device != stations->second.end();
             ++device)
        {
            MembershipEvent event;
            event.device_id  = *device;
            event.network_id = stations->first;
            event.kind       = MembershipEvent::JOINED;
            event.timestamp  = now;
            joins.push_back(event);
        }
    }

    // Joins first so a device that merely switched networks never passes through empty
    for (std::vector<MembershipEvent>::const_iterator event = joins.begin();
         event != joins.end();
         ++event)
    {
        std::set<std::string> networks_joined;
        membership_table.getNetworks(event->device_id, networks_joined);
        if (networks_joined.find(event->network_id) == networks_joined.end())
        {
            handleEvent(*event);
        }
    }

    for (std::vector<MembershipEvent>::const_iterator event = leaves.begin();
         event != leaves.end();
         ++event)
    {
        handleEvent(*event);
    }

    std::ostringstream message_stream;
    message_stream << "Resynchronized: " << joins.size() << " station(s) connected, "
                   << leaves.size() << " missed disconnect(s)";
    log.write(message_stream.str());

    return all_answered;
}

//=============================================================================================
unsigned int PresenceEngine::announce(const std::vector<std::string>& devices)
{
    unsigned int failures = 0;
    for (std::vector<std::string>::const_iterator device = devices.begin();
         device != devices.end();
         ++device)
    {
        if (!sendNotification(*device, true))
        {
            failures++;
        }
    }

    return failures;
}

//=============================================================================================
const MembershipTable& PresenceEngine::getMembershipTable() const
{
    return membership_table;
}

//=============================================================================================
const DebounceScheduler& PresenceEngine::getScheduler() const
{
    return scheduler;
}

//=============================================================================================
// A failed report is logged and dropped; the device's next transition will try again
//=============================================================================================
bool PresenceEngine::sendNotification(const std::string& device_id, bool home)
{
    const char* state_name = home ? "home" : "away";

    try
    {
        notifier.notify(device_id, home);
    }
    catch (std::exception& ex)
    {
        log.write(std::string("ERROR - Cannot report ") + device_id + " as " + state_name +
                  ": " + ex.what());
        return false;
    }

    log.write("Reported " + device_id + " as " + state_name);
    return true;
}
