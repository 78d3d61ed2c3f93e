#include <chrono>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "BootstrapReconciler.hpp"

#include "EventSourceAdapter.hpp"
#include "Log.hpp"
#include "MacAddress.hpp"
#include "MembershipEvent.hpp"
#include "MembershipTable.hpp"
#include "StationSource.hpp"

//=============================================================================================
BootstrapReconciler::BootstrapReconciler(StationSource&            station_source,
                                         const EventSourceAdapter& adapter,
                                         Log&                      log) :
    station_source(station_source),
    adapter(adapter),
    log(log)
{
}

//=============================================================================================
BootstrapReconciler::~BootstrapReconciler()
{
}

//=============================================================================================
// Gathers the stations currently associated with each network
//=============================================================================================
bool BootstrapReconciler::queryStations(
    const std::vector<std::string>&                 networks,
    std::map<std::string, std::set<std::string> >& observed)
{
    observed.clear();

    bool all_answered = true;

    for (std::vector<std::string>::const_iterator network = networks.begin();
         network != networks.end();
         ++network)
    {
        std::vector<std::string> stations;
        if (!station_source.getStations(*network, stations))
        {
            log.write("ERROR - Cannot list stations on " + *network);
            all_answered = false;
            continue;
        }

        // Even a network with nobody on it gets an entry; that's what marks it as answered
        std::set<std::string>& network_devices = observed[*network];

        for (std::vector<std::string>::const_iterator station = stations.begin();
             station != stations.end();
             ++station)
        {
            MacAddress mac_address;
            std::string device_id;
            if (!EventSourceAdapter::parseMacAddress(*station, mac_address, device_id))
            {
                log.write("ERROR - Ignoring unparseable station " + *station + " on " +
                          *network);
                continue;
            }

            if (adapter.isAllowed(mac_address))
            {
                network_devices.insert(device_id);
            }
        }
    }

    return all_answered;
}

//=============================================================================================
// Seeds the membership table from the live station lists
//=============================================================================================
bool BootstrapReconciler::reconcile(const std::vector<std::string>& networks,
                                    MembershipTable&                table,
                                    std::vector<std::string>&       seeded)
{
    seeded.clear();

    std::map<std::string, std::set<std::string> > observed;
    bool all_answered = queryStations(networks, observed);

    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();

    for (std::map<std::string, std::set<std::string> >::const_iterator network =
             observed.begin();
         network != observed.end();
         ++network)
    {
        for (std::set<std::string>::const_iterator device = network->second.begin();
             device != network->second.end();
             ++device)
        {
            MembershipEvent event;
            event.device_id  = *device;
            event.network_id = network->first;
            event.kind       = MembershipEvent::JOINED;
            event.timestamp  = now;

            // The edge is only collected here, never handed to the debounce scheduler
            if (table.apply(event) == MembershipTable::BECAME_NONEMPTY)
            {
                seeded.push_back(*device);
            }
        }
    }

    std::ostringstream message_stream;
    message_stream << "Found " << seeded.size() << " device(s) already connected on "
                   << observed.size() << " of " << networks.size() << " interface(s)";
    log.write(message_stream.str());

    return all_answered;
}
