#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "HostapdStationSource.hpp"

#include "HostapdControlSocket.hpp"
#include "Log.hpp"

//=============================================================================================
HostapdStationSource::HostapdStationSource(const std::string& control_directory, Log& log) :
    control_directory(control_directory),
    log(log)
{
}

//=============================================================================================
HostapdStationSource::~HostapdStationSource()
{
}

//=============================================================================================
// Walks the station list one entry at a time, as hostapd_cli's all_sta command does
//=============================================================================================
bool HostapdStationSource::getStations(const std::string&        network_id,
                                       std::vector<std::string>& stations)
{
    stations.clear();

    try
    {
        HostapdControlSocket control_socket(control_directory, network_id);

        std::string response;
        if (!control_socket.request("STA-FIRST", response))
        {
            log.write("ERROR - No response from hostapd on " + network_id + " to STA-FIRST");
            return false;
        }

        // Guards against a station list that loops back on itself
        std::set<std::string> seen;

        std::string station;
        while (parseStationReply(response, station) && seen.insert(station).second)
        {
            stations.push_back(station);

            if (!control_socket.request("STA-NEXT " + station, response))
            {
                log.write("ERROR - No response from hostapd on " + network_id +
                          " to STA-NEXT " + station);
                return false;
            }
        }
    }
    catch (std::runtime_error& ex)
    {
        log.write(std::string("ERROR - Cannot query stations: ") + ex.what());
        return false;
    }

    return true;
}

//=============================================================================================
// A station reply is the station's address on its own line followed by key=value lines; the
// end of the list is an empty reply or "FAIL"
//=============================================================================================
bool HostapdStationSource::parseStationReply(const std::string& response, std::string& station)
{
    std::string::size_type end_of_line = response.find('\n');
    std::string first_line = response.substr(0, end_of_line);

    if (first_line.empty() || first_line == "FAIL" || first_line.find('=') != std::string::npos)
    {
        return false;
    }

    station = first_line;
    return true;
}
