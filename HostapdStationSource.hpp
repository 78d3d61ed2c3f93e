#if !defined HOSTAPD_STATION_SOURCE_HPP
#define HOSTAPD_STATION_SOURCE_HPP

#include <string>
#include <vector>

#include "StationSource.hpp"

class Log;

// Lists associated stations by walking hostapd's STA-FIRST/STA-NEXT commands
class HostapdStationSource : public StationSource
{
public:

    HostapdStationSource(const std::string& control_directory, Log& log);

    virtual ~HostapdStationSource();

    virtual bool getStations(const std::string&        network_id,
                             std::vector<std::string>& stations);

    // Pulls the station address off the first line of a STA-* reply; false if the reply
    // doesn't describe a station
    static bool parseStationReply(const std::string& response, std::string& station);

private:

    std::string control_directory;

    Log& log;
};

#endif
