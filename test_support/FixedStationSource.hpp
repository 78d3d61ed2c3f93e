#if !defined FIXED_STATION_SOURCE_HPP
#define FIXED_STATION_SOURCE_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "StationSource.hpp"

// Answers station queries from a preset list; interfaces listed in failing don't answer
class FixedStationSource : public StationSource
{
public:

    FixedStationSource()
    {
    }

    virtual ~FixedStationSource()
    {
    }

    virtual bool getStations(const std::string&        network_id,
                             std::vector<std::string>& stations)
    {
        stations.clear();

        if (failing.find(network_id) != failing.end())
        {
            return false;
        }

        std::map<std::string, std::vector<std::string> >::const_iterator network =
            connected.find(network_id);
        if (network != connected.end())
        {
            stations = network->second;
        }

        return true;
    }

    std::map<std::string, std::vector<std::string> > connected;

    std::set<std::string> failing;
};

#endif
