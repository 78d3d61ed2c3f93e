#if !defined STATION_SOURCE_HPP
#define STATION_SOURCE_HPP

#include <string>
#include <vector>

// Something that can say which stations are associated with an interface right now
class StationSource
{
public:

    StationSource()
    {
    }

    virtual ~StationSource()
    {
    }

    // Fills stations with the MAC addresses currently associated with network_id, as reported;
    // returns false if the query failed
    virtual bool getStations(const std::string&        network_id,
                             std::vector<std::string>& stations) = 0;

private:

    StationSource(const StationSource&);
    StationSource& operator=(const StationSource&);
};

#endif
