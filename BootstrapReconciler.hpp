#if !defined BOOTSTRAP_RECONCILER_HPP
#define BOOTSTRAP_RECONCILER_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

class EventSourceAdapter;
class Log;
class MembershipTable;
class StationSource;

// Learns which stations are already associated when tracking starts, so devices that were home
// before the process started don't get announced as arriving
class BootstrapReconciler
{
public:

    BootstrapReconciler(StationSource&            station_source,
                        const EventSourceAdapter& adapter,
                        Log&                      log);

    ~BootstrapReconciler();

    // Queries every network and records the tracked stations found on each.  Networks whose
    // query failed are absent from observed.  Returns false if any query failed.
    bool queryStations(const std::vector<std::string>&                   networks,
                       std::map<std::string, std::set<std::string> >& observed);

    // Joins every tracked station found into the table directly.  No timer is armed for any of
    // them; devices that became present are listed in seeded.  Returns false if any query
    // failed, though the networks that did answer are still applied.
    bool reconcile(const std::vector<std::string>& networks,
                   MembershipTable&                table,
                   std::vector<std::string>&       seeded);

private:

    StationSource& station_source;

    const EventSourceAdapter& adapter;

    Log& log;

    BootstrapReconciler(const BootstrapReconciler&);
    BootstrapReconciler& operator=(const BootstrapReconciler&);
};

#endif
