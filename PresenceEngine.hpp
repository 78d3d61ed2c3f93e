#if !defined PRESENCE_ENGINE_HPP
#define PRESENCE_ENGINE_HPP

#include <chrono>
#include <string>
#include <vector>

#include "DebounceScheduler.hpp"
#include "MembershipTable.hpp"

class BootstrapReconciler;
class Log;
class PresenceNotifier;
struct MembershipEvent;

// Owns the membership table and debounce timers and turns membership events into presence
// notifications.  Not thread-safe; the caller's event loop is expected to be the only user.
class PresenceEngine
{
public:

    typedef std::chrono::steady_clock::time_point TimePoint;

    PresenceEngine(const std::chrono::seconds& connect_delay,
                   const std::chrono::seconds& disconnect_delay,
                   PresenceNotifier&           notifier,
                   Log&                        log);

    ~PresenceEngine();

    // Applies a live join or leave, arming or cancelling the device's debounce timer as needed
    void handleEvent(const MembershipEvent& event);

    // Reports every transition whose delay has run out.  Returns how many reports failed.
    unsigned int processExpired(const TimePoint& now);

    // When processExpired next has something to do; false if no timer is armed
    bool getNextDeadline(TimePoint& deadline) const;

    // Seeds the table with the stations already connected, without notifying anyone.  Devices
    // found present are listed in seeded.
    bool bootstrap(BootstrapReconciler&            reconciler,
                   const std::vector<std::string>& networks,
                   std::vector<std::string>&       seeded);

    // Brings the table in line with the live station lists, feeding every difference through
    // the normal event path so missed arrivals and departures still get announced
    bool resync(BootstrapReconciler&            reconciler,
                const std::vector<std::string>& networks,
                const TimePoint&                now);

    // Reports each listed device as home right away.  Returns how many reports failed.
    unsigned int announce(const std::vector<std::string>& devices);

    const MembershipTable& getMembershipTable() const;

    const DebounceScheduler& getScheduler() const;

private:

    bool sendNotification(const std::string& device_id, bool home);

    MembershipTable membership_table;

    DebounceScheduler scheduler;

    PresenceNotifier& notifier;

    Log& log;

    PresenceEngine(const PresenceEngine&);
    PresenceEngine& operator=(const PresenceEngine&);
};

#endif
