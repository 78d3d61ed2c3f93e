#if !defined DEBOUNCE_SCHEDULER_HPP
#define DEBOUNCE_SCHEDULER_HPP

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "MembershipTable.hpp"

// Holds at most one delayed presence transition per device.  A transition is armed when a
// device's network set becomes non-empty or empty, and is cancelled if the opposite edge shows
// up before it fires.  All calls are expected to come from one thread; firing and cancelling
// therefore never overlap.
class DebounceScheduler
{
public:

    typedef std::chrono::steady_clock::time_point TimePoint;

    // Per-device state; ARRIVING and DEPARTING mean a timer with that target is armed
    enum State
    {
        IDLE,
        ARRIVING,
        DEPARTING
    };

    // A timer that has fired and should now be reported
    struct Transition
    {
        std::string device_id;

        // True for an arrival, false for a departure
        bool home;
    };

    // Throws std::runtime_error if a delay is negative or longer than getMaximumDelay()
    DebounceScheduler(const std::chrono::seconds& connect_delay,
                      const std::chrono::seconds& disconnect_delay);

    ~DebounceScheduler();

    // Arms or cancels the device's timer according to an edge reported by the membership table
    void handleEdge(const std::string&             device_id,
                    MembershipTable::EdgeCondition edge,
                    const TimePoint&               now);

    // Records a device already known to be home without announcing it, so that a quick
    // leave and rejoin isn't reported as a new arrival.  Ignored while a timer is armed.
    void markConfirmedHome(const std::string& device_id);

    // Fires, in deadline order, every timer due at or before now and appends them to fired
    void fireExpired(const TimePoint& now, std::vector<Transition>& fired);

    // Earliest deadline among armed timers; false if nothing is armed
    bool getNextDeadline(TimePoint& deadline) const;

    State getState(const std::string& device_id) const;

    bool isConfirmedHome(const std::string& device_id) const;

    // Number of armed timers
    unsigned int pendingCount() const;

    // Number of devices with an armed timer or a confirmed-home record
    unsigned int size() const;

    const std::chrono::seconds& getConnectDelay() const;
    const std::chrono::seconds& getDisconnectDelay() const;

    // Longest delay that can be added to a steady_clock time without overflowing it
    static std::chrono::seconds getMaximumDelay();

private:

    typedef std::multimap<TimePoint, std::string> TimerQueue;

    struct Record
    {
        Record();

        State state;

        // Whether the last fired transition for this device was an arrival
        bool confirmed_home;

        // Valid only while state isn't IDLE
        TimerQueue::iterator timer;
    };

    void arm(const std::string& device_id, Record& record, State target, const TimePoint& now);

    void cancel(Record& record);

    // Drops the device's record once it holds nothing worth remembering
    void collect(const std::string& device_id);

    std::chrono::seconds connect_delay;
    std::chrono::seconds disconnect_delay;

    std::map<std::string, Record> records;

    // Armed timers ordered by deadline; entries with equal deadlines stay in arming order
    TimerQueue timers;

    DebounceScheduler(const DebounceScheduler&);
    DebounceScheduler& operator=(const DebounceScheduler&);
};

#endif
