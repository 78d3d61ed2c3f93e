#include <chrono>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "DebounceScheduler.hpp"

#include "MembershipTable.hpp"

//=============================================================================================
DebounceScheduler::Record::Record() :
    state(IDLE),
    confirmed_home(false)
{
}

//=============================================================================================
DebounceScheduler::DebounceScheduler(const std::chrono::seconds& connect_delay,
                                     const std::chrono::seconds& disconnect_delay) :
    connect_delay(connect_delay),
    disconnect_delay(disconnect_delay)
{
    if (connect_delay.count() < 0 || disconnect_delay.count() < 0)
    {
        throw std::runtime_error("Debounce delays must not be negative");
    }

    if (connect_delay > getMaximumDelay() || disconnect_delay > getMaximumDelay())
    {
        std::ostringstream error_stream;
        error_stream << "Debounce delays must not be longer than "
                     << getMaximumDelay().count() << " seconds";
        throw std::runtime_error(error_stream.str());
    }
}

//=============================================================================================
DebounceScheduler::~DebounceScheduler()
{
}

//=============================================================================================
// Arms or cancels timers in response to a membership edge
//=============================================================================================
void DebounceScheduler::handleEdge(const std::string&             device_id,
                                   MembershipTable::EdgeCondition edge,
                                   const TimePoint&               now)
{
    if (edge == MembershipTable::NONE)
    {
        return;
    }

    Record& record = records[device_id];

    if (edge == MembershipTable::BECAME_NONEMPTY)
    {
        if (record.state == DEPARTING)
        {
            cancel(record);
        }

        // A device still confirmed home only needed its departure called off; announcing an
        // arrival as well would be a duplicate
        if (record.state == IDLE && !record.confirmed_home)
        {
            arm(device_id, record, ARRIVING, now);
        }
    }
    else
    {
        if (record.state == ARRIVING)
        {
            cancel(record);
        }

        if (record.state == IDLE)
        {
            arm(device_id, record, DEPARTING, now);
        }
    }

    collect(device_id);
}

//=============================================================================================
void DebounceScheduler::markConfirmedHome(const std::string& device_id)
{
    Record& record = records[device_id];

    if (record.state == IDLE)
    {
        record.confirmed_home = true;
    }
}

//=============================================================================================
// Fires all timers that are due
//=============================================================================================
void DebounceScheduler::fireExpired(const TimePoint& now, std::vector<Transition>& fired)
{
    while (!timers.empty() && timers.begin()->first <= now)
    {
        // Removing the timer from the queue before anything else is what keeps a fired timer
        // from ever being cancelled afterwards, and vice versa
        std::string device_id = timers.begin()->second;
        timers.erase(timers.begin());

        std::map<std::string, Record>::iterator record = records.find(device_id);
        if (record == records.end() || record->second.state == IDLE)
        {
            continue;
        }

        Transition transition;
        transition.device_id = device_id;
        transition.home      = record->second.state == ARRIVING;

        record->second.state          = IDLE;
        record->second.confirmed_home = transition.home;

        fired.push_back(transition);

        collect(device_id);
    }
}

//=============================================================================================
bool DebounceScheduler::getNextDeadline(TimePoint& deadline) const
{
    if (timers.empty())
    {
        return false;
    }

    deadline = timers.begin()->first;
    return true;
}

//=============================================================================================
DebounceScheduler::State DebounceScheduler::getState(const std::string& device_id) const
{
    std::map<std::string, Record>::const_iterator record = records.find(device_id);
    if (record == records.end())
    {
        return IDLE;
    }

    return record->second.state;
}

//=============================================================================================
bool DebounceScheduler::isConfirmedHome(const std::string& device_id) const
{
    std::map<std::string, Record>::const_iterator record = records.find(device_id);
    return record != records.end() && record->second.confirmed_home;
}

//=============================================================================================
unsigned int DebounceScheduler::pendingCount() const
{
    return timers.size();
}

//=============================================================================================
unsigned int DebounceScheduler::size() const
{
    return records.size();
}

//=============================================================================================
const std::chrono::seconds& DebounceScheduler::getConnectDelay() const
{
    return connect_delay;
}

//=============================================================================================
const std::chrono::seconds& DebounceScheduler::getDisconnectDelay() const
{
    return disconnect_delay;
}

//=============================================================================================
// Half the clock's range leaves room for any now() this process will ever see
//=============================================================================================
std::chrono::seconds DebounceScheduler::getMaximumDelay()
{
    return std::chrono::seconds(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::duration::max()).count() / 2);
}

//=============================================================================================
void DebounceScheduler::arm(const std::string& device_id,
                            Record&            record,
                            State              target,
                            const TimePoint&   now)
{
    TimePoint deadline = now + (target == ARRIVING ? connect_delay : disconnect_delay);

    record.state = target;
    record.timer = timers.insert(std::make_pair(deadline, device_id));
}

//=============================================================================================
void DebounceScheduler::cancel(Record& record)
{
    if (record.state != IDLE)
    {
        timers.erase(record.timer);
        record.state = IDLE;
    }
}

//=============================================================================================
void DebounceScheduler::collect(const std::string& device_id)
{
    std::map<std::string, Record>::iterator record = records.find(device_id);
    if (record != records.end() &&
        record->second.state == IDLE &&
        !record->second.confirmed_home)
    {
        records.erase(record);
    }
}
