#if !defined PRESENCE_TRACKER_HPP
#define PRESENCE_TRACKER_HPP

class PresenceTrackerImpl;

// Wireless presence tracker; reports devices associating with and leaving local access points
// to Home Assistant
class PresenceTracker
{
public:

    // Reads configuration and prepares to run; throws std::runtime_error if it can't
    PresenceTracker(int argc, char** argv);

    ~PresenceTracker();

    // Runs one-shot or monitor mode as requested on the command line and returns the exit
    // status
    int run();

private:

    PresenceTrackerImpl* presence_tracker_impl;

    PresenceTracker(const PresenceTracker&);
    PresenceTracker& operator=(const PresenceTracker&);
};

#endif
