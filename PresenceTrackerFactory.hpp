#if !defined PRESENCE_TRACKER_FACTORY_HPP
#define PRESENCE_TRACKER_FACTORY_HPP

class PresenceTrackerImpl;

// Provides a platform-independent way of acquiring the platform-specific tracker.
class PresenceTrackerFactory
{
public:

    // Returns 0 if this platform has no tracker implementation
    static PresenceTrackerImpl* createPresenceTracker(int argc, char** argv);

private:

    // Disallowed, only static functions here
    PresenceTrackerFactory();
    ~PresenceTrackerFactory();

    PresenceTrackerFactory(const PresenceTrackerFactory&);
    PresenceTrackerFactory& operator=(const PresenceTrackerFactory&);
};

#endif
