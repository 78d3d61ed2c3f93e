#if !defined PRESENCE_TRACKER_IMPL_HPP
#define PRESENCE_TRACKER_IMPL_HPP

#include "Program.hpp"

class PresenceTrackerImpl : public Program
{
public:

    friend class PresenceTracker;

    PresenceTrackerImpl(int argc, char** argv);
    virtual ~PresenceTrackerImpl();

    // Runs until shut down or until the event source is lost; returns the exit status
    virtual int run() = 0;
};

#endif
