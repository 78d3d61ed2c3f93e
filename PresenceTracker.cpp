#include <stdexcept>

#include "PresenceTracker.hpp"

#include "PresenceTrackerFactory.hpp"
#include "PresenceTrackerImpl.hpp"
#include "misc.hpp"

//=============================================================================================
PresenceTracker::PresenceTracker(int argc, char** argv) :
    presence_tracker_impl(0)
{
    presence_tracker_impl = PresenceTrackerFactory::createPresenceTracker(argc, argv);

    if (!presence_tracker_impl)
    {
        throw std::runtime_error("No PresenceTrackerImpl available for this platform");
    }
}

//=============================================================================================
PresenceTracker::~PresenceTracker()
{
    delete presence_tracker_impl;
}

//=============================================================================================
int PresenceTracker::run()
{
    IF_NULL_THROW_ELSE_RUN(presence_tracker_impl,
                           "No PresenceTrackerImpl available for this platform",
                           return presence_tracker_impl->run());
}
