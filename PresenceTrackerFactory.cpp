#include "PresenceTrackerFactory.hpp"

#if defined LINUX
#include "PosixPresenceTrackerImpl.hpp"
#endif

//=============================================================================================
PresenceTrackerImpl* PresenceTrackerFactory::createPresenceTracker(int argc, char** argv)
{
#if defined LINUX
    return new PosixPresenceTrackerImpl(argc, argv);
#else
    // hostapd control sockets only exist on Linux
    return 0;
#endif
}
