#include "PresenceTrackerImpl.hpp"

#include "Program.hpp"

//=============================================================================================
PresenceTrackerImpl::PresenceTrackerImpl(int argc, char** argv) :
    Program(argc, argv)
{
}

//=============================================================================================
PresenceTrackerImpl::~PresenceTrackerImpl()
{
}
