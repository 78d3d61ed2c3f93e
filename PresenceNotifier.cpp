#include "PresenceNotifier.hpp"

//=============================================================================================
PresenceNotifier::PresenceNotifier()
{
}

//=============================================================================================
PresenceNotifier::~PresenceNotifier()
{
}
