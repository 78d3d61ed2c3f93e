#if !defined PRESENCE_NOTIFIER_HPP
#define PRESENCE_NOTIFIER_HPP

#include <string>

// Relays a device's presence to whatever is keeping track of who is home
class PresenceNotifier
{
public:

    PresenceNotifier();
    virtual ~PresenceNotifier();

    // Reports the device as home or away right now.  A single best-effort attempt is made;
    // failures throw std::runtime_error describing the cause.
    virtual void notify(const std::string& device_id, bool home) = 0;

private:

    PresenceNotifier(const PresenceNotifier&);
    PresenceNotifier& operator=(const PresenceNotifier&);
};

#endif
