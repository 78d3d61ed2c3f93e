#if !defined RECORDING_NOTIFIER_HPP
#define RECORDING_NOTIFIER_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "PresenceNotifier.hpp"

// Remembers every notification instead of sending it anywhere; can be told to fail
class RecordingNotifier : public PresenceNotifier
{
public:

    struct Notification
    {
        std::string device_id;
        bool home;
    };

    RecordingNotifier() :
        fail_next(0),
        attempts(0)
    {
    }

    virtual ~RecordingNotifier()
    {
    }

    virtual void notify(const std::string& device_id, bool home)
    {
        attempts++;

        if (fail_next > 0)
        {
            fail_next--;
            throw std::runtime_error("connection refused");
        }

        Notification notification;
        notification.device_id = device_id;
        notification.home      = home;
        notifications.push_back(notification);
    }

    // Number of upcoming notify() calls that should fail
    unsigned int fail_next;

    // Every call, failed or not
    unsigned int attempts;

    // Successful calls only
    std::vector<Notification> notifications;
};

#endif
