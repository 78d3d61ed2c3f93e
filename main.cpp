#include <iostream>
#include <stdexcept>

#include "PresenceTracker.hpp"

int main(int argc, char** argv)
{
    try
    {
        PresenceTracker tracker(argc, argv);
        return tracker.run();
    }
    catch (std::runtime_error& ex)
    {
        std::cerr << "hapt: " << ex.what() << "\n";
        return 1;
    }
}
