#include "../include/types.hpp"


namespace bitleech::tracker {


    const char* eventName(AnnounceEvent ev) noexcept {
        switch (ev) {
            case AnnounceEvent::started:   return "started";
            case AnnounceEvent::completed: return "completed";
            case AnnounceEvent::stopped:   return "stopped";
            case AnnounceEvent::none:      break;
        }
        return "none";
    }


} // namespace bitleech::tracker
