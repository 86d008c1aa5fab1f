#include "log.hpp"

namespace redfa {

std::string_view Log::level2acro(Level level) {
    switch (level) {
        case Level::Error:
            return "E";
        case Level::Warn:
            return "W";
        case Level::Info:
            return "I";
        case Level::Verbose:
            return "V";
        case Level::Debug:
            return "D";
    }
    return "?";
}

}  // namespace redfa
