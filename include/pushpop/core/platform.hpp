#pragma once

#ifdef _WIN32
    #define PUSHPOP_PLATFORM_WINDOWS
#else
    #define PUSHPOP_PLATFORM_LINUX
    #include <pwd.h>
    #include <unistd.h>
#endif

#include <cstdlib>
#include <string>

namespace pushpop {

/**
 * @brief Name of the user running this process
 *
 * Used as the claimed identity in the X-PushPop-User header and in the
 * announcement TXT record. $USER wins, then the password database.
 * Returns an empty string when neither is available.
 */
inline std::string current_username() {
    if (const char* env = std::getenv("USER"); env != nullptr && *env != '\0') {
        return env;
    }
#ifdef PUSHPOP_PLATFORM_LINUX
    if (const passwd* pw = getpwuid(getuid()); pw != nullptr && pw->pw_name != nullptr) {
        return pw->pw_name;
    }
#else
    if (const char* env = std::getenv("USERNAME"); env != nullptr) {
        return env;
    }
#endif
    return {};
}

} // namespace pushpop
