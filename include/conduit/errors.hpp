#pragma once

#include <stdexcept>
#include <string>

namespace conduit {

    // Subprocess could not be spawned or failed its initial handshake
    class launch_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Lookup of a server name the registry has never started
    class not_found_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

}  // namespace conduit
