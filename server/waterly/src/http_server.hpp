#pragma once

namespace waterly {
class Store;
}

namespace http_server {

// Serves the read-only API until SIGINT or SIGTERM. Returns non-zero if the
// daemon could not be started.
int start_server(waterly::Store &store, int port);

}
