#include "app_config.hpp"

using namespace std::chrono_literals;

app::ServerConfig c;
c.host = "127.0.0.1";
c.port = 8080;
c.timeout = 30s;
c.plugins = {"reload", "trace"};
return c;
