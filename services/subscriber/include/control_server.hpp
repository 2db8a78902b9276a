#pragma once
#include <map>
#include <string>

#include "ingest.hpp"

struct MHD_Daemon;

// HTTP control surface: /wis2/subscriptions/{list,add,delete}.
class ControlServer {
public:
    explicit ControlServer(IngestionAdapter& adapter);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Port 0 asks the OS for a free port. Throws std::runtime_error.
    void start(int port);
    void stop();
    int port() const { return port_; }

    struct Response {
        int status;
        std::string body;
    };
    // Routing without the HTTP layer; query holds decoded GET arguments.
    Response route(const std::string& method, const std::string& path,
                   const std::map<std::string, std::string>& query);

private:
    IngestionAdapter& adapter_;
    MHD_Daemon* daemon_{nullptr};
    int port_{0};
};
