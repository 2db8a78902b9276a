#include "control_server.hpp"
#include "log.hpp"
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include <cstring>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

struct ConnInfo {
    std::string method;
    std::string url;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* /*upload_data*/, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url};
        *con_cls = ci;
        return MHD_YES;
    }
    // Request bodies are not used by any route.
    if (*upload_data_size) {
        *upload_data_size = 0;
        return MHD_YES;
    }

    auto* server = static_cast<ControlServer*>(cls);
    try {
        auto r = server->route(ci->method, ci->url, parse_query(connection));
        return send_response(connection, r.status, r.body);
    } catch (const std::exception& e) {
        log_error(std::string("Control request ") + ci->url + " failed: " + e.what());
        return send_response(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, json({{"error", e.what()}}).dump());
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static json mapping_json(const std::map<std::string, std::string>& subs) {
    json out = json::object();
    for (const auto& kv : subs) out[kv.first] = kv.second;
    return out;
}

ControlServer::ControlServer(IngestionAdapter& adapter) : adapter_(adapter) {}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::start(int port) {
    if (daemon_) return;
    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)port, nullptr, nullptr,
                               &handler, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        throw std::runtime_error("Failed to start HTTP control server on port " + std::to_string(port));
    }
    port_ = port;
    const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT);
    if (info && info->port) port_ = info->port;
    log_info("Control server listening on port " + std::to_string(port_));
}

void ControlServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
}

ControlServer::Response ControlServer::route(const std::string& method, const std::string& path,
                                             const std::map<std::string, std::string>& query) {
    if (method != "GET") {
        return {MHD_HTTP_METHOD_NOT_ALLOWED, json({{"error", "method not allowed"}}).dump()};
    }
    if (path == "/wis2/subscriptions/list") {
        return {MHD_HTTP_OK, mapping_json(adapter_.list_subscriptions()).dump()};
    }

    bool add = path == "/wis2/subscriptions/add";
    bool del = path == "/wis2/subscriptions/delete";
    if (!add && !del) {
        return {MHD_HTTP_NOT_FOUND, json({{"error", "not found"}}).dump()};
    }

    auto it = query.find("topic");
    if (it == query.end() || it->second.empty()) {
        return {MHD_HTTP_BAD_REQUEST, json({{"error", "No topic passed"}}).dump()};
    }
    const std::string& topic = it->second;

    if (add) {
        auto d = query.find("directory");
        std::string dir = d == query.end() ? std::string() : d->second;
        if (adapter_.add_subscription(topic, dir) == SubscribeStatus::InvalidDirectory) {
            return {MHD_HTTP_BAD_REQUEST, json({{"error", "directory does not exist or is not writable"}}).dump()};
        }
    } else {
        adapter_.delete_subscription(topic);
    }
    return {MHD_HTTP_OK, mapping_json(adapter_.list_subscriptions()).dump()};
}
