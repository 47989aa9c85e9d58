#include "http_server.hpp"
#include "api_v1.hpp"
#include "log.hpp"
#include "store.hpp"

#include <microhttpd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <strings.h> // strcasecmp
#include <thread>

static std::atomic<bool> g_running{ true };

static void handle_signal(int sig)
{
    (void)sig;
    g_running = false;
}

// ----------------- case-insensitive query helpers -----------------

struct QueryCIContext {
    const char *target;
    const char *value;
};

static MHD_Result query_arg_ci_iter(void *cls,
                                    enum MHD_ValueKind kind,
                                    const char *key,
                                    const char *val)
{
    (void)kind;

    QueryCIContext *ctx = static_cast<QueryCIContext *>(cls);
    if (!key || !val) {
        return MHD_YES;
    }

    if (strcasecmp(key, ctx->target) == 0) {
        ctx->value = val;
        return MHD_NO;
    }

    return MHD_YES;
}

// Value of a query parameter, case-insensitive name match, or nullptr.
static const char *get_query_value_ci(MHD_Connection *conn, const char *name)
{
    QueryCIContext ctx{ name, nullptr };
    MHD_get_connection_values(conn,
                              MHD_GET_ARGUMENT_KIND,
                              query_arg_ci_iter,
                              &ctx);
    return ctx.value;
}

// ----------------- reply_json -----------------

// Send a JSON response with full CORS headers
static MHD_Result reply_json(struct MHD_Connection *conn,
                             const std::string &body,
                             unsigned int status)
{
    struct MHD_Response *res = MHD_create_response_from_buffer(
        body.size(),
        (void *)body.c_str(),
        MHD_RESPMEM_MUST_COPY
    );
    if (!res) return MHD_NO;

    MHD_add_response_header(res, "Content-Type", "application/json");
    MHD_add_response_header(res, "Access-Control-Allow-Origin", "*");
    MHD_add_response_header(res, "Access-Control-Allow-Methods", "GET, OPTIONS");
    MHD_add_response_header(res, "Access-Control-Allow-Headers", "Content-Type");

    int q = MHD_queue_response(conn, status, res);
    MHD_destroy_response(res);

    return (q == MHD_YES) ? MHD_YES : MHD_NO;
}

static MHD_Result handle_request(void *cls,
                                 struct MHD_Connection *conn,
                                 const char *url,
                                 const char *method,
                                 const char *version,
                                 const char *upload_data,
                                 size_t *upload_data_size,
                                 void **con_cls)
{
    (void)version;
    (void)upload_data;
    (void)upload_data_size;
    (void)con_cls;

    const waterly::Store *store = static_cast<const waterly::Store *>(cls);

    api_v1::Reply reply = api_v1::handle(*store, url, method,
        [conn](const char *name) { return get_query_value_ci(conn, name); });

    return reply_json(conn, reply.body, reply.status);
}

int http_server::start_server(waterly::Store &store, int port)
{
    struct MHD_Daemon *daemon = MHD_start_daemon(
        MHD_USE_SELECT_INTERNALLY,
        port,
        nullptr,
        nullptr,
        &handle_request,
        &store,
        MHD_OPTION_END
    );

    if (!daemon) {
        waterly::Logger::error("failed to start HTTP server on port %d", port);
        return 1;
    }

    waterly::Logger::info("HTTP server running on port %d", port);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    waterly::Logger::info("shutting down HTTP server");
    MHD_stop_daemon(daemon);
    return 0;
}
