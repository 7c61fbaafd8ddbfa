/*
 * Container engine availability probe - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/engine/engine_probe.hpp>
#include <dockstack/exec/command_executor.hpp>
#include <dockstack/util/log.hpp>
#include <curl/curl.h>
#include <mutex>

namespace dockstack {

std::optional<ComposeMode> parse_compose_mode(const std::string& s) {
    if (s == "auto") return ComposeMode::Auto;
    if (s == "plugin") return ComposeMode::Plugin;
    if (s == "standalone") return ComposeMode::Standalone;
    return std::nullopt;
}

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

static void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct HttpReply {
    bool ok = false;
    long code = 0;
    std::string body;
    std::string error;
};

static HttpReply unix_get(const std::string& socket_path, const std::string& path, std::chrono::milliseconds timeout) {
    HttpReply rep;
    CURL* curl = curl_easy_init();
    if (!curl) { rep.error = "curl_easy_init failed"; return rep; }
    std::string url = "http://localhost" + path;
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &rep.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    auto res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &rep.code);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) { rep.error = curl_easy_strerror(res); return rep; }
    if (rep.code / 100 != 2) { rep.error = "HTTP " + std::to_string(rep.code); return rep; }
    rep.ok = true;
    return rep;
}

std::string json_string_field(const std::string& body, const std::string& key) {
    std::string quoted = "\"" + key + "\"";
    size_t pos = body.find(quoted);
    if (pos == std::string::npos) return {};
    pos = body.find(':', pos + quoted.size());
    if (pos == std::string::npos) return {};
    ++pos;
    while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t' || body[pos] == '\n')) ++pos;
    if (pos >= body.size() || body[pos] != '"') return {};
    std::string text;
    bool esc = false;
    for (size_t i = pos + 1; i < body.size(); ++i) {
        char c = body[i];
        if (esc) { text.push_back(c == 'n' ? '\n' : c == 't' ? '\t' : c); esc = false; continue; }
        if (c == '\\') { esc = true; continue; }
        if (c == '"') break;
        text.push_back(c);
    }
    return text;
}

SocketProbe probe_engine_socket(const std::string& socket_path, std::chrono::milliseconds timeout) {
    ensure_curl_global();
    SocketProbe out;
    auto ping = unix_get(socket_path, "/_ping", timeout);
    if (!ping.ok) { out.error = socket_path + ": " + ping.error; return out; }
    out.reachable = true;
    auto ver = unix_get(socket_path, "/version", timeout);
    if (ver.ok) out.api_version = json_string_field(ver.body, "ApiVersion");
    else log_debug("engine /version failed: " + ver.error);
    return out;
}

EngineStatus EngineProbe::run(const EngineCli& cli, const ProbeSettings& settings, WorkerContext* ctx,
                              const CancellationFlag& cancel) {
    EngineStatus st;
    auto adopt = [ctx](std::shared_ptr<ChildProcess> c) { if (ctx) ctx->adopt(std::move(c)); };

    auto sock = probe_engine_socket(settings.socket_path, settings.timeout);
    if (sock.reachable) {
        st.available = true;
        st.api_version = sock.api_version;
        st.detail = "engine socket " + settings.socket_path;
    } else {
        log_info("engine socket unreachable (" + sock.error + "); trying " + display_command(cli.info()));
        auto cap = capture_output(cli.info(), cancel, adopt);
        if (cap.error) {
            st.detail = cap.error->message;
            return st;
        }
        if (cap.cancelled) { st.detail = "probe cancelled"; return st; }
        if (!cap.status.success()) {
            st.detail = "engine not running: " + describe(cap.status);
            return st;
        }
        st.available = true;
        st.detail = "engine reachable through " + display_command(cli.info());
    }

    switch (settings.compose_mode) {
        case ComposeMode::Plugin: st.compose_plugin = true; break;
        case ComposeMode::Standalone: st.compose_plugin = false; break;
        case ComposeMode::Auto: {
            auto cap = capture_output(cli.compose_version(), cancel, adopt);
            st.compose_plugin = !cap.error && !cap.cancelled && cap.status.success();
            break;
        }
    }
    st.detail += st.compose_plugin ? ", compose plugin" : ", standalone compose";
    return st;
}

std::optional<WorkerId> EngineProbe::start() {
    auto id = m_sup.launch("engine probe", CancellationFlag{},
        [events = m_events, cli = m_cli, settings = m_settings](WorkerContext& ctx) {
            events.send(run(cli, settings, &ctx, ctx.cancel()));
        });
    if (!id) m_events.send(ErrorEvent{ErrorKind::Rejected, "engine probe", "supervisor is shutting down"});
    return id;
}

} // namespace dockstack
