/**
 * @file docker_engine.cpp
 * @brief DockerEngine implementation.
 */

#include "engine/docker_engine.hpp"

#include "engine/log_stream.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace codebox {

namespace {

using json = nlohmann::json;

/// Container ids travel inside request paths; accept only what the engine mints.
bool is_valid_container_id(std::string_view id) {
    if (id.empty() || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

Result<json> parse_body(std::string_view operation, const HttpResponse& response) {
    auto doc = json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::EngineUnavailable,
                     std::string(operation) + ": malformed JSON in engine response"};
    }
    return doc;
}

}  // anonymous namespace

Error engine_error(std::string_view operation, const HttpResponse& response) {
    std::string detail;
    auto doc = json::parse(response.body, nullptr, false);
    if (!doc.is_discarded() && doc.is_object() && doc.contains("message")
        && doc["message"].is_string()) {
        detail = doc["message"].get<std::string>();
    } else {
        detail = response.body.substr(0, 256);
    }

    // 5xx: engine or proxy unhealthy. 4xx: this request refused.
    auto code = response.status >= 500 ? ErrorCode::EngineUnavailable : ErrorCode::EngineRejected;
    return Error{code, std::string(operation) + " failed (HTTP "
                       + std::to_string(response.status) + "): " + detail};
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

DockerEngine::DockerEngine(HttpClient client, std::string api_version,
                           Duration request_timeout, Logger* logger)
    : client_(std::move(client))
    , api_prefix_(api_version.empty() ? std::string{} : "/" + api_version)
    , request_timeout_(request_timeout)
    , logger_(logger) {}

Result<std::unique_ptr<DockerEngine>> DockerEngine::from_config(const EngineConfig& config,
                                                                Logger* logger) {
    auto endpoint = HttpEndpoint::parse(config.endpoint);
    if (!endpoint) return endpoint.error();

    return std::make_unique<DockerEngine>(
        HttpClient{std::move(*endpoint), config.connect_timeout_ms},
        config.api_version,
        Duration{config.request_timeout_ms},
        logger);
}

std::string DockerEngine::target(std::string_view path) const {
    return api_prefix_ + std::string(path);
}

Result<HttpResponse> DockerEngine::call(std::string method, std::string_view path,
                                        std::string body, const BodySink& sink) {
    HttpRequest request;
    request.method = std::move(method);
    request.target = target(path);
    if (!body.empty()) {
        request.body = std::move(body);
        request.content_type = "application/json";
    }

    auto response = client_.send(request, request_timeout_, sink);
    if (!response && logger_ != nullptr) {
        logger_->debug("Engine call failed", {
            {"method", request.method},
            {"target", request.target},
            {"error", response.error().message}
        });
    }
    return response;
}

// ─────────────────────────────────────────────
// Allow-listed operations
// ─────────────────────────────────────────────

Result<void> DockerEngine::ping() {
    auto response = call("GET", "/_ping");
    if (!response) return response.error();
    if (response->status != 200) return engine_error("ping", *response);
    return {};
}

Result<std::vector<std::string>> DockerEngine::list_images() {
    auto response = call("GET", "/images/json");
    if (!response) return response.error();
    if (response->status != 200) return engine_error("list images", *response);

    auto doc = parse_body("list images", *response);
    if (!doc) return doc.error();
    if (!doc->is_array()) {
        return Error{ErrorCode::EngineUnavailable, "list images: expected a JSON array"};
    }

    std::vector<std::string> tags;
    for (const auto& image : *doc) {
        if (!image.is_object()) continue;
        auto it = image.find("RepoTags");
        if (it == image.end() || !it->is_array()) continue;  // untagged images carry null
        for (const auto& tag : *it) {
            if (tag.is_string()) tags.push_back(tag.get<std::string>());
        }
    }
    return tags;
}

Result<std::string> DockerEngine::build_create_body(const ContainerSpec& spec) {
    json tmpfs = json::object();
    for (const auto& [path, options] : spec.tmpfs) {
        tmpfs[path] = options;
    }

    std::string bind = spec.host_path.string() + ":" + spec.mount_path;
    if (spec.mount_read_only) bind += ":ro";

    json host_config = {
        {"Binds", json::array({bind})},
        {"Memory", spec.memory_bytes},
        {"MemorySwap", spec.memory_swap_bytes},
        {"NanoCpus", spec.nano_cpus},
        {"PidsLimit", spec.pids_limit},
        {"CapDrop", spec.cap_drop},
        {"SecurityOpt", spec.security_opt},
        {"ReadonlyRootfs", spec.read_only_rootfs},
        {"Tmpfs", tmpfs},
        {"AutoRemove", false},
        {"Privileged", false}
    };
    if (spec.network_disabled) {
        host_config["NetworkMode"] = "none";
    }

    json body = {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"WorkingDir", spec.working_dir},
        {"Labels", spec.labels},
        {"NetworkDisabled", spec.network_disabled},
        {"Tty", false},
        {"AttachStdin", spec.open_stdin},
        {"OpenStdin", spec.open_stdin},
        {"StdinOnce", spec.open_stdin},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"HostConfig", host_config}
    };
    if (!spec.user.empty()) {
        body["User"] = spec.user;
    }

    try {
        return body.dump();
    } catch (const json::type_error& e) {
        return Error{ErrorCode::InvalidRequest,
                     std::string("Container spec is not valid UTF-8: ") + e.what()};
    }
}

Result<ContainerId> DockerEngine::create(const ContainerSpec& spec) {
    auto payload = build_create_body(spec);
    if (!payload) return payload.error();

    auto response = call("POST", "/containers/create", std::move(*payload));
    if (!response) return response.error();
    if (response->status != 201 && response->status != 200) {
        return engine_error("create container", *response);
    }

    auto doc = parse_body("create container", *response);
    if (!doc) return doc.error();
    auto id = doc->value("Id", std::string{});
    if (!is_valid_container_id(id)) {
        return Error{ErrorCode::EngineUnavailable, "create container: response carries no usable Id"};
    }
    return ContainerId{id};
}

Result<void> DockerEngine::start(const ContainerId& id) {
    if (!is_valid_container_id(id)) {
        return Error{ErrorCode::InvalidRequest, "Invalid container id: " + id};
    }
    auto response = call("POST", "/containers/" + id + "/start");
    if (!response) return response.error();
    // 304: already started
    if (response->status != 204 && response->status != 304 && response->status != 200) {
        return engine_error("start container", *response);
    }
    return {};
}

Result<void> DockerEngine::write_stdin(const ContainerId& id, std::string_view data,
                                       Duration timeout) {
    if (!is_valid_container_id(id)) {
        return Error{ErrorCode::InvalidRequest, "Invalid container id: " + id};
    }

    HttpRequest request;
    request.method = "POST";
    request.target = target("/containers/" + id + "/attach?stream=1&stdin=1");

    // A program that never reads stdin must not hold the run past its budget.
    const auto budget = std::min(timeout, request_timeout_);
    const auto deadline = std::chrono::steady_clock::now() + budget;

    auto conn = client_.upgrade(request, budget);
    if (!conn) return conn.error();

    auto written = conn->write(data, deadline);
    conn->finish(std::min(deadline, std::chrono::steady_clock::now() + STDIN_DRAIN));
    return written;
}

Result<WaitStatus> DockerEngine::wait(const ContainerId& id, Duration timeout) {
    if (!is_valid_container_id(id)) {
        return Error{ErrorCode::InvalidRequest, "Invalid container id: " + id};
    }

    HttpRequest request;
    request.method = "POST";
    request.target = target("/containers/" + id + "/wait?condition=not-running");

    auto response = client_.send(request, timeout);
    if (!response) {
        if (response.error().code == ErrorCode::DeadlineExceeded) {
            return WaitStatus{.timed_out = true, .status_code = 0};
        }
        return response.error();
    }
    if (response->status != 200) return engine_error("wait container", *response);

    auto doc = parse_body("wait container", *response);
    if (!doc) return doc.error();
    return WaitStatus{.timed_out = false, .status_code = doc->value("StatusCode", int64_t{0})};
}

Result<StreamCapture> DockerEngine::logs(const ContainerId& id, LogStream stream, size_t limit) {
    if (!is_valid_container_id(id)) {
        return Error{ErrorCode::InvalidRequest, "Invalid container id: " + id};
    }

    std::string path = "/containers/" + id + "/logs?follow=0&timestamps=0";
    path += stream == LogStream::Stdout ? "&stdout=1&stderr=0" : "&stdout=0&stderr=1";

    LogDemuxer demux(limit);
    auto response = call("GET", path, {}, [&](std::string_view bytes) {
        demux.feed(bytes);
        return !demux.saturated(stream);
    });
    if (!response) return response.error();
    if (response->status != 200) return engine_error("read logs", *response);

    if (demux.incomplete() && logger_ != nullptr && !demux.saturated(stream)) {
        logger_->warn("Log stream ended inside a frame", {{"container", id}});
    }
    return demux.take(stream);
}

Result<ContainerStatus> DockerEngine::inspect(const ContainerId& id) {
    if (!is_valid_container_id(id)) {
        return Error{ErrorCode::InvalidRequest, "Invalid container id: " + id};
    }

    auto response = call("GET", "/containers/" + id + "/json");
    if (!response) return response.error();
    if (response->status != 200) return engine_error("inspect container", *response);

    auto doc = parse_body("inspect container", *response);
    if (!doc) return doc.error();

    auto state_it = doc->find("State");
    if (state_it == doc->end() || !state_it->is_object()) {
        return Error{ErrorCode::EngineUnavailable, "inspect container: response has no State"};
    }
    const auto& state = *state_it;

    ContainerStatus status;
    status.running = state.value("Running", false);
    status.exit_code = state.value("ExitCode", int64_t{0});
    status.oom_killed = state.value("OOMKilled", false);
    status.status = state.value("Status", std::string{});
    status.error = state.value("Error", std::string{});
    return status;
}

Result<void> DockerEngine::remove(const ContainerId& id) {
    if (!is_valid_container_id(id)) {
        return Error{ErrorCode::InvalidRequest, "Invalid container id: " + id};
    }

    auto response = call("DELETE", "/containers/" + id + "?force=1&v=1");
    if (!response) return response.error();
    if (response->status == 204 || response->status == 200 || response->status == 404) {
        return {};
    }
    return engine_error("remove container", *response);
}

}  // namespace codebox
