/**
 * @file docker_engine.hpp
 * @brief IContainerEngine backed by the Docker Engine REST API.
 *
 * Speaks only the allow-listed endpoints: _ping, images/json,
 * containers/create, start, attach (stdin), wait, logs, json (inspect) and
 * DELETE with force=1.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "engine/container_engine.hpp"
#include "engine/http_client.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace codebox {

class DockerEngine : public IContainerEngine {
public:
    /// Grace period for draining the attach connection after stdin is closed.
    static constexpr Duration STDIN_DRAIN{500};

    DockerEngine(HttpClient client, std::string api_version, Duration request_timeout,
                 Logger* logger = nullptr);

    /// Build from [engine] configuration; fails on an unparseable endpoint.
    static Result<std::unique_ptr<DockerEngine>> from_config(const EngineConfig& config,
                                                             Logger* logger = nullptr);

    Result<void> ping() override;
    Result<std::vector<std::string>> list_images() override;
    Result<ContainerId> create(const ContainerSpec& spec) override;
    Result<void> start(const ContainerId& id) override;
    Result<void> write_stdin(const ContainerId& id, std::string_view data,
                             Duration timeout) override;
    Result<WaitStatus> wait(const ContainerId& id, Duration timeout) override;
    Result<StreamCapture> logs(const ContainerId& id, LogStream stream, size_t limit) override;
    Result<ContainerStatus> inspect(const ContainerId& id) override;
    Result<void> remove(const ContainerId& id) override;

    /// JSON body for POST /containers/create; InvalidRequest when a string is not UTF-8.
    [[nodiscard]] static Result<std::string> build_create_body(const ContainerSpec& spec);

    /// Versioned request target, e.g. "/v1.43/containers/create".
    [[nodiscard]] std::string target(std::string_view path) const;

private:
    Result<HttpResponse> call(std::string method, std::string_view path,
                              std::string body = {}, const BodySink& sink = {});

    HttpClient client_;
    std::string api_prefix_;
    Duration request_timeout_;
    Logger* logger_;
};

/**
 * @brief Turn an engine error response into an Error.
 *
 * Uses the "message" field of the JSON body when present.
 */
[[nodiscard]] Error engine_error(std::string_view operation, const HttpResponse& response);

}  // namespace codebox
