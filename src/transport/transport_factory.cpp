#include "transport_factory.hpp"
#include "local_transport.hpp"
#include "sftp_transport.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

Result<std::unique_ptr<Transport>> create_transport(const DeploymentConfig& config) {
    using R = Result<std::unique_ptr<Transport>>;

    deploy_log(fmt::format("create_transport: protocol={}", config.protocol_name));

    switch (config.protocol) {
        case TransportKind::Local:
            if (config.path.empty()) {
                return R::Err("local deployment requires deployment.path");
            }
            return R::Ok(std::make_unique<LocalTransport>(expand_home(config.path)));

        case TransportKind::Sftp:
        case TransportKind::SftpKey:
            if (config.server.empty()) {
                return R::Err(fmt::format("{} deployment requires deployment.server",
                                          config.protocol_name));
            }
            return R::Ok(std::make_unique<SftpTransport>(config));

        default:
            return R::Err(fmt::format("protocol '{}' is not available in this build",
                                      transport_kind_name(config.protocol)));
    }
}
