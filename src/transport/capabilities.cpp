#include "capabilities.hpp"
#include <map>

TransportCapabilities capabilities_for(TransportKind kind) {
    TransportCapabilities caps;

    switch (kind) {
        case TransportKind::S3:
            caps.counts_directory_ops = false;
            caps.root_dotfiles = false;
            caps.self_managed_sync = true;
            break;
        case TransportKind::GithubPages:
        case TransportKind::Netlify:
            caps.root_dotfiles = false;
            break;
        case TransportKind::GoogleCloud:
            caps.explicit_directories = false;
            caps.counts_directory_ops = false;
            caps.root_dotfiles = false;
            break;
        case TransportKind::GitlabPages:
            caps.explicit_directories = false;
            caps.counts_directory_ops = false;
            caps.self_managed_sync = true;
            break;
        case TransportKind::Ftp:
        case TransportKind::Sftp:
        case TransportKind::SftpKey:
        case TransportKind::Git:
        case TransportKind::Manual:
        case TransportKind::Local:
            break;
    }

    return caps;
}

static const std::map<std::string, TransportKind>& kind_names() {
    static const std::map<std::string, TransportKind> names = {
        {"ftp",          TransportKind::Ftp},
        {"sftp",         TransportKind::Sftp},
        {"sftp+key",     TransportKind::SftpKey},
        {"s3",           TransportKind::S3},
        {"git",          TransportKind::Git},
        {"github-pages", TransportKind::GithubPages},
        {"gitlab-pages", TransportKind::GitlabPages},
        {"netlify",      TransportKind::Netlify},
        {"google-cloud", TransportKind::GoogleCloud},
        {"manual",       TransportKind::Manual},
        {"local",        TransportKind::Local},
    };
    return names;
}

std::optional<TransportKind> parse_transport_kind(const std::string& name) {
    const auto& names = kind_names();
    auto it = names.find(name);
    if (it == names.end()) return std::nullopt;
    return it->second;
}

const char* transport_kind_name(TransportKind kind) {
    for (const auto& kv : kind_names()) {
        if (kv.second == kind) return kv.first.c_str();
    }
    return "unknown";
}
