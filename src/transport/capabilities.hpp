#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// What a backend can represent. Resolved once per session from the
// configured protocol; drives inventory, diff, counting and pump mode.
struct TransportCapabilities {
    bool explicit_directories = true;   // directory entries are inventoried and diffed
    bool counts_directory_ops = true;   // directory entries count toward progress
    bool root_dotfiles = true;          // root .htaccess / _redirects are deployed
    bool self_managed_sync = false;     // transport drains the queues itself
};

TransportCapabilities capabilities_for(TransportKind kind);

// "sftp+key" -> TransportKind::SftpKey. Unknown names yield nullopt.
std::optional<TransportKind> parse_transport_kind(const std::string& name);

const char* transport_kind_name(TransportKind kind);
