#pragma once

// ── On-disk artifacts ───────────────────────────────────────
// Local inventory inside the input root; also the remote manifest name.
constexpr const char* INVENTORY_FILENAME        = "files.sitedeploy.json";
// Cached remote snapshot and revision descriptor inside the config dir.
constexpr const char* REMOTE_INVENTORY_FILENAME = "files-remote.json";
constexpr const char* SYNC_REVISION_FILENAME    = "sync-revision.json";
constexpr const char* SESSION_LOCK_FILENAME     = ".sitedeploy.lock";
// Diagnostic audit logs inside the app dir.
constexpr const char* AUDIT_LOG_PREFIX          = "connection-files-log";
constexpr const char* AUDIT_LOG_UPLOAD_SUFFIX   = "to-upload";
constexpr const char* AUDIT_LOG_DELETE_SUFFIX   = "to-delete";

// ── Special root files ──────────────────────────────────────
constexpr const char* HTACCESS_FILENAME         = ".htaccess";
constexpr const char* REDIRECTS_FILENAME        = "_redirects";
constexpr const char* VCS_DIRNAME               = ".git";

// ── Progress bands (percent) ────────────────────────────────
constexpr int PROGRESS_START             = 0;
constexpr int PROGRESS_INVENTORY_DONE    = 4;
constexpr int PROGRESS_DIFF_DONE         = 8;     // lower bound of the drain band
constexpr double PROGRESS_DRAIN_SPAN     = 90.0;  // 8..98
constexpr int PROGRESS_PUBLISHING        = 98;
constexpr int PROGRESS_DONE              = 100;

// ── Binary detection ────────────────────────────────────────
constexpr int BINARY_SNIFF_BYTES         = 512;

// ── Network ─────────────────────────────────────────────────
constexpr int SFTP_DEFAULT_PORT          = 22;
constexpr int SFTP_CHUNK_SIZE            = 32768;
constexpr int SFTP_DIR_MODE              = 0755;
constexpr int SFTP_FILE_MODE             = 0644;

// ── Config locations ────────────────────────────────────────
constexpr const char* GLOBAL_CONFIG_DIRNAME     = ".sitedeploy";
constexpr const char* GLOBAL_CONFIG_FILENAME    = "config.yaml";
constexpr const char* SITE_CONFIG_FILENAME      = "deploy.yaml";
constexpr const char* SITE_OUTPUT_DIRNAME       = "output";
constexpr const char* PASSWORD_ENV_VAR          = "SITEDEPLOY_PASSWORD";
