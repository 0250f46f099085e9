#include <depfetch/config/config_helpers.h>
#include <depfetch/config/depfetch_config.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <system_error>

namespace depfetch::config {

namespace {

Result<long long> parseInteger(const std::string& key, const std::string& value, long long min) {
    try {
        std::size_t consumed = 0;
        auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < min) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid value for " + key + ": " + value};
        }
        return static_cast<long long>(parsed);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": " + value};
    }
}

Result<double> parseFraction(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        std::string text = value;
        bool percent = !text.empty() && text.back() == '%';
        if (percent)
            text.pop_back();
        double parsed = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": " + value};
        }
        // 0.9, 90 and 90% all mean the same; 1.5 is neither a fraction nor a whole percent
        if (!percent && parsed > 1.0) {
            if (parsed != std::floor(parsed)) {
                return Error{ErrorCode::InvalidArgument,
                             key + " must be a fraction in [0, 1] or a percentage: " + value};
            }
            percent = true;
        }
        if (percent)
            parsed /= 100.0;
        if (parsed < 0.0 || parsed > 1.0) {
            return Error{ErrorCode::InvalidArgument, key + " must be within [0, 1]: " + value};
        }
        return parsed;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": " + value};
    }
}

} // namespace

Result<void> applyConfigValues(DepfetchConfig& cfg,
                               const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "download.workers") {
            auto v = parseInteger(key, value, 1);
            if (!v)
                return v.error();
            cfg.download.workers = static_cast<int>(v.value());
        } else if (key == "download.max_retries") {
            auto v = parseInteger(key, value, 1);
            if (!v)
                return v.error();
            cfg.download.retry.maxRetries = static_cast<int>(v.value());
        } else if (key == "download.timeout") {
            auto v = parseInteger(key, value, 1);
            if (!v)
                return v.error();
            cfg.download.timeout = std::chrono::seconds(v.value());
        } else if (key == "download.chunk_size") {
            auto v = parse_size(value);
            if (!v || *v == 0) {
                return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": " + value};
            }
            cfg.download.chunkSizeBytes = static_cast<std::size_t>(*v);
        } else if (key == "download.initial_backoff_ms") {
            auto v = parseInteger(key, value, 0);
            if (!v)
                return v.error();
            cfg.download.retry.initialBackoff = parse_ms(value);
        } else if (key == "download.hash_algorithm") {
            auto algo = integrity::parseHashAlgo(value);
            if (!algo) {
                return Error{ErrorCode::InvalidArgument, "Unsupported hash algorithm: " + value};
            }
            cfg.download.hashAlgo = *algo;
        } else if (key == "download.proxy") {
            if (!value.empty())
                cfg.download.proxy = value;
        } else if (key == "download.tls_insecure") {
            auto v = parse_bool(value);
            if (!v) {
                return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": " + value};
            }
            cfg.download.tls.insecure = *v;
        } else if (key == "download.ca_path") {
            cfg.download.tls.caPath = expand_tilde(value).string();
        } else if (key == "cache.root" || key == "cache.output_dir") {
            cfg.setRoot(expand_tilde(value));
        } else if (key == "cache.max_size") {
            auto v = parse_size(value);
            if (!v) {
                return Error{ErrorCode::InvalidArgument, "Invalid size for " + key + ": " + value};
            }
            cfg.cache.maxSizeBytes = *v;
        } else if (key == "cache.cleanup_threshold") {
            auto v = parseFraction(key, value);
            if (!v)
                return v.error();
            cfg.cache.cleanupThreshold = v.value();
        } else if (key == "ledger.force_verify") {
            auto v = parse_bool(value);
            if (!v) {
                return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": " + value};
            }
            cfg.ledger.forceVerify = *v;
        } else if (key == "ledger.busy_timeout_ms") {
            auto v = parseInteger(key, value, 0);
            if (!v)
                return v.error();
            cfg.ledger.busyTimeout = std::chrono::milliseconds(v.value());
        } else if (key == "log.level") {
            cfg.logLevel = value;
        } else {
            spdlog::debug("Ignoring unknown config key '{}'", key);
        }
    }
    return {};
}

Result<DepfetchConfig> loadConfig(const std::filesystem::path& path) {
    DepfetchConfig cfg;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return cfg;
    }

    auto applied = applyConfigValues(cfg, parse_config_file(path));
    if (!applied) {
        return Error{applied.error().code, path.string() + ": " + applied.error().message};
    }
    spdlog::debug("Loaded config from {}", path.string());
    return cfg;
}

} // namespace depfetch::config
