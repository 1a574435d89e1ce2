#include "config.hpp"
#include <getopt.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {
    // Long-only options start above the short option range
    enum LongOption {
        kOptDebug = 256,
        kOptVerbose,
        kOptInMemory,
        kOptMultipart,
        kOptMultipartThreads,
        kOptPartitionSize,
        kOptReadChunkSize,
        kOptListingChunk,
        kOptConnectionTimeout,
        kOptSocketTimeout,
        kOptMaxConnections,
        kOptRetryAttempts,
        kOptRetryBaseSleep,
        kOptRetryMaxSleep,
        kOptTmpDir,
        kOptConfig,
        kOptHelp
    };

    bool parseBool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
    }

    int parseInt(const std::string& name, const std::string& value) {
        try {
            std::size_t consumed = 0;
            int result = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid integer for " + name + ": " + value);
        }
    }

    std::vector<std::string> splitList(const std::string& value) {
        std::vector<std::string> items;
        std::size_t start = 0;
        while (start <= value.size()) {
            std::size_t end = value.find(',', start);
            if (end == std::string::npos) {
                end = value.size();
            }
            std::string item = value.substr(start, end - start);
            if (!item.empty()) {
                items.push_back(item);
            }
            start = end + 1;
        }
        return items;
    }

    const char* getEnv(const char* name) {
        const char* value = std::getenv(name);
        return (value != nullptr && *value != '\0') ? value : nullptr;
    }
}  // End anonymous namespace

void ObjfsConfig::loadDefaults() {
    *this = ObjfsConfig();
}

std::int64_t ObjfsConfig::parseSize(const std::string& value) {
    if (value.empty()) {
        throw std::runtime_error("Empty size value");
    }
    std::int64_t multiplier = 1;
    std::string digits = value;
    switch (std::toupper(static_cast<unsigned char>(value.back()))) {
        case 'K': multiplier = 1024LL; break;
        case 'M': multiplier = 1024LL * 1024; break;
        case 'G': multiplier = 1024LL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        digits.pop_back();
    }
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        throw std::runtime_error("Invalid size: " + value);
    }
    try {
        return std::stoll(digits) * multiplier;
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Size out of range: " + value);
    }
}

bool ObjfsConfig::loadFromYAML(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.good()) {
        return false;
    }
    config_file.close();

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + config_path + ": " + e.what());
    }

    // Empty file or comments only
    if (root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + config_path + " must contain a mapping");
    }

    try {
        auto str = [&](const char* key, std::string& field) {
            if (root[key]) field = root[key].as<std::string>();
        };
        auto boolean = [&](const char* key, bool& field) {
            if (root[key]) field = root[key].as<bool>();
        };
        auto integer = [&](const char* key, int& field) {
            if (root[key]) field = root[key].as<int>();
        };
        auto size = [&](const char* key, std::int64_t& field) {
            if (root[key]) field = parseSize(root[key].as<std::string>());
        };

        str("bucket_name", bucket_name);
        str("mount_point", mount_point);
        boolean("debug", debug_mode);
        boolean("verbose", verbose_logging);
        boolean("in_memory_store", use_in_memory_store);
        boolean("multipart_upload_enabled", multipart_upload_enabled);
        integer("multipart_upload_threads", multipart_upload_threads);
        size("multipart_partition_size", multipart_partition_size);
        size("read_chunk_size", read_chunk_size);
        integer("listing_chunk_length", listing_chunk_length);
        integer("connection_timeout", connection_timeout);
        integer("socket_timeout", socket_timeout);
        integer("max_connections", max_connections);
        integer("retry_max_attempts", retry_max_attempts);
        integer("retry_base_sleep_ms", retry_base_sleep_ms);
        integer("retry_max_sleep_ms", retry_max_sleep_ms);

        if (root["tmp_dirs"]) {
            const YAML::Node& dirs = root["tmp_dirs"];
            tmp_dirs.clear();
            if (dirs.IsSequence()) {
                for (const auto& dir : dirs) {
                    tmp_dirs.push_back(dir.as<std::string>());
                }
            } else {
                tmp_dirs = splitList(dirs.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in config file " + config_path + ": " + e.what());
    }
    return true;
}

void ObjfsConfig::loadFromEnv() {
    if (const char* v = getEnv("OBJFS_BUCKET")) bucket_name = v;
    if (const char* v = getEnv("OBJFS_MOUNT_POINT")) mount_point = v;
    if (const char* v = getEnv("OBJFS_DEBUG")) debug_mode = parseBool(v);
    if (const char* v = getEnv("OBJFS_VERBOSE")) verbose_logging = parseBool(v);
    if (const char* v = getEnv("OBJFS_IN_MEMORY_STORE")) use_in_memory_store = parseBool(v);
    if (const char* v = getEnv("OBJFS_MULTIPART_UPLOAD")) multipart_upload_enabled = parseBool(v);
    if (const char* v = getEnv("OBJFS_MULTIPART_THREADS")) {
        multipart_upload_threads = parseInt("OBJFS_MULTIPART_THREADS", v);
    }
    if (const char* v = getEnv("OBJFS_MULTIPART_PARTITION_SIZE")) multipart_partition_size = parseSize(v);
    if (const char* v = getEnv("OBJFS_READ_CHUNK_SIZE")) read_chunk_size = parseSize(v);
    if (const char* v = getEnv("OBJFS_LISTING_CHUNK_LENGTH")) {
        listing_chunk_length = parseInt("OBJFS_LISTING_CHUNK_LENGTH", v);
    }
    if (const char* v = getEnv("OBJFS_CONNECTION_TIMEOUT")) {
        connection_timeout = parseInt("OBJFS_CONNECTION_TIMEOUT", v);
    }
    if (const char* v = getEnv("OBJFS_SOCKET_TIMEOUT")) socket_timeout = parseInt("OBJFS_SOCKET_TIMEOUT", v);
    if (const char* v = getEnv("OBJFS_MAX_CONNECTIONS")) max_connections = parseInt("OBJFS_MAX_CONNECTIONS", v);
    if (const char* v = getEnv("OBJFS_RETRY_MAX_ATTEMPTS")) {
        retry_max_attempts = parseInt("OBJFS_RETRY_MAX_ATTEMPTS", v);
    }
    if (const char* v = getEnv("OBJFS_RETRY_BASE_SLEEP_MS")) {
        retry_base_sleep_ms = parseInt("OBJFS_RETRY_BASE_SLEEP_MS", v);
    }
    if (const char* v = getEnv("OBJFS_RETRY_MAX_SLEEP_MS")) {
        retry_max_sleep_ms = parseInt("OBJFS_RETRY_MAX_SLEEP_MS", v);
    }
    if (const char* v = getEnv("OBJFS_TMP_DIRS")) tmp_dirs = splitList(v);
}

void ObjfsConfig::parseFromArgs(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"debug",              no_argument,       0, kOptDebug},
        {"verbose",            no_argument,       0, kOptVerbose},
        {"in-memory",          no_argument,       0, kOptInMemory},
        {"multipart",          no_argument,       0, kOptMultipart},
        {"multipart-threads",  required_argument, 0, kOptMultipartThreads},
        {"partition-size",     required_argument, 0, kOptPartitionSize},
        {"read-chunk-size",    required_argument, 0, kOptReadChunkSize},
        {"listing-chunk",      required_argument, 0, kOptListingChunk},
        {"connection-timeout", required_argument, 0, kOptConnectionTimeout},
        {"socket-timeout",     required_argument, 0, kOptSocketTimeout},
        {"max-connections",    required_argument, 0, kOptMaxConnections},
        {"retry-attempts",     required_argument, 0, kOptRetryAttempts},
        {"retry-base-sleep",   required_argument, 0, kOptRetryBaseSleep},
        {"retry-max-sleep",    required_argument, 0, kOptRetryMaxSleep},
        {"tmp-dir",            required_argument, 0, kOptTmpDir},
        {"config",             required_argument, 0, kOptConfig},
        {"help",               no_argument,       0, kOptHelp},
        {0, 0, 0, 0}
    };

    // Reset getopt state; glibc fully reinitializes on 0
    optind = 0;
    opterr = 0;

    bool tmp_dirs_from_cli = false;
    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "fdo:h", long_options, &option_index)) != -1) {
        switch (opt) {
            case kOptDebug:
                debug_mode = true;
                break;
            case kOptVerbose:
                verbose_logging = true;
                break;
            case kOptInMemory:
                use_in_memory_store = true;
                break;
            case kOptMultipart:
                multipart_upload_enabled = true;
                break;
            case kOptMultipartThreads:
                multipart_upload_threads = parseInt("--multipart-threads", optarg);
                break;
            case kOptPartitionSize:
                multipart_partition_size = parseSize(optarg);
                break;
            case kOptReadChunkSize:
                read_chunk_size = parseSize(optarg);
                break;
            case kOptListingChunk:
                listing_chunk_length = parseInt("--listing-chunk", optarg);
                break;
            case kOptConnectionTimeout:
                connection_timeout = parseInt("--connection-timeout", optarg);
                break;
            case kOptSocketTimeout:
                socket_timeout = parseInt("--socket-timeout", optarg);
                break;
            case kOptMaxConnections:
                max_connections = parseInt("--max-connections", optarg);
                break;
            case kOptRetryAttempts:
                retry_max_attempts = parseInt("--retry-attempts", optarg);
                break;
            case kOptRetryBaseSleep:
                retry_base_sleep_ms = parseInt("--retry-base-sleep", optarg);
                break;
            case kOptRetryMaxSleep:
                retry_max_sleep_ms = parseInt("--retry-max-sleep", optarg);
                break;
            case kOptTmpDir:
                // Repeated --tmp-dir flags accumulate; the first one replaces lower layers
                if (!tmp_dirs_from_cli) {
                    tmp_dirs.clear();
                    tmp_dirs_from_cli = true;
                }
                tmp_dirs.push_back(optarg);
                break;
            case kOptConfig:
                // Consumed by extractConfigPath()
                break;
            case 'f':
                // FUSE -f flag (foreground)
                fuse_args.push_back("-f");
                break;
            case 'd':
                // FUSE -d flag
                fuse_args.push_back("-d");
                break;
            case 'o':
                // FUSE -o option
                fuse_args.push_back("-o");
                fuse_args.push_back(optarg);
                break;
            case 'h':
            case kOptHelp:
                printUsage(argv[0]);
                exit(0);
            case '?':
                std::cerr << "[WARN] Ignoring unknown option: " << argv[optind - 1] << std::endl;
                break;
            default:
                break;
        }
    }

    // Collect positional arguments (bucket_name and mount_point)
    std::vector<std::string> positional_args;
    while (optind < argc) {
        positional_args.push_back(argv[optind++]);
    }

    if (positional_args.size() >= 1) {
        bucket_name = positional_args[0];
    }
    if (positional_args.size() >= 2) {
        mount_point = positional_args[1];
    }
    // Any additional positional args go to FUSE
    for (std::size_t i = 2; i < positional_args.size(); i++) {
        fuse_args.push_back(positional_args[i]);
    }
}

std::optional<std::string> ObjfsConfig::extractConfigPath(int argc, char* argv[]) {
    const std::string flag = "--config";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == flag && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
        if (arg.compare(0, flag.size() + 1, flag + "=") == 0) {
            return arg.substr(flag.size() + 1);
        }
    }
    if (const char* v = getEnv("OBJFS_CONFIG")) {
        return std::string(v);
    }
    return std::nullopt;
}

ObjfsConfig ObjfsConfig::load(int argc, char* argv[]) {
    ObjfsConfig config;
    config.loadDefaults();

    auto config_path = extractConfigPath(argc, argv);
    if (config_path && !config.loadFromYAML(*config_path)) {
        throw std::runtime_error("Config file not found: " + *config_path);
    }

    config.loadFromEnv();
    config.parseFromArgs(argc, argv);
    config.validate();
    return config;
}

void ObjfsConfig::validate() const {
    if (bucket_name.empty()) {
        throw std::runtime_error("Missing required argument: bucket_name");
    }
    if (mount_point.empty()) {
        throw std::runtime_error("Missing required argument: mount_point");
    }
    if (multipart_upload_threads <= 0) {
        throw std::runtime_error("multipart_upload_threads must be positive");
    }
    if (multipart_partition_size <= 0) {
        throw std::runtime_error("multipart_partition_size must be positive");
    }
    if (read_chunk_size <= 0) {
        throw std::runtime_error("read_chunk_size must be positive");
    }
    if (listing_chunk_length <= 0) {
        throw std::runtime_error("listing_chunk_length must be positive");
    }
    if (connection_timeout <= 0 || socket_timeout <= 0) {
        throw std::runtime_error("Timeouts must be positive");
    }
    if (max_connections <= 0) {
        throw std::runtime_error("max_connections must be positive");
    }
    if (retry_max_attempts <= 0) {
        throw std::runtime_error("retry_max_attempts must be positive");
    }
    if (retry_base_sleep_ms < 0 || retry_max_sleep_ms < 0) {
        throw std::runtime_error("Retry sleeps cannot be negative");
    }
}

void ObjfsConfig::printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <bucket_name> <mount_point> [options]\n\n";
    std::cout << "Required arguments:\n";
    std::cout << "  bucket_name              Bucket to mount\n";
    std::cout << "  mount_point              Directory to mount the filesystem\n\n";

    std::cout << "objfs options:\n";
    std::cout << "  --config=PATH            YAML config file (or OBJFS_CONFIG)\n";
    std::cout << "  --in-memory              Serve the bucket from process memory\n";
    std::cout << "  --multipart              Upload files as multipart uploads\n";
    std::cout << "  --multipart-threads=N    Part upload workers (default: 20)\n";
    std::cout << "  --partition-size=SIZE    Multipart part size (default: 64M)\n";
    std::cout << "  --read-chunk-size=SIZE   Bytes per ranged read (default: 8M)\n";
    std::cout << "  --listing-chunk=N        Keys per listing request (default: 1000)\n";
    std::cout << "  --connection-timeout=S   Transfer stall timeout in seconds (default: 50)\n";
    std::cout << "  --socket-timeout=S       Download stall timeout in seconds (default: 50)\n";
    std::cout << "  --max-connections=N      Connection pool size (default: 1024)\n";
    std::cout << "  --retry-attempts=N       Attempts per store call (default: 5)\n";
    std::cout << "  --retry-base-sleep=MS    First retry backoff (default: 100)\n";
    std::cout << "  --retry-max-sleep=MS     Largest retry backoff (default: 5000)\n";
    std::cout << "  --tmp-dir=DIR            Spill directory for uploads, repeatable (default: /tmp)\n";
    std::cout << "  --debug                  Enable debug logging\n";
    std::cout << "  --verbose                Enable verbose output\n";
    std::cout << "  --help                   Display this help message\n\n";

    std::cout << "FUSE options:\n";
    std::cout << "  -f                       Run in foreground\n";
    std::cout << "  -d                       Enable FUSE debug output\n";
    std::cout << "  -o option                Mount options (e.g., -o allow_other)\n\n";

    std::cout << "Sizes accept K, M and G suffixes.\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " my-bucket ~/mnt\n";
    std::cout << "  " << program_name << " my-bucket ~/mnt --multipart --partition-size=16M -f\n";
    std::cout << "  " << program_name << " scratch ~/mnt --in-memory --debug -o allow_other\n";
}

void ObjfsConfig::toFuseArgs(int& out_argc, char**& out_argv) const {
    // Build argument list: program_name, mount_point, [fuse_args]
    std::vector<std::string> args;
    args.push_back("objfs");  // Program name
    args.push_back(mount_point);

    for (const auto& arg : fuse_args) {
        args.push_back(arg);
    }

    // Allocate argv array
    out_argc = static_cast<int>(args.size());
    out_argv = new char*[out_argc + 1];

    for (int i = 0; i < out_argc; i++) {
        out_argv[i] = new char[args[i].length() + 1];
        std::strcpy(out_argv[i], args[i].c_str());
    }
    out_argv[out_argc] = nullptr;
}

void ObjfsConfig::freeFuseArgs(int argc, char** argv) {
    for (int i = 0; i < argc; i++) {
        delete[] argv[i];
    }
    delete[] argv;
}
