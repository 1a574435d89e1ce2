#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * ObjfsConfig - Configuration options for objfs
 *
 * Supports layered configuration from multiple sources:
 * 1. Defaults (lowest priority)
 * 2. YAML config file
 * 3. Environment variables
 * 4. Command-line arguments (highest priority)
 */
struct ObjfsConfig {
    // Logging settings
    bool debug_mode = false;
    bool verbose_logging = false;

    // Bucket name (required)
    std::string bucket_name;

    // Mount point (required)
    std::string mount_point;

    // Serve the mount from process memory instead of GCS
    bool use_in_memory_store = false;

    // Writes
    bool multipart_upload_enabled = false;
    int multipart_upload_threads = 20;
    std::int64_t multipart_partition_size = 64LL * 1024 * 1024;
    std::vector<std::string> tmp_dirs = {"/tmp"};  // spill files for single-shot uploads

    // Reads and listings
    std::int64_t read_chunk_size = 8LL * 1024 * 1024;
    int listing_chunk_length = 1000;

    // Transport
    int connection_timeout = 50;  // seconds
    int socket_timeout = 50;      // seconds
    int max_connections = 1024;

    // Retry of store calls: attempts include the first try
    int retry_max_attempts = 5;
    int retry_base_sleep_ms = 100;
    int retry_max_sleep_ms = 5000;

    // Remaining FUSE arguments
    std::vector<std::string> fuse_args;

    /**
     * Load configuration from all sources in priority order
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed configuration
     * @throws std::runtime_error if required arguments are missing or invalid
     */
    static ObjfsConfig load(int argc, char* argv[]);

    /**
     * Parse command-line arguments into config and FUSE args
     * This method applies CLI overrides to an existing config
     *
     * @throws std::runtime_error if an option value is invalid
     */
    void parseFromArgs(int argc, char* argv[]);

    /**
     * Load configuration from YAML file
     *
     * @param config_path Path to YAML config file
     * @return true if file was loaded successfully, false if file doesn't exist
     * @throws std::runtime_error if file exists but is invalid
     */
    bool loadFromYAML(const std::string& config_path);

    /**
     * Load configuration from environment variables
     * Recognizes: OBJFS_* variables
     */
    void loadFromEnv();

    /**
     * Set default values
     */
    void loadDefaults();

    /**
     * Validate configuration
     * @throws std::runtime_error if configuration is invalid
     */
    void validate() const;

    /**
     * Print usage information
     */
    static void printUsage(const char* program_name);

    /**
     * Convert config and fuse_args back to argc/argv format for FUSE
     *
     * @param out_argc Output argument count
     * @param out_argv Output argument vector (release with freeFuseArgs)
     */
    void toFuseArgs(int& out_argc, char**& out_argv) const;

    static void freeFuseArgs(int argc, char** argv);

    /**
     * Parse a byte size with an optional K, M or G suffix (powers of 1024)
     * @throws std::runtime_error on malformed input
     */
    static std::int64_t parseSize(const std::string& value);

private:
    /**
     * Extract --config flag from arguments before full parsing
     */
    static std::optional<std::string> extractConfigPath(int argc, char* argv[]);
};
