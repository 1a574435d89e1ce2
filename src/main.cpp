// objfs main entry point

#include "objfs.hpp"
#include "config.hpp"
#include "log.hpp"
#include "store/gcs_object_store_client.hpp"
#include "store/in_memory_object_store_client.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
    try {
        // Defaults < YAML < environment < command line
        ObjfsConfig config = ObjfsConfig::load(argc, argv);

        if (config.debug_mode) {
            objfs::log::setLevel(objfs::log::Level::Debug);
        } else if (config.verbose_logging) {
            objfs::log::setLevel(objfs::log::Level::Info);
        }

        std::shared_ptr<const objfs::IObjectStoreClient> client;
        if (config.use_in_memory_store) {
            objfs::log::warn("Using the in-memory store; data is lost on unmount");
            client = std::make_shared<objfs::InMemoryObjectStoreClient>();
        } else {
            client = std::make_shared<objfs::GCSObjectStoreClient>(config);
        }

        auto ufs = std::make_unique<objfs::ObjectUnderFileSystem>(client, config.bucket_name, config);

        // Convert config back to FUSE arguments
        int fuse_argc;
        char** fuse_argv;
        config.toFuseArgs(fuse_argc, fuse_argv);

        // Create and run filesystem
        ObjFS fs(std::move(ufs), config);
        const auto status = fs.run(fuse_argc, fuse_argv);

        ObjfsConfig::freeFuseArgs(fuse_argc, fuse_argv);
        return status;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
