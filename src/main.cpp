#include <cstddef>
#include <cstdint>
#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "config.hpp"
#include "db_generator.hpp"
#include "error.hpp"
#include "package_store.hpp"
#include "upload_client.hpp"
#include "upload_session.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

void printHelp()
{
    std::cout << "pkgdepot (x86_64)\n"
              << "Usage: pkgdepot [--config FILE] [--verbose] command\n\n"
              << "pkgdepot stores pacman packages and maintains the repository\n"
              << "databases (<repo>.db and <repo>.files) that pacman downloads.\n\n"
              << "Useful commands:\n"
              << "  add <file> [--repo R] [--arch A]        - Store a package\n"
              << "  list [--name N] [--repo R] [--arch A]   - List stored packages\n"
              << "  remove <name> [--repo R] [--arch A]     - Delete a package\n"
              << "  regenerate [--repo R --arch A]          - Rebuild repository databases\n"
              << "  resolve <repo> <arch> <filename>        - Show which file serves a request\n"
              << "  show-index <repo> <arch>                - List the published database\n"
              << "  purge-uploads                           - Remove stale upload staging files\n"
              << "  push <file> [--url U] [--repo R] [--arch A]\n"
              << "                                          - Upload to a remote repository\n"
              << "  config                                  - Print the effective configuration\n";
}

/**
 * Removes "--flag value" from args. Returns false if the flag is present
 * without a value.
 */
bool takeOption(std::vector<std::string>& args, const std::string& flag,
                std::optional<std::string>& value)
{
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != flag) {
            continue;
        }
        if (i + 1 >= args.size()) {
            std::cerr << "Error: " << flag << " requires an argument.\n";
            return false;
        }
        value = args[i + 1];
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                   args.begin() + static_cast<std::ptrdiff_t>(i + 2));
        return true;
    }
    return true;
}

Pkgdepot::PartitionKey partitionFrom(const Pkgdepot::Config& config,
                                     const std::optional<std::string>& repo,
                                     const std::optional<std::string>& arch)
{
    return Pkgdepot::PartitionKey{repo.value_or(config.defaultRepo),
                                  arch.value_or(config.defaultArch)};
}

/**
 * Streams a local archive through an upload session, the same path an
 * uploaded package takes, and stores the assembled result.
 */
Pkgdepot::PackageMetadata addArchive(const Pkgdepot::Config& config,
                                     const Pkgdepot::PartitionKey& partition,
                                     const fs::path& file)
{
    std::error_code ec;
    std::uint64_t size = fs::file_size(file, ec);
    if (ec) {
        throw Pkgdepot::IoError("Unable to stat package", file, ec);
    }

    Pkgdepot::UploadSessions uploads(config);
    Pkgdepot::PackageStore store(config);

    std::string id = uploads.open(partition, size);
    Pkgdepot::PackageMetadata pkg;
    try {
        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) {
            throw Pkgdepot::IoError("Unable to open package", file,
                                    std::make_error_code(std::errc::no_such_file_or_directory));
        }
        std::string chunk;
        while (in) {
            chunk.resize(static_cast<size_t>(config.maxChunkSize));
            in.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
            chunk.resize(static_cast<size_t>(in.gcount()));
            if (!chunk.empty()) {
                uploads.writeChunk(id, chunk);
            }
        }
        if (in.bad()) {
            throw Pkgdepot::IoError("Unable to read package", file,
                                    std::make_error_code(std::errc::io_error));
        }

        fs::path assembled = uploads.finalize(id);
        pkg = store.add(partition, assembled);
    } catch (const Pkgdepot::Error&) {
        uploads.discard(id);
        throw;
    }
    uploads.discard(id);
    return pkg;
}

void printPackage(const Pkgdepot::PackageMetadata& pkg, const std::string& arch)
{
    std::cout << pkg.repo << "/" << arch << "  " << pkg.name << " " << pkg.fullVersion()
              << "  " << pkg.filename << "\n";
}

// Keeps libcurl's global state alive for the whole run.
struct CurlGlobal
{
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // anonymous namespace

int main(int argc, char* argv[])
{
    std::string configPath = Pkgdepot::Config::defaultPath;
    int argi = 1;

    // Global options come before the command
    while (argi < argc && std::string(argv[argi]).rfind("--", 0) == 0) {
        std::string opt = argv[argi];
        if (opt == "--config") {
            if (argi + 1 >= argc) {
                std::cerr << "Error: --config requires a file argument.\n";
                return 1;
            }
            configPath = argv[argi + 1];
            argi += 2;
        }
        else if (opt == "--verbose") {
            Pkgdepot::set_verbose(true);
            argi++;
        }
        else if (opt == "--help") {
            printHelp();
            return 0;
        }
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return 1;
        }
    }

    // If no command is supplied, show the help message
    if (argi >= argc) {
        printHelp();
        return 0;
    }

    std::string command = argv[argi];
    std::vector<std::string> args(argv + argi + 1, argv + argc);

    std::optional<std::string> repo;
    std::optional<std::string> arch;
    if (!takeOption(args, "--repo", repo) || !takeOption(args, "--arch", arch)) {
        return 1;
    }

    CurlGlobal curl;

    try {
        Pkgdepot::Config config = Pkgdepot::Config::loadFromFile(configPath);

        // -------------------------------------------------------------
        // Add Command
        // -------------------------------------------------------------
        if (command == "add") {
            if (args.size() != 1) {
                std::cerr << "Usage: pkgdepot add <file> [--repo R] [--arch A]\n";
                return 1;
            }
            Pkgdepot::PartitionKey partition = partitionFrom(config, repo, arch);
            Pkgdepot::PackageMetadata pkg = addArchive(config, partition, args[0]);
            printPackage(pkg, partition.arch);
        }
        // -------------------------------------------------------------
        // List Command
        // -------------------------------------------------------------
        else if (command == "list") {
            Pkgdepot::ListFilter filter;
            if (!takeOption(args, "--name", filter.name)) {
                return 1;
            }
            filter.repo = repo;
            filter.arch = arch;

            Pkgdepot::PackageStore store(config);
            for (const auto& partition : store.partitions()) {
                Pkgdepot::ListFilter scoped = filter;
                if ((filter.repo && *filter.repo != partition.repo) ||
                    (filter.arch && *filter.arch != partition.arch)) {
                    continue;
                }
                scoped.repo = partition.repo;
                scoped.arch = partition.arch;
                for (const auto& pkg : store.list(scoped)) {
                    printPackage(pkg, partition.arch);
                }
            }
        }
        // -------------------------------------------------------------
        // Remove Command
        // -------------------------------------------------------------
        else if (command == "remove") {
            if (args.size() != 1) {
                std::cerr << "Usage: pkgdepot remove <name> [--repo R] [--arch A]\n";
                return 1;
            }
            Pkgdepot::PackageStore store(config);
            store.remove(args[0], partitionFrom(config, repo, arch));
        }
        // -------------------------------------------------------------
        // Regenerate Command
        // -------------------------------------------------------------
        else if (command == "regenerate") {
            Pkgdepot::PackageStore store(config);
            if (repo && arch) {
                store.regenerate(Pkgdepot::PartitionKey{*repo, *arch});
            }
            else if (repo || arch) {
                std::cerr << "Error: regenerate needs both --repo and --arch, or neither.\n";
                return 1;
            }
            else {
                std::size_t count = store.regenerateAll();
                std::cout << "Regenerated " << count << " partition(s).\n";
            }
        }
        // -------------------------------------------------------------
        // Resolve Command
        // -------------------------------------------------------------
        else if (command == "resolve") {
            if (args.size() != 3) {
                std::cerr << "Usage: pkgdepot resolve <repo> <arch> <filename>\n";
                return 1;
            }
            Pkgdepot::PackageStore store(config);
            Pkgdepot::ResolvedFile file =
                store.resolve(Pkgdepot::PartitionKey{args[0], args[1]}, args[2]);
            std::cout << Pkgdepot::ResolvedFile::kindName(file.kind) << " "
                      << file.path.string() << "\n";
        }
        // -------------------------------------------------------------
        // Show-Index Command
        // -------------------------------------------------------------
        else if (command == "show-index") {
            if (args.size() != 2) {
                std::cerr << "Usage: pkgdepot show-index <repo> <arch>\n";
                return 1;
            }
            Pkgdepot::PackageStore store(config);
            Pkgdepot::ResolvedFile db =
                store.resolve(Pkgdepot::PartitionKey{args[0], args[1]}, args[0] + ".db");
            for (const auto& member : Pkgdepot::Database::readArchive(Pkgdepot::readFile(db.path))) {
                std::cout << member.path << "\n";
                if (!member.isDirectory) {
                    Pkgdepot::PackageMetadata pkg = Pkgdepot::Database::parseDesc(member.content);
                    std::cout << "    " << pkg.name << " " << pkg.fullVersion() << " ("
                              << pkg.arch << ", " << pkg.compressedSize << " bytes)\n";
                }
            }
        }
        // -------------------------------------------------------------
        // Purge-Uploads Command
        // -------------------------------------------------------------
        else if (command == "purge-uploads") {
            Pkgdepot::UploadSessions uploads(config);
            std::size_t removed = uploads.purgeAll();
            std::cout << "Removed " << removed << " stale upload(s).\n";
        }
        // -------------------------------------------------------------
        // Push Command
        // -------------------------------------------------------------
        else if (command == "push") {
            std::optional<std::string> url;
            if (!takeOption(args, "--url", url)) {
                return 1;
            }
            if (args.size() != 1) {
                std::cerr << "Usage: pkgdepot push <file> [--url U] [--repo R] [--arch A]\n";
                return 1;
            }
            Pkgdepot::UploadClient client(config);
            if (url) {
                client.setBaseUrl(*url);
            }
            std::cout << client.push(args[0], partitionFrom(config, repo, arch)) << "\n";
        }
        // -------------------------------------------------------------
        // Config Command
        // -------------------------------------------------------------
        else if (command == "config") {
            config.print();
        }
        // -------------------------------------------------------------
        // Unknown Command
        // -------------------------------------------------------------
        else {
            std::cerr << "Unknown command or insufficient arguments.\n";
            return 1;
        }
    } catch (const Pkgdepot::Error& e) {
        Pkgdepot::log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Pkgdepot::log_error(std::string("Unexpected failure: ") + e.what());
        return 1;
    }

    return 0;
}
