#include "CliApp.h"

#include "Chunker.h"
#include "ChunkSource.h"
#include "Constants.h"
#include "Crypto.h"
#include "DeviceKey.h"
#include "Exceptions.h"
#include "JobStore.h"
#include "Logger.h"
#include "ManifestBuilder.h"
#include "ManifestSerialization.h"
#include "Reassembler.h"
#include "SocketChannel.h"
#include "Version.h"

#include <exception>
#include <thread>

namespace fs = std::filesystem;

namespace GlobalSend {

namespace {

struct ParsedArgs {
    std::vector<std::string> positional;
    std::string configPath;
    bool mirror{false};
    bool verbose{false};
    std::string unknown;
};

ParsedArgs parseArgs(const std::vector<std::string>& args) {
    ParsedArgs parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config" && i + 1 < args.size()) {
            parsed.configPath = args[++i];
        } else if (arg == "--mirror") {
            parsed.mirror = true;
        } else if (arg == "--verbose") {
            parsed.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            parsed.unknown = arg;
        } else {
            parsed.positional.push_back(arg);
        }
    }
    return parsed;
}

std::string jobsDbPath(const Config& config) {
    return config.get(config::keys::JOBS_DB_PATH, config::DEFAULT_JOB_DB_PATH);
}

} // namespace

int CliApp::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage(err_);
        return 1;
    }

    const std::string& command = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        if (command == "sync") {
            return cmdSync(rest);
        }
        if (command == "scan") {
            return cmdScan(rest);
        }
        if (command == "jobs") {
            return cmdJobs(rest);
        }
        if (command == "version" || command == "--version") {
            return cmdVersion();
        }
        if (command == "help" || command == "--help") {
            printUsage(out_);
            return 0;
        }
    } catch (const GlobalSendError& e) {
        err_ << "Error: " << e.what() << " (" << errorCodeToString(e.code()) << ")" << std::endl;
        return 2;
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << std::endl;
        return 2;
    }

    err_ << "Unknown command: " << command << std::endl;
    printUsage(err_);
    return 1;
}

void CliApp::printUsage(std::ostream& os) const {
    os << "globalsend " << Version::STRING << std::endl;
    os << "Usage: globalsend <command> [options]" << std::endl;
    os << std::endl;
    os << "Commands:" << std::endl;
    os << "  sync <src> <dst>   Bring <dst> up to date with <src>" << std::endl;
    os << "  scan <dir>         Print the manifest of <dir> as JSON" << std::endl;
    os << "  jobs               List interrupted transfers that can be resumed" << std::endl;
    os << "  version            Print version information" << std::endl;
    os << std::endl;
    os << "Options:" << std::endl;
    os << "  --config <FILE>    key=value configuration file" << std::endl;
    os << "  --mirror           Delete files in <dst> that are not in <src>" << std::endl;
    os << "  --verbose          Log at DEBUG level" << std::endl;
}

bool CliApp::loadConfig(const std::string& path) {
    if (path.empty()) {
        return true;
    }
    if (!config_.loadFromFile(path)) {
        err_ << "Cannot read config file " << path << std::endl;
        return false;
    }
    return true;
}

void CliApp::applyLogging(bool verbose) const {
    auto& logger = Logger::instance();
    logger.setLevel(verbose ? LogLevel::DEBUG
                            : Logger::levelFromString(config_.get(config::keys::LOG_LEVEL, "INFO"), LogLevel::INFO));
    const std::string logFile = config_.get(config::keys::LOG_FILE);
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
    }
}

int CliApp::cmdSync(const std::vector<std::string>& args) {
    ParsedArgs parsed = parseArgs(args);
    if (!parsed.unknown.empty() || parsed.positional.size() != 2) {
        err_ << (parsed.unknown.empty() ? "sync needs <src> and <dst>" : "Unknown option " + parsed.unknown)
             << std::endl;
        return 1;
    }
    if (!loadConfig(parsed.configPath)) {
        return 1;
    }
    if (parsed.mirror) {
        config_.setBool(config::keys::SYNC_MIRROR_DELETES, true);
    }
    applyLogging(parsed.verbose);

    const TransferResult result = syncLocal(parsed.positional[0], parsed.positional[1], config_);

    out_ << transferStatusName(result.status) << ": " << result.chunksSent << " chunks ("
         << result.bytesSent << " bytes) sent, " << result.filesCommitted << " files committed";
    if (result.resumed) {
        out_ << ", resumed";
    }
    if (result.integrityFailures > 0) {
        out_ << ", " << result.integrityFailures << " chunks resent";
    }
    out_ << std::endl;

    return result.status == TransferStatus::Completed ? 0 : 3;
}

int CliApp::cmdScan(const std::vector<std::string>& args) {
    ParsedArgs parsed = parseArgs(args);
    if (!parsed.unknown.empty() || parsed.positional.size() != 1) {
        err_ << "scan needs exactly one directory" << std::endl;
        return 1;
    }
    if (!loadConfig(parsed.configPath)) {
        return 1;
    }

    const fs::path root = parsed.positional[0];
    if (!fs::is_directory(root)) {
        err_ << root.string() << " is not a directory" << std::endl;
        return 2;
    }

    ManifestBuilder builder(ChunkerParams::fromConfig(config_).valueOrThrow());
    out_ << ManifestSerialization::serialize(builder.scanDirectory(root)) << std::endl;
    return 0;
}

int CliApp::cmdJobs(const std::vector<std::string>& args) {
    ParsedArgs parsed = parseArgs(args);
    if (!parsed.unknown.empty() || !parsed.positional.empty()) {
        err_ << "jobs takes no arguments besides --config" << std::endl;
        return 1;
    }
    if (!loadConfig(parsed.configPath)) {
        return 1;
    }

    JobStore jobs(jobsDbPath(config_));
    const auto ids = jobs.listJobs();
    if (ids.empty()) {
        out_ << "No resumable jobs" << std::endl;
        return 0;
    }
    for (const auto& id : ids) {
        auto job = jobs.load(id);
        if (job.isError()) {
            err_ << job.error().toString() << std::endl;
            return 2;
        }
        const TransferJob& record = job.value();
        out_ << id.substr(0, 16) << "  " << jobStateName(record.state) << "  "
             << record.completedChunks.size() << " chunks  " << record.bytesTransferred << " bytes" << std::endl;
    }
    return 0;
}

int CliApp::cmdVersion() {
    out_ << "globalsend " << Version::STRING << " (protocol " << static_cast<int>(config::PROTOCOL_VERSION)
         << ", manifest format " << config::MANIFEST_FORMAT_VERSION << ")" << std::endl;
    return 0;
}

TransferResult CliApp::syncLocal(const fs::path& source, const fs::path& destination, const Config& config) {
    const ChunkerParams params = ChunkerParams::fromConfig(config).valueOrThrow();
    const EngineOptions engineOptions = EngineOptions::fromConfig(config).valueOrThrow();
    const PlanOptions planOptions = PlanOptions::fromConfig(config);
    const ReassemblerOptions reassemblerOptions = ReassemblerOptions::fromConfig(config);

    if (!fs::is_directory(source)) {
        throw GlobalSendError(ErrorCode::INVALID_ARGUMENT, source.string() + " is not a directory");
    }
    fs::create_directories(destination);

    const std::string dbPath = jobsDbPath(config);
    JobStore jobs(dbPath);

    ManifestBuilder builder(params);
    const std::string dbName = fs::path(dbPath).filename().string();
    for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
        builder.addIgnoredName(dbName + suffix);
    }
    const SyncManifest target = builder.scanDirectory(source);
    const SyncManifest baseline = builder.scanDirectory(destination);

    DeviceKey senderKey = DeviceKey::generate();
    DeviceKey receiverKey = DeviceKey::generate();
    std::vector<uint8_t> senderSecret = senderKey.sharedSecret(receiverKey.publicKey());
    std::vector<uint8_t> receiverSecret = receiverKey.sharedSecret(senderKey.publicKey());
    const std::vector<uint8_t> salt = Crypto::randomBytes(16);

    auto channels = SocketChannel::pair();
    TransferEngine sender(*channels.first, senderSecret, SessionRole::Initiator, engineOptions, salt);
    TransferEngine receiver(*channels.second, receiverSecret, SessionRole::Responder, engineOptions, salt);
    Crypto::secureWipe(senderSecret);
    Crypto::secureWipe(receiverSecret);

    TransferResult received;
    std::exception_ptr receiverError;
    std::thread peer([&]() {
        try {
            Reassembler reassembler(destination, reassemblerOptions);
            received = receiver.receive(baseline, reassembler);
        } catch (...) {
            receiverError = std::current_exception();
        }
        channels.second->close();
    });

    TransferResult sent;
    std::exception_ptr senderError;
    try {
        const DirectoryChunkSource chunkSource(source);
        sent = sender.send(target, chunkSource, jobs, planOptions);
    } catch (...) {
        senderError = std::current_exception();
    }
    channels.first->close();
    peer.join();

    if (senderError) {
        std::rethrow_exception(senderError);
    }
    if (receiverError) {
        std::rethrow_exception(receiverError);
    }

    sent.chunksReceived = received.chunksReceived;
    sent.bytesReceived = received.bytesReceived;
    sent.filesCommitted = received.filesCommitted;
    return sent;
}

} // namespace GlobalSend
