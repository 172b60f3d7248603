#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "Config.h"
#include "TransferEngine.h"

namespace GlobalSend {

/**
 * @brief The `globalsend` command-line tool.
 *
 * Commands:
 *   sync <src> <dst> [--config FILE] [--mirror] [--verbose]
 *   scan <dir> [--config FILE]
 *   jobs [--config FILE]
 *   version
 *
 * sync runs both ends of a session in this process over a local socket
 * pair, with a fresh X25519 agreement per run. Exit codes: 0 success,
 * 1 usage error, 2 failure, 3 transfer paused (resume by running it again).
 */
class CliApp {
public:
    CliApp(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    int run(const std::vector<std::string>& args);

    /**
     * @brief Sync src into dst with both peers in this process.
     * @throws GlobalSendError on a fatal transfer error
     */
    static TransferResult syncLocal(const std::filesystem::path& source, const std::filesystem::path& destination,
                                    const Config& config);

private:
    int cmdSync(const std::vector<std::string>& args);
    int cmdScan(const std::vector<std::string>& args);
    int cmdJobs(const std::vector<std::string>& args);
    int cmdVersion();
    void printUsage(std::ostream& os) const;

    bool loadConfig(const std::string& path);
    void applyLogging(bool verbose) const;

    std::ostream& out_;
    std::ostream& err_;
    Config config_;
};

} // namespace GlobalSend
