#pragma once

#include "common/job_manager.hpp"
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// Parsed "--name value" options and bare "--flag" switches after the command
struct CommandArgs {
    std::map<std::string, std::string> values;
    std::vector<std::string> flags;

    bool has(const std::string& name) const;
    std::string get(const std::string& name, const std::string& fallback = "") const;
};

class AcctVaultCLI {
public:
    AcctVaultCLI(std::shared_ptr<JobManager> jobManager, std::ostream& out, std::ostream& err);

    // Dispatches one command; returns the process exit status
    int run(const std::string& command, const CommandArgs& args);

    static void printUsage(std::ostream& out);
    // Splits argv; options listed in switches take no value
    static bool parseArguments(int argc, char** argv, int start, CommandArgs& args, std::string& error);

private:
    int handleBackup(const CommandArgs& args);
    int handleRestore(const CommandArgs& args);
    int handleCancel(const CommandArgs& args);
    int handleList(const CommandArgs& args);
    int handleLogs(const CommandArgs& args);
    int handlePreview(const CommandArgs& args);
    int handlePrune(const CommandArgs& args);

    bool requireOption(const CommandArgs& args, const std::string& name);
    bool parseNumber(const CommandArgs& args, const std::string& name, int fallback, int& value);

    std::shared_ptr<JobManager> jobManager_;
    std::ostream& out_;
    std::ostream& err_;
};
