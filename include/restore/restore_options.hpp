#pragma once

#include <string>
#include <vector>

// What a restore should bring back. Every data toggle defaults to on.
struct RestoreOptions {
    bool homedir = true;
    bool mysql = true;
    bool mail = true;
    bool ssl = true;
    bool cron = true;
    bool dns = true;
    bool subdomains = true;
    bool addonDomains = true;

    bool force = false;
    std::string newUser;
    std::string ip;

    // Restore tool modules to skip, e.g. {"Homedir", "Mail", "MailRouting"}.
    // Domains is only disabled when both subdomains and addon domains are off.
    std::vector<std::string> disabledModules() const {
        std::vector<std::string> modules;
        if (!homedir) modules.push_back("Homedir");
        if (!mysql) modules.push_back("Mysql");
        if (!mail) {
            modules.push_back("Mail");
            modules.push_back("MailRouting");
        }
        if (!ssl) modules.push_back("SSL");
        if (!cron) modules.push_back("Cron");
        if (!dns) modules.push_back("ZoneFile");
        if (!subdomains && !addonDomains) modules.push_back("Domains");
        return modules;
    }
};
