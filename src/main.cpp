// main.cpp
#include "Classifier.hpp"
#include "Config.hpp"
#include "DnsProber.hpp"
#include "Executor.hpp"
#include "HttpProber.hpp"
#include "Log.hpp"
#include "ResultSink.hpp"
#include "Target.hpp"
#include "WhoisProber.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace Livecheck;

int main(int argc, char** argv) {
    Settings settings;
    try {
        settings = parseSettings(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << "\n" << usage(argv[0]);
        return 2;
    }
    if (settings.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }
    Log::setVerbosity(settings.verboseLevel);

    try {
        HttpLibrary httpLib;
        DnsLibrary dnsLib;

        WhoisServerTable whoisServers = WhoisServerTable::defaults();
        if (!settings.whoisServersFile.empty()) {
            whoisServers.loadFile(settings.whoisServersFile);
            Log::info(2, "Whois", "Loaded server overrides from " + settings.whoisServersFile);
        }

        HttpProberOptions httpOptions;
        httpOptions.timeoutMs = settings.httpTimeoutMs;
        DnsProberOptions dnsOptions;
        dnsOptions.timeoutMs = settings.dnsTimeoutMs;
        WhoisProberOptions whoisOptions;
        whoisOptions.timeoutMs = settings.whoisTimeoutMs;
        whoisOptions.requireMatch = settings.whoisRequireMatch;

        const HttpProber http(httpOptions);
        const DnsProber dns(dnsOptions);
        const WhoisProber whois(std::move(whoisServers), whoisOptions);

        ProbeSuite probes;
        probes.http = [&http](const std::string& url) { return http.probe(url); };
        probes.dns = [&dns](const std::string& host) { return dns.probe(host); };
        probes.whois = [&whois](const std::string& host) { return whois.probe(host); };
        probes.threadDone = [] { HttpProber::releaseThreadHandle(); };
        const Classifier classifier(std::move(probes), settings.fallback);

        ResultSink sink(settings.outputFile, settings.exclude);
        sink.reset();

        std::vector<std::string> targets = loadTargets(settings.inputFile);
        Log::info(2, "main", "Loaded " + std::to_string(targets.size()) + " targets, concurrency " +
                             std::to_string(settings.concurrency));

        Executor executor(classifier, sink, settings.concurrency);
        RunSummary summary = executor.run(targets);

        Log::info(2, "main", std::to_string(summary.active) + " active, " +
                             std::to_string(summary.inactive) + " inactive, " +
                             std::to_string(summary.excluded) + " excluded, " +
                             std::to_string(summary.failed) + " failed");
        Log::line(1, "All tasks completed.");
    } catch (const std::exception& e) {
        Log::error("main", e.what());
        return 1;
    }
    return 0;
}
