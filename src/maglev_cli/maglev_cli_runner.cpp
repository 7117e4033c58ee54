#include "maglev_cli_runner.hpp"

#include <boost/program_options.hpp>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "configs.hpp"
#include "enums.hpp"
#include "hash_strategy.hpp"
#include "utils.hpp"

std::string nodeOrNone(const std::string* node) {
    return node == nullptr ? "(none)" : *node;
}

RemovalReport reportRemoval(const Maglev<std::string>& maglev, const std::vector<std::string>& removed, const std::vector<std::string>& keys) {
    std::set<std::string> removedSet(removed.begin(), removed.end());
    RemovalReport report;
    for (const std::string& node : maglev.nodes()) {
        if (removedSet.count(node) == 0) {
            report.remaining.push_back(node);
        }
    }

    // Keep the old table size so only keys of removed nodes move
    std::optional<size_t> capacity;
    if (maglev.capacity() > 0) {
        capacity = maglev.capacity();
    }
    Maglev<std::string> rebuilt(report.remaining, capacity, maglev.hashStrategy());
    report.capacity = rebuilt.capacity();

    report.moved = 0;
    for (const std::string& key : keys) {
        KeyMove move{key, nodeOrNone(maglev.get(key)), nodeOrNone(rebuilt.get(key))};
        if (move.before != move.after) {
            report.moved++;
        }
        report.keys.push_back(move);
    }
    return report;
}

int runMaglevCli(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    boost::program_options::options_description desc("Maglev lookup options");
    desc.add_options()
        ("help", "Print this message")
        ("conf", boost::program_options::value<std::string>(), "Path to a JSON config file")
        ("nodes", boost::program_options::value<std::string>(), "Comma separated node names")
        ("capacity", boost::program_options::value<size_t>(), "Requested table size, rounded up to a prime")
        ("hasher", boost::program_options::value<std::string>(), "Hash strategy: siphash13 or sha1")
        ("keys", boost::program_options::value<std::string>(), "Comma separated keys to look up")
        ("remove", boost::program_options::value<std::string>(), "Comma separated nodes to remove before a rebuild")
        ("stats", "Print the number of slots owned by each node")
        ("logging", "Enable file logging");
    boost::program_options::variables_map vm;
    try {
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc), vm);
        boost::program_options::notify(vm);
    } catch (const boost::program_options::error& e) {
        err << e.what() << std::endl;
        err << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        out << desc << std::endl;
        return 0;
    }
    ENABLE_FILE_LOGGING = vm.count("logging") > 0;

    MaglevConfig config;
    try {
        if (vm.count("conf")) {
            config = loadMaglevConfig(vm["conf"].as<std::string>());
        }
        if (vm.count("nodes")) {
            config.nodes.clear();
            splitString(vm["nodes"].as<std::string>(), config.nodes);
        }
        if (vm.count("capacity")) {
            config.capacity = vm["capacity"].as<size_t>();
        }
        if (vm.count("hasher")) {
            config.hashAlgorithm = parseHashAlgorithm(vm["hasher"].as<std::string>());
        }
        if (vm.count("keys")) {
            config.keys.clear();
            splitString(vm["keys"].as<std::string>(), config.keys);
        }
    } catch (const std::exception& e) {
        err << e.what() << std::endl;
        return 1;
    }

    try {
        Logger logger("maglev_cli");
        std::shared_ptr<const HashStrategy> hasher = makeHashStrategy(config.hashAlgorithm);

        long long startTime = getCurrentTimeMillis();
        Maglev<std::string> maglev(config.nodes, config.capacity, hasher);
        long long buildTime = getCurrentTimeMillis() - startTime;
        logger.log_message("nodes=" + concatString(config.nodes) + " capacity=" + std::to_string(maglev.capacity()) + " buildMs=" + std::to_string(buildTime));

        out << "hasher: " << hasher->name() << std::endl;
        out << "capacity: " << maglev.capacity() << std::endl;

        if (vm.count("stats")) {
            std::vector<size_t> counts = maglev.slotCounts();
            for (size_t i = 0; i < counts.size(); i++) {
                out << maglev.nodes()[i] << ": " << counts[i] << " slots" << std::endl;
            }
        }

        if (!vm.count("remove")) {
            for (const std::string& key : config.keys) {
                out << key << " -> " << nodeOrNone(maglev.get(key)) << std::endl;
            }
            return 0;
        }

        std::vector<std::string> removed;
        splitString(vm["remove"].as<std::string>(), removed);
        RemovalReport report = reportRemoval(maglev, removed, config.keys);
        logger.log_message("removed=" + concatString(removed) + " remaining=" + std::to_string(report.remaining.size()));

        for (const KeyMove& move : report.keys) {
            out << move.key << " -> " << move.before << " => " << move.after << std::endl;
        }
        out << "moved: " << report.moved << "/" << report.keys.size() << std::endl;
    } catch (const std::exception& e) {
        err << e.what() << std::endl;
        return 1;
    }

    return 0;
}
