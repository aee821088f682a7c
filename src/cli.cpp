#include "cli.hpp"
#include "cache/cache_service.hpp"
#include "config.hpp"
#include <cstdint>
#include <cstring>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>

namespace hookcache {

static void print_usage(std::ostream& err) {
    err << "Usage: hookcache [--cache NAME] <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  lookup --scope S QUERY...   Print cached result; exit 1 on miss\n"
        << "  store --scope S QUERY...    Cache the result read from stdin\n"
        << "  stats                       Show entry count and hit/miss/save counters\n"
        << "  clear                       Drop all entries and counters\n"
        << "\n"
        << "Options:\n"
        << "  --cache NAME   Cache instance (default: exploration)\n"
        << "  --scope S      Scope, e.g. working directory or URL\n"
        << "  -h, --help     Show this help\n";
}

int run_cli(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err) {
    std::string cache_name = "exploration";
    std::string command;
    std::string scope;
    std::vector<std::string> words;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(err);
            return 0;
        } else if (std::strcmp(argv[i], "--cache") == 0 && i + 1 < argc) {
            cache_name = argv[++i];
        } else if (std::strcmp(argv[i], "--scope") == 0 && i + 1 < argc) {
            scope = argv[++i];
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            err << "Unknown option: " << argv[i] << "\n";
            print_usage(err);
            return 2;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            words.emplace_back(argv[i]);
        }
    }

    std::string query;
    for (const auto& w : words) {
        if (!query.empty()) query += ' ';
        query += w;
    }

    auto config = Config::load();
    auto settings = config.cache(cache_name);
    if (!settings) {
        err << "Unknown cache: " << cache_name << "\n";
        return 2;
    }

    CacheService cache(*settings);
    const CacheSettings& active = cache.settings();

    if (command == "lookup") {
        auto entry = cache.lookup(query, scope);
        if (!entry) return 1;
        out << entry->result << '\n';
        return 0;
    }

    if (command == "store") {
        std::string result((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
        // lookup prints its own newline
        if (!result.empty() && result.back() == '\n') result.pop_back();
        cache.store(query, scope, result);
        return 0;
    }

    if (command == "stats") {
        auto stats = cache.stats();
        uint64_t lookups = stats.hits + stats.misses;
        out << "Cache: " << active.name << " (" << active.path << ")\n"
            << "Entries: " << cache.size() << "/" << active.max_entries << "\n"
            << "Hits: " << stats.hits << "\n"
            << "Misses: " << stats.misses << "\n"
            << "Saves: " << stats.saves << "\n";
        if (lookups > 0) {
            out << "Hit rate: " << (100 * stats.hits / lookups) << "%\n";
        }
        return 0;
    }

    if (command == "clear") {
        cache.clear();
        out << "Cleared " << active.name << " cache.\n";
        return 0;
    }

    if (command.empty()) {
        print_usage(err);
    } else {
        err << "Unknown command: " << command << "\n";
        print_usage(err);
    }
    return 2;
}

} // namespace hookcache
