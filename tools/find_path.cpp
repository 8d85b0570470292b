/**
 * @file find_path.cpp
 * @brief Shortest co-appearance path between two people
 *
 * Usage: sixdegrees_path <person-a> <person-b> [--max-nodes N] [--json] [--config file]
 *
 * A person is a numeric id or a name. Exit codes: 0 found, 1 no path or
 * error, 2 ambiguous or unknown person, 3 search ceiling exceeded.
 */

#include <config/pipeline_config.hpp>
#include <database/postgres_connection.hpp>
#include <graph/path_hydrator.hpp>
#include <graph/path_resolver.hpp>
#include <graph/person_resolver.hpp>
#include <graph/postgres_graph_store.hpp>
#include <storage/schema.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace SixDegrees;
using json = nlohmann::json;

namespace {

constexpr int kExitFound = 0;
constexpr int kExitNoPath = 1;
constexpr int kExitUnresolved = 2;
constexpr int kExitAborted = 3;

struct Options {
    std::string a;
    std::string b;
    std::string config_path;
    std::optional<size_t> max_nodes;
    bool as_json = false;
};

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <person-a> <person-b> [--max-nodes N] [--json] [--config file]" << std::endl;
}

bool parse_args(int argc, char** argv, Options& opts) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            opts.as_json = true;
        } else if (arg == "--max-nodes" && i + 1 < argc) {
            try {
                opts.max_nodes = parse_max_nodes(argv[++i]);
            } catch (const ConfigError& e) {
                std::cerr << e.what() << std::endl;
                return false;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-' && arg.find_first_not_of("0123456789", 1) != std::string::npos) {
            return false;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) return false;
    opts.a = positional[0];
    opts.b = positional[1];
    return true;
}

json person_json(const PersonRecord& p) {
    json j = {{"id", p.id}, {"name", p.name}};
    j["birth"] = p.birth ? json(*p.birth) : json(nullptr);
    return j;
}

json link_json(const PathLink& link) {
    json movie = {{"id", link.movie.movie_id}, {"title", link.movie.title}};
    movie["year"] = link.movie.year ? json(*link.movie.year) : json(nullptr);
    movie["average_rating"] = link.movie.average_rating ? json(*link.movie.average_rating) : json(nullptr);

    json from = person_json(link.from);
    from["role"] = link.movie.role_a;
    json to = person_json(link.to);
    to["role"] = link.movie.role_b;

    return {{"from", from}, {"to", to}, {"movie", movie}, {"sentence", link.sentence}};
}

// Reports an unresolved input; returns true when the input resolved to one person.
bool report_resolution(const std::string& input, const Resolution& r, bool as_json, json& out) {
    if (r.exact()) return true;

    if (r.kind == ResolutionKind::NotFound) {
        if (as_json) {
            out["status"] = "not_found";
            out["input"] = input;
        } else {
            std::cout << "No person matches '" << input << "'." << std::endl;
        }
        return false;
    }

    if (as_json) {
        out["status"] = "ambiguous";
        out["input"] = input;
        out["candidates"] = json::array();
        for (const auto& c : r.display) {
            json cj = person_json(c.person);
            cj["known_for"] = c.known_for_titles;
            out["candidates"].push_back(cj);
        }
    } else {
        std::cout << "'" << input << "' matches " << r.candidates.size()
                  << " people; use an id:" << std::endl;
        for (const auto& c : r.display) {
            std::cout << "  " << c.person.name << "  id " << c.person.id;
            if (c.person.birth) std::cout << "  born " << *c.person.birth;
            std::cout << "  known for: ";
            for (size_t i = 0; i < c.known_for_titles.size(); ++i) {
                if (i) std::cout << ", ";
                std::cout << c.known_for_titles[i];
            }
            std::cout << std::endl;
        }
    }
    return false;
}

} // anonymous namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        usage(argv[0]);
        return kExitNoPath;
    }

    Logger::set_quiet(opts.as_json);
    json out = json::object();

    try {
        PipelineConfig config = opts.config_path.empty() ? PipelineConfig{}
                                                         : PipelineConfig::load(opts.config_path);
        PathConfig search;
        search.max_nodes = opts.max_nodes.value_or(config.search.max_nodes);

        PostgresConnection db;
        Schema::require_tables(db);

        PostgresGraphStore store(db);
        PersonResolver resolver(store);

        Resolution ra = resolver.resolve(opts.a);
        if (!report_resolution(opts.a, ra, opts.as_json, out)) {
            if (opts.as_json) std::cout << out.dump(2) << std::endl;
            return kExitUnresolved;
        }
        Resolution rb = resolver.resolve(opts.b);
        if (!report_resolution(opts.b, rb, opts.as_json, out)) {
            if (opts.as_json) std::cout << out.dump(2) << std::endl;
            return kExitUnresolved;
        }

        Logger::step("Searching from " + ra.person->name + " to " + rb.person->name);
        PathResolver paths(store);
        PathResult result;
        try {
            result = paths.find(ra.person->id, rb.person->id, search);
        } catch (const SearchAborted& e) {
            if (opts.as_json) {
                out["status"] = "aborted";
                out["nodes_dequeued"] = e.nodes_dequeued();
                std::cout << out.dump(2) << std::endl;
            } else {
                Logger::error(e.what());
            }
            return kExitAborted;
        }

        if (!result.found()) {
            if (opts.as_json) {
                out["status"] = "no_path";
                out["nodes_dequeued"] = result.nodes_dequeued;
                std::cout << out.dump(2) << std::endl;
            } else {
                std::cout << "No path between " << ra.person->name << " and "
                          << rb.person->name << "." << std::endl;
            }
            return kExitNoPath;
        }

        PathHydrator hydrator(store);
        const auto links = hydrator.describe(result.path);

        if (opts.as_json) {
            out["status"] = "found";
            out["path"] = result.path;
            out["nodes_dequeued"] = result.nodes_dequeued;
            out["links"] = json::array();
            for (const auto& link : links) out["links"].push_back(link_json(link));
            std::cout << out.dump(2) << std::endl;
        } else {
            std::cout << ra.person->name << " -> " << rb.person->name << ": "
                      << result.hops() << " degree" << (result.hops() == 1 ? "" : "s") << std::endl;
            for (const auto& link : links) std::cout << "  " << link.sentence << std::endl;
        }
        return kExitFound;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return kExitNoPath;
    }
}
