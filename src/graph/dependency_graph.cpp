#include "graph/dependency_graph.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <sstream>
#include <utility>

#include "core/errors.hpp"
#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace rehost::graph
{
    namespace
    {

        std::string trim(const std::string &value)
        {
            const auto begin = value.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(begin, end - begin + 1);
        }

        struct LddtreeLine
        {
            std::size_t indent = 0;
            std::string name;
            std::optional<std::string> path;
        };

        // "  libfoo.so => /lib64/libfoo.so" or "libbar.so => not found".
        std::optional<LddtreeLine> parseLddtreeLine(const std::string &raw)
        {
            const std::size_t indent = raw.find_first_not_of(" \t");
            if (indent == std::string::npos)
            {
                return std::nullopt;
            }

            std::string body = raw.substr(indent);
            const auto interp = body.find(" (interpreter");
            if (interp != std::string::npos)
            {
                body.erase(interp);
            }

            LddtreeLine line;
            line.indent = indent;
            const auto arrow = body.find("=>");
            if (arrow == std::string::npos)
            {
                line.name = trim(body);
            }
            else
            {
                line.name = trim(body.substr(0, arrow));
                std::string target = trim(body.substr(arrow + 2));
                if (target != "not found" && !target.empty())
                {
                    line.path = target.substr(0, target.find_first_of(" \t"));
                }
            }

            if (line.name.empty())
            {
                return std::nullopt;
            }
            return line;
        }

    } // namespace

    std::size_t DependencyGraph::addLibrary(const std::string &name)
    {
        auto it = index_.find(name);
        if (it != index_.end())
        {
            return it->second;
        }

        DependencyNode node;
        node.libraryName = name;
        nodes_.push_back(std::move(node));
        index_[name] = nodes_.size() - 1;
        return nodes_.size() - 1;
    }

    void DependencyGraph::addEdge(const std::string &consumer, const std::string &dependency)
    {
        const std::size_t from = addLibrary(consumer);
        const std::size_t to = addLibrary(dependency);

        auto &edges = nodes_[from].dependencies;
        if (std::find(edges.begin(), edges.end(), to) != edges.end())
        {
            return;
        }
        edges.push_back(to);
        nodes_[to].requiredBy.push_back(from);
    }

    void DependencyGraph::resolve(const std::string &library, const fs::path &path)
    {
        nodes_[addLibrary(library)].resolvedPath = path;
    }

    bool DependencyGraph::contains(const std::string &name) const
    {
        return index_.find(name) != index_.end();
    }

    std::optional<std::size_t> DependencyGraph::indexOf(const std::string &name) const
    {
        auto it = index_.find(name);
        if (it == index_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> DependencyGraph::closure(const std::string &root) const
    {
        const auto start = indexOf(root);
        if (!start.has_value())
        {
            return {root};
        }

        std::vector<bool> visited(nodes_.size(), false);
        std::deque<std::size_t> queue;
        std::vector<std::string> out;

        visited[start.value()] = true;
        queue.push_back(start.value());
        while (!queue.empty())
        {
            const std::size_t current = queue.front();
            queue.pop_front();
            out.push_back(nodes_[current].libraryName);

            for (std::size_t dep : nodes_[current].dependencies)
            {
                if (!visited[dep])
                {
                    visited[dep] = true;
                    queue.push_back(dep);
                }
            }
        }
        return out;
    }

    ClosureReport DependencyGraph::closureReport(const std::string &root) const
    {
        ClosureReport report;
        report.root = root;
        report.members = closure(root);
        for (std::size_t i = 1; i < report.members.size(); ++i)
        {
            const auto index = indexOf(report.members[i]);
            if (!index.has_value() || !nodes_[index.value()].resolvedPath.has_value())
            {
                report.unresolved.push_back(report.members[i]);
            }
        }
        if (contains(root))
        {
            report.cycles = findCycles(root);
        }
        return report;
    }

    std::vector<std::vector<std::string>> DependencyGraph::findCycles(const std::string &root) const
    {
        enum class Mark
        {
            White,
            Gray,
            Black
        };

        std::vector<Mark> marks(nodes_.size(), Mark::White);
        std::vector<std::vector<std::string>> cycles;

        std::vector<std::size_t> starts;
        if (root.empty())
        {
            for (std::size_t i = 0; i < nodes_.size(); ++i)
            {
                starts.push_back(i);
            }
        }
        else if (const auto start = indexOf(root); start.has_value())
        {
            starts.push_back(start.value());
        }

        for (std::size_t start : starts)
        {
            if (marks[start] != Mark::White)
            {
                continue;
            }

            // (node, next edge to explore)
            std::vector<std::pair<std::size_t, std::size_t>> stack;
            stack.emplace_back(start, 0);
            marks[start] = Mark::Gray;

            while (!stack.empty())
            {
                auto &[current, edge] = stack.back();
                const auto &deps = nodes_[current].dependencies;
                if (edge >= deps.size())
                {
                    marks[current] = Mark::Black;
                    stack.pop_back();
                    continue;
                }

                const std::size_t next = deps[edge++];
                if (marks[next] == Mark::White)
                {
                    marks[next] = Mark::Gray;
                    stack.emplace_back(next, 0);
                    continue;
                }
                if (marks[next] == Mark::Gray)
                {
                    std::vector<std::string> cycle;
                    auto it = std::find_if(stack.begin(), stack.end(), [next](const auto &entry)
                                           { return entry.first == next; });
                    for (; it != stack.end(); ++it)
                    {
                        cycle.push_back(nodes_[it->first].libraryName);
                    }
                    cycle.push_back(nodes_[next].libraryName);
                    cycles.push_back(std::move(cycle));
                }
            }
        }
        return cycles;
    }

    std::vector<std::string> DependencyGraph::dependencyFirstOrder(const std::vector<std::string> &names) const
    {
        std::map<std::string, std::size_t> wanted;
        for (const auto &name : names)
        {
            wanted.emplace(name, 0);
        }

        std::vector<std::string> out;
        std::vector<bool> visited(nodes_.size(), false);
        std::map<std::string, bool> emitted;

        auto emit = [&](const std::string &name)
        {
            if (wanted.count(name) != 0 && !emitted[name])
            {
                emitted[name] = true;
                out.push_back(name);
            }
        };

        for (const auto &name : names)
        {
            const auto start = indexOf(name);
            if (!start.has_value())
            {
                emit(name);
                continue;
            }
            if (visited[start.value()])
            {
                continue;
            }

            // Post-order walk so dependencies are emitted before consumers.
            std::vector<std::pair<std::size_t, std::size_t>> stack;
            stack.emplace_back(start.value(), 0);
            visited[start.value()] = true;
            while (!stack.empty())
            {
                auto &[current, edge] = stack.back();
                const auto &deps = nodes_[current].dependencies;
                if (edge < deps.size())
                {
                    const std::size_t next = deps[edge++];
                    if (!visited[next])
                    {
                        visited[next] = true;
                        stack.emplace_back(next, 0);
                    }
                    continue;
                }
                const std::string finished = nodes_[current].libraryName;
                stack.pop_back();
                emit(finished);
            }
        }
        return out;
    }

    DependencyGraph parseDependencyPairs(const std::string &text)
    {
        DependencyGraph graph;
        std::istringstream input(text);
        std::string line;
        std::size_t lineNumber = 0;
        while (std::getline(input, line))
        {
            ++lineNumber;
            const auto hash = line.find('#');
            if (hash != std::string::npos)
            {
                line.erase(hash);
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }

            std::istringstream fields(line);
            std::string consumer;
            std::string dependency;
            std::string extra;
            if (!(fields >> consumer >> dependency) || (fields >> extra))
            {
                throw ConfigError("dependency pairs line " + std::to_string(lineNumber) + ": expected '<consumer> <dependency>'");
            }
            graph.addEdge(consumer, dependency);
        }
        return graph;
    }

    DependencyGraph parseDependencyJson(const json &data)
    {
        if (!data.is_object())
        {
            throw ConfigError("dependency map must be a JSON object of consumer -> [dependencies]");
        }

        DependencyGraph graph;
        for (const auto &[consumer, deps] : data.items())
        {
            graph.addLibrary(consumer);
            if (!deps.is_array())
            {
                throw ConfigError("dependencies of '" + consumer + "' must be an array");
            }
            for (const auto &dep : deps)
            {
                if (!dep.is_string())
                {
                    throw ConfigError("dependencies of '" + consumer + "' must be strings");
                }
                graph.addEdge(consumer, dep.get<std::string>());
            }
        }
        return graph;
    }

    DependencyGraph parseLddtree(const std::string &text)
    {
        DependencyGraph graph;
        // Open ancestors as (indent, library name).
        std::vector<std::pair<std::size_t, std::string>> parents;

        std::istringstream input(text);
        std::string raw;
        while (std::getline(input, raw))
        {
            const auto line = parseLddtreeLine(raw);
            if (!line.has_value())
            {
                continue;
            }

            while (!parents.empty() && parents.back().first >= line->indent)
            {
                parents.pop_back();
            }

            graph.addLibrary(line->name);
            if (line->path.has_value())
            {
                graph.resolve(line->name, line->path.value());
            }
            if (!parents.empty())
            {
                graph.addEdge(parents.back().second, line->name);
            }
            parents.emplace_back(line->indent, line->name);
        }
        return graph;
    }

    DependencyGraph loadDependencyGraph(const fs::path &path, const rehost::Context &ctx)
    {
        DependencyGraph graph;
        if (path.extension() == ".json")
        {
            try
            {
                graph = parseDependencyJson(io::loadJsonDocument(path));
            }
            catch (const ConfigError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw ConfigError(e.what());
            }
        }
        else
        {
            const auto text = io::readTextFile(path);
            if (!text.has_value())
            {
                throw ConfigError("Could not read dependency file: " + path.string());
            }
            graph = text->find("=>") != std::string::npos ? parseLddtree(text.value()) : parseDependencyPairs(text.value());
        }

        ctx.log("Loaded dependency graph ", path.string(), " with ", graph.size(), " libraries");
        for (const auto &cycle : graph.findCycles())
        {
            std::ostringstream chain;
            for (std::size_t i = 0; i < cycle.size(); ++i)
            {
                chain << (i == 0 ? "" : " -> ") << cycle[i];
            }
            ctx.warn("Dependency cycle: ", chain.str());
        }
        return graph;
    }

    void resolveFromArtifacts(
        DependencyGraph &graph,
        const std::vector<model::FirmwareArtifact> &artifacts,
        const rehost::Context &ctx)
    {
        std::map<std::string, const model::FirmwareArtifact *> byName;
        for (const auto &artifact : artifacts)
        {
            const std::string name = fs::path(artifact.relativePath).filename().string();
            auto [it, inserted] = byName.emplace(name, &artifact);
            if (!inserted && graph.contains(name))
            {
                ctx.debug("Library ", name, " provided by ", it->second->relativePath, ", ignoring ", artifact.relativePath);
            }
        }

        std::size_t resolved = 0;
        for (std::size_t i = 0; i < graph.size(); ++i)
        {
            const std::string &name = graph.node(i).libraryName;
            auto it = byName.find(name);
            if (it != byName.end())
            {
                graph.resolve(name, it->second->sourcePath);
                ++resolved;
            }
        }
        ctx.debug("Resolved ", resolved, " of ", graph.size(), " libraries against firmware");
    }

} // namespace rehost::graph
