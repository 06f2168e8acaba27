#include "model/strategy_loader.hpp"

#include <algorithm>
#include <queue>
#include <set>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace rehost::model
{
    namespace
    {

        enum class TokenKind
        {
            Literal,
            AnyChar,
            Star,
            DoubleStar,
            // "**/": zero or more whole directories. Always followed by a '/' literal.
            DirectoryStar
        };

        struct GlobToken
        {
            TokenKind kind = TokenKind::Literal;
            char ch = '\0';
        };

        std::vector<GlobToken> tokenizePattern(const std::string &pattern)
        {
            std::vector<GlobToken> out;
            for (std::size_t i = 0; i < pattern.size(); ++i)
            {
                const char c = pattern[i];
                if (c == '*')
                {
                    if (i + 1 < pattern.size() && pattern[i + 1] == '*')
                    {
                        ++i;
                        if (i + 1 < pattern.size() && pattern[i + 1] == '/')
                        {
                            out.push_back({TokenKind::DirectoryStar, '\0'});
                            continue;
                        }
                        out.push_back({TokenKind::DoubleStar, '\0'});
                        continue;
                    }
                    out.push_back({TokenKind::Star, '\0'});
                    continue;
                }
                if (c == '?')
                {
                    out.push_back({TokenKind::AnyChar, '\0'});
                    continue;
                }
                out.push_back({TokenKind::Literal, c});
            }
            return out;
        }

        std::vector<GlobToken> tokenizeLiteral(const std::string &path)
        {
            std::vector<GlobToken> out;
            out.reserve(path.size());
            for (char c : path)
            {
                out.push_back({TokenKind::Literal, c});
            }
            return out;
        }

        bool isRepeating(const GlobToken &token)
        {
            return token.kind == TokenKind::Star || token.kind == TokenKind::DoubleStar ||
                   token.kind == TokenKind::DirectoryStar;
        }

        bool crossesSlash(const GlobToken &token)
        {
            return token.kind == TokenKind::DoubleStar || token.kind == TokenKind::DirectoryStar;
        }

        // Whether some character can be consumed by both tokens.
        bool charsOverlap(const GlobToken &a, const GlobToken &b)
        {
            if (a.kind == TokenKind::Literal && b.kind == TokenKind::Literal)
            {
                return a.ch == b.ch;
            }
            if (a.kind == TokenKind::Literal)
            {
                return crossesSlash(b) || a.ch != '/';
            }
            if (b.kind == TokenKind::Literal)
            {
                return crossesSlash(a) || b.ch != '/';
            }
            return true;
        }

        // Product automaton over the two token lists; reachable (end, end) means a
        // common string exists. A "**/" token that has consumed characters must
        // leave through its '/' literal, only a fresh one may skip whole.
        bool tokensIntersect(const std::vector<GlobToken> &a, const std::vector<GlobToken> &b)
        {
            struct State
            {
                std::size_t i;
                std::size_t j;
                bool aStarted;
                bool bStarted;
            };

            const std::size_t width = b.size() + 1;
            std::vector<bool> seen((a.size() + 1) * width * 4, false);
            std::queue<State> pending;

            auto push = [&](std::size_t i, std::size_t j, bool aStarted, bool bStarted)
            {
                const std::size_t key = ((i * width + j) << 2) | (aStarted ? 2U : 0U) | (bStarted ? 1U : 0U);
                if (!seen[key])
                {
                    seen[key] = true;
                    pending.push({i, j, aStarted, bStarted});
                }
            };

            push(0, 0, false, false);
            while (!pending.empty())
            {
                const State state = pending.front();
                pending.pop();
                const std::size_t i = state.i;
                const std::size_t j = state.j;

                if (i == a.size() && j == b.size())
                {
                    return true;
                }
                if (i < a.size() && isRepeating(a[i]))
                {
                    if (a[i].kind != TokenKind::DirectoryStar)
                    {
                        push(i + 1, j, false, state.bStarted);
                    }
                    else if (state.aStarted)
                    {
                        push(i + 1, j, false, state.bStarted);
                    }
                    else
                    {
                        push(i + 2, j, false, state.bStarted);
                    }
                }
                if (j < b.size() && isRepeating(b[j]))
                {
                    if (b[j].kind != TokenKind::DirectoryStar)
                    {
                        push(i, j + 1, state.aStarted, false);
                    }
                    else if (state.bStarted)
                    {
                        push(i, j + 1, state.aStarted, false);
                    }
                    else
                    {
                        push(i, j + 2, state.aStarted, false);
                    }
                }
                if (i < a.size() && j < b.size() && charsOverlap(a[i], b[j]))
                {
                    const bool aStays = isRepeating(a[i]);
                    const bool bStays = isRepeating(b[j]);
                    push(aStays ? i : i + 1, bStays ? j : j + 1,
                         aStays && a[i].kind == TokenKind::DirectoryStar,
                         bStays && b[j].kind == TokenKind::DirectoryStar);
                }
            }
            return false;
        }

        std::string normalizePattern(std::string value)
        {
            while (value.rfind("./", 0) == 0)
            {
                value.erase(0, 2);
            }
            while (!value.empty() && value.front() == '/')
            {
                value.erase(0, 1);
            }
            return value;
        }

        std::vector<std::string> toStringList(const json &node)
        {
            std::vector<std::string> out;
            if (!node.is_array())
            {
                return out;
            }

            for (const auto &item : node)
            {
                if (!item.is_string())
                {
                    continue;
                }
                std::string value = item.get<std::string>();
                if (!value.empty())
                {
                    out.push_back(value);
                }
            }
            return out;
        }

        std::string requireString(const json &node, const char *key, std::size_t index)
        {
            if (!node.contains(key) || !node[key].is_string())
            {
                throw ConfigError("rule " + std::to_string(index) + ": missing string field '" + key + "'");
            }
            return node[key].get<std::string>();
        }

        InjectionRule parseRule(const json &node, std::size_t index)
        {
            if (!node.is_object())
            {
                throw ConfigError("rule " + std::to_string(index) + ": expected object");
            }

            InjectionRule rule;
            rule.declarationIndex = index;
            rule.pattern = normalizePattern(requireString(node, "pattern", index));
            if (rule.pattern.empty())
            {
                throw ConfigError("rule " + std::to_string(index) + ": empty pattern");
            }

            const std::string moduleType = requireString(node, "module_type", index);
            const auto type = parseModuleType(moduleType);
            if (!type.has_value())
            {
                throw ConfigError("rule " + std::to_string(index) + ": unknown module_type '" + moduleType + "'");
            }
            rule.moduleType = type.value();

            const std::string phaseText = requireString(node, "phase", index);
            const auto phase = parsePhase(phaseText);
            if (!phase.has_value())
            {
                throw ConfigError("rule " + std::to_string(index) + ": unknown phase '" + phaseText + "'");
            }
            rule.phase = phase.value();

            const std::string policyText = node.value("overwrite_policy", std::string("fail"));
            const auto policy = parseOverwritePolicy(policyText);
            if (!policy.has_value())
            {
                throw ConfigError("rule " + std::to_string(index) + ": unknown overwrite_policy '" + policyText + "'");
            }
            rule.overwritePolicy = policy.value();

            if (rule.moduleType == ModuleType::ApexPayload && rule.phase != Phase::PostBuild)
            {
                throw ConfigError("rule " + std::to_string(index) + ": apex_payload rules must use phase post_build");
            }

            rule.literalPrefix = literalPrefixOf(rule.pattern);
            return rule;
        }

        void validateRules(const std::vector<InjectionRule> &rules)
        {
            std::set<std::pair<Phase, std::string>> patterns;
            for (const auto &rule : rules)
            {
                if (!patterns.emplace(rule.phase, rule.pattern).second)
                {
                    throw ConfigError("duplicate pattern '" + rule.pattern + "' in phase " + toString(rule.phase));
                }
            }

            for (std::size_t i = 0; i < rules.size(); ++i)
            {
                for (std::size_t j = i + 1; j < rules.size(); ++j)
                {
                    const auto &left = rules[i];
                    const auto &right = rules[j];
                    if (left.literalPrefix != right.literalPrefix)
                    {
                        continue;
                    }
                    // Equal prefixes cannot be ranked, so any overlap leaves one rule unreachable.
                    if (globsIntersect(left.pattern, right.pattern))
                    {
                        throw ConfigError(
                            "ambiguous rules '" + left.pattern + "' (" + toString(left.moduleType) + ", " +
                            toString(left.phase) + ") and '" + right.pattern + "' (" + toString(right.moduleType) +
                            ", " + toString(right.phase) + ") share prefix '" + left.literalPrefix +
                            "' and can match the same path");
                    }
                }
            }
        }

        std::string lowerExtension(const std::string &relativePath)
        {
            std::string ext = fs::path(relativePath).extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

    } // namespace

    std::string literalPrefixOf(const std::string &pattern)
    {
        const std::size_t wildcard = pattern.find_first_of("*?");
        return wildcard == std::string::npos ? pattern : pattern.substr(0, wildcard);
    }

    bool globMatch(const std::string &pattern, const std::string &path)
    {
        return tokensIntersect(tokenizePattern(pattern), tokenizeLiteral(path));
    }

    bool globsIntersect(const std::string &left, const std::string &right)
    {
        return tokensIntersect(tokenizePattern(left), tokenizePattern(right));
    }

    InjectionStrategy parseStrategy(const json &data, const fs::path &sourceFile)
    {
        InjectionStrategy strategy;
        strategy.sourceFile = sourceFile;

        const json *rules = nullptr;
        if (data.is_array())
        {
            rules = &data;
        }
        else if (data.is_object() && data.contains("rules") && data["rules"].is_array())
        {
            rules = &data["rules"];
        }
        else
        {
            throw ConfigError("strategy must be an array of rules or an object with a 'rules' array");
        }

        std::size_t index = 0;
        for (const auto &node : *rules)
        {
            strategy.rules.push_back(parseRule(node, index++));
        }

        if (data.is_object() && data.contains("exclude"))
        {
            const json &exclude = data["exclude"];
            if (!exclude.is_object())
            {
                throw ConfigError("'exclude' must be an object");
            }
            strategy.exclude.keywords = toStringList(exclude.value("keywords", json::array()));
            strategy.exclude.extensions = toStringList(exclude.value("extensions", json::array()));
            strategy.exclude.files = toStringList(exclude.value("files", json::array()));
        }

        validateRules(strategy.rules);

        strategy.resolutionOrder.resize(strategy.rules.size());
        for (std::size_t i = 0; i < strategy.rules.size(); ++i)
        {
            strategy.resolutionOrder[i] = i;
        }
        std::stable_sort(strategy.resolutionOrder.begin(), strategy.resolutionOrder.end(),
                         [&](std::size_t a, std::size_t b)
                         {
                             return strategy.rules[a].literalPrefix.size() > strategy.rules[b].literalPrefix.size();
                         });
        return strategy;
    }

    InjectionStrategy loadStrategy(const fs::path &strategyFile, const rehost::Context &ctx)
    {
        json data;
        try
        {
            data = io::loadJsonDocument(strategyFile);
        }
        catch (const std::exception &e)
        {
            throw ConfigError(e.what());
        }

        InjectionStrategy strategy = parseStrategy(data, fs::absolute(strategyFile));
        ctx.log("Loaded strategy ", strategyFile.string(), " with ", strategy.rules.size(), " rules");
        for (const auto &rule : strategy.rules)
        {
            ctx.debug("  ", rule.pattern, " -> ", toString(rule.moduleType), " [", toString(rule.phase), ", ",
                      toString(rule.overwritePolicy), "]");
        }
        return strategy;
    }

    bool isExcluded(const InjectionStrategy &strategy, const std::string &relativePath)
    {
        const ExcludeFilter &filter = strategy.exclude;
        const std::string fileName = fs::path(relativePath).filename().string();
        if (std::find(filter.files.begin(), filter.files.end(), fileName) != filter.files.end())
        {
            return true;
        }

        const std::string ext = lowerExtension(relativePath);
        if (!ext.empty() && std::find(filter.extensions.begin(), filter.extensions.end(), ext) != filter.extensions.end())
        {
            return true;
        }

        return std::any_of(filter.keywords.begin(), filter.keywords.end(), [&](const std::string &keyword)
                           { return relativePath.find(keyword) != std::string::npos; });
    }

    const InjectionRule *resolveRule(const InjectionStrategy &strategy, const std::string &relativePath)
    {
        for (std::size_t index : strategy.resolutionOrder)
        {
            const InjectionRule &rule = strategy.rules[index];
            if (relativePath.compare(0, rule.literalPrefix.size(), rule.literalPrefix) != 0)
            {
                continue;
            }
            if (globMatch(rule.pattern, relativePath))
            {
                return &rule;
            }
        }
        return nullptr;
    }

    std::optional<RuleMatch> matchArtifact(const InjectionStrategy &strategy, const FirmwareArtifact &artifact)
    {
        if (isExcluded(strategy, artifact.relativePath))
        {
            return std::nullopt;
        }

        const InjectionRule *rule = resolveRule(strategy, artifact.relativePath);
        if (rule == nullptr)
        {
            return std::nullopt;
        }

        RuleMatch match;
        match.rule = rule;
        match.moduleType = rule->moduleType == ModuleType::Auto ? classifyArtifact(artifact) : rule->moduleType;
        return match;
    }

    ModuleType classifyArtifact(const FirmwareArtifact &artifact)
    {
        const std::string &path = artifact.relativePath;
        const std::string ext = lowerExtension(path);
        const std::string parent = fs::path(path).parent_path().generic_string();

        if (ext.empty())
        {
            const bool inBinDir = parent.find("bin") != std::string::npos;
            if (inBinDir || io::readElfClass(artifact.sourcePath) != io::ElfClass::None)
            {
                return ModuleType::Executable;
            }
        }
        if (ext == ".jar")
        {
            return ModuleType::JavaLib;
        }
        if (ext == ".so")
        {
            return ModuleType::SharedLib;
        }
        if (ext == ".apk")
        {
            return ModuleType::App;
        }
        if (ext == ".xml" || ("/" + path).find("/etc/") != std::string::npos)
        {
            return ModuleType::Etc;
        }
        if (ext == ".apex" || ext == ".capex")
        {
            return ModuleType::Apex;
        }
        return ModuleType::Misc;
    }

} // namespace rehost::model
