#include "inject/pre_build_injector.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <system_error>
#include <unordered_set>
#include <utility>

#include "core/errors.hpp"
#include "inject/blueprint.hpp"
#include "inject/board_config.hpp"
#include "inject/partition_paths.hpp"
#include "io/fs_utils.hpp"
#include "model/strategy_loader.hpp"

namespace fs = std::filesystem;

namespace rehost::inject
{
    namespace
    {

        struct Candidate
        {
            const model::FirmwareArtifact *artifact = nullptr;
            const model::InjectionRule *rule = nullptr;
            model::ModuleType moduleType = model::ModuleType::Misc;
        };

        struct PlannedEntry
        {
            const model::FirmwareArtifact *artifact = nullptr;
            BlueprintEntry blueprint;
        };

        struct PlannedModule
        {
            std::string moduleName;
            model::ModuleType moduleType = model::ModuleType::Misc;
            std::vector<PlannedEntry> entries;
            std::vector<std::string> sharedLibs;
            fs::path destination;
            bool skip = false;
            bool replace = false;
            std::string blueprintText;
        };

        std::string fileNameOf(const model::FirmwareArtifact &artifact)
        {
            return fs::path(artifact.relativePath).filename().string();
        }

        std::string parentOf(const model::FirmwareArtifact &artifact)
        {
            return fs::path(artifact.relativePath).parent_path().generic_string();
        }

        // lib and bin names drop the extension, other files keep it so foo.xml and foo.rc stay apart.
        std::string moduleBaseName(const model::FirmwareArtifact &artifact, model::ModuleType type)
        {
            const fs::path file = fs::path(artifact.relativePath).filename();
            if (type == model::ModuleType::SharedLib || type == model::ModuleType::Executable || type == model::ModuleType::App)
            {
                return file.stem().string();
            }
            return file.string();
        }

        // ELF class from the header, else from a lib/ or lib64/ directory in the path.
        io::ElfClass bitnessOf(const model::FirmwareArtifact &artifact)
        {
            const io::ElfClass elf = io::readElfClass(artifact.sourcePath);
            if (elf != io::ElfClass::None)
            {
                return elf;
            }
            const std::string path = "/" + artifact.relativePath;
            if (path.find("/lib64/") != std::string::npos)
            {
                return io::ElfClass::Elf64;
            }
            if (path.find("/lib/") != std::string::npos)
            {
                return io::ElfClass::Elf32;
            }
            return io::ElfClass::None;
        }

        std::string libraryReference(const std::string &fileName)
        {
            return fs::path(fileName).stem().string();
        }

        class PresenceIndex
        {
        public:
            PresenceIndex(const model::TreeHandle &tree, const PreBuildOptions &options, const rehost::Context &ctx)
            {
                for (const auto &lib : options.providedLibs)
                {
                    names_.insert(lib);
                }
                for (const auto &dir : options.presenceDirs)
                {
                    const fs::path root = tree.root / dir;
                    std::size_t count = 0;
                    for (const auto &relative : io::listFilesRecursive(root))
                    {
                        names_.insert(relative.filename().string());
                        ++count;
                    }
                    ctx.debug("Presence index: ", count, " files under ", root.string());
                }
            }

            bool contains(const std::string &fileName) const
            {
                return names_.count(fileName) != 0 || names_.count(libraryReference(fileName)) != 0;
            }

        private:
            std::unordered_set<std::string> names_;
        };

        class InjectionPlanner
        {
        public:
            InjectionPlanner(
                const model::InjectionStrategy &strategy,
                const std::vector<model::FirmwareArtifact> &artifacts,
                const graph::DependencyGraph &graph,
                const model::TreeHandle &tree,
                const PreBuildOptions &options,
                const rehost::Context &ctx)
                : strategy_(strategy), artifacts_(artifacts), graph_(graph), tree_(tree), options_(options), ctx_(ctx),
                  presence_(tree, options, ctx)
            {
                for (const auto &artifact : artifacts_)
                {
                    byName_[fileNameOf(artifact)].push_back(&artifact);
                }
            }

            std::vector<PlannedModule> plan(PreBuildResult &result)
            {
                collectCandidates();

                std::vector<PlannedModule> modules;
                for (const auto &candidate : orderedCandidates())
                {
                    if (plannedByPath_.count(candidate.artifact->relativePath) != 0)
                    {
                        continue;
                    }
                    modules.push_back(planModule(candidate, result));
                }
                return modules;
            }

        private:
            void collectCandidates()
            {
                for (const auto &artifact : artifacts_)
                {
                    const auto match = model::matchArtifact(strategy_, artifact);
                    if (!match.has_value() || match->rule->phase != model::Phase::PreBuild)
                    {
                        continue;
                    }
                    candidates_.push_back({&artifact, match->rule, match->moduleType});
                    candidateByPath_[artifact.relativePath] = candidates_.size() - 1;
                }
                ctx_.log("Pre-build candidates: ", candidates_.size(), " of ", artifacts_.size(), " artifacts");
            }

            std::vector<Candidate> orderedCandidates() const
            {
                std::vector<Candidate> sorted = candidates_;
                std::stable_sort(sorted.begin(), sorted.end(), [](const Candidate &a, const Candidate &b)
                                 { return a.artifact->relativePath < b.artifact->relativePath; });

                std::vector<std::string> names;
                std::set<std::string> seen;
                for (const auto &candidate : sorted)
                {
                    const std::string name = fileNameOf(*candidate.artifact);
                    if (seen.insert(name).second)
                    {
                        names.push_back(name);
                    }
                }

                std::map<std::string, std::size_t> rank;
                const auto order = graph_.dependencyFirstOrder(names);
                for (std::size_t i = 0; i < order.size(); ++i)
                {
                    rank[order[i]] = i;
                }

                std::stable_sort(sorted.begin(), sorted.end(), [&rank](const Candidate &a, const Candidate &b)
                                 { return rank[fileNameOf(*a.artifact)] < rank[fileNameOf(*b.artifact)]; });
                return sorted;
            }

            // Same-directory artifact first, then the first one of the root's ELF class.
            // A library of the other class never satisfies the root.
            const model::FirmwareArtifact *resolveMember(const std::string &name, const model::FirmwareArtifact &root) const
            {
                auto it = byName_.find(name);
                if (it == byName_.end() || it->second.empty())
                {
                    return nullptr;
                }
                const std::string rootParent = parentOf(root);
                for (const auto *artifact : it->second)
                {
                    if (parentOf(*artifact) == rootParent)
                    {
                        return artifact;
                    }
                }

                const io::ElfClass rootClass = bitnessOf(root);
                for (const auto *artifact : it->second)
                {
                    const io::ElfClass memberClass = bitnessOf(*artifact);
                    if (rootClass == io::ElfClass::None || memberClass == io::ElfClass::None || memberClass == rootClass)
                    {
                        return artifact;
                    }
                    ctx_.debug("Ignoring ", artifact->relativePath, " for ", root.relativePath, ": ELF class differs");
                }
                return nullptr;
            }

            std::string claimModuleName(const model::FirmwareArtifact &artifact, model::ModuleType type)
            {
                const std::string base = moduleBaseName(artifact, type);
                std::string name = sanitizeModuleName(base) + kModuleSuffix;
                if (usedNames_.insert(name).second)
                {
                    return name;
                }

                const std::string parent = fs::path(artifact.relativePath).parent_path().filename().string();
                name = sanitizeModuleName(base + "_" + parent) + kModuleSuffix;
                if (usedNames_.insert(name).second)
                {
                    ctx_.debug("Module name disambiguated: ", artifact.relativePath, " -> ", name);
                    return name;
                }
                throw InjectionError("Module name collision for " + artifact.relativePath + " (" + name + ")");
            }

            BlueprintEntry makeEntry(const model::FirmwareArtifact &artifact, model::ModuleType type, const std::string &name) const
            {
                const std::string normalized = normalizeOutputPath(artifact.relativePath);
                BlueprintEntry entry;
                entry.name = name;
                entry.stem = fs::path(artifact.relativePath).stem().string();
                entry.src = fileNameOf(artifact);
                entry.type = type;
                entry.partition = partitionOf(artifact.relativePath);
                entry.installSubdir = installSubdirOf(normalized);
                entry.is64Bit = io::readElfClass(artifact.sourcePath) != io::ElfClass::Elf32 &&
                                normalized.find("/lib/") == std::string::npos;
                return entry;
            }

            bool sharesCycle(const std::string &member, const std::string &root) const
            {
                const auto reach = graph_.closure(member);
                return std::find(reach.begin(), reach.end(), root) != reach.end();
            }

            PlannedModule planModule(const Candidate &candidate, PreBuildResult &result)
            {
                const model::FirmwareArtifact &root = *candidate.artifact;
                const std::string rootName = fileNameOf(root);

                PlannedModule module;
                module.moduleType = candidate.moduleType;
                module.moduleName = claimModuleName(root, candidate.moduleType);
                plannedByPath_[root.relativePath] = module.moduleName;
                module.entries.push_back({&root, makeEntry(root, candidate.moduleType, module.moduleName)});

                // Reference name per closure member, filled for present, injected and bundled members.
                std::map<std::string, std::string> references;
                const auto members = graph_.closure(rootName);
                for (std::size_t i = 1; i < members.size(); ++i)
                {
                    const std::string &member = members[i];
                    if (presence_.contains(member))
                    {
                        references[member] = libraryReference(member);
                        module.sharedLibs.push_back(references[member]);
                        continue;
                    }

                    const model::FirmwareArtifact *resolved = resolveMember(member, root);
                    if (resolved == nullptr)
                    {
                        const std::string warning = "Unresolved dependency " + member + " of " + root.relativePath;
                        ctx_.warn(warning);
                        result.warnings.push_back(warning);
                        result.unresolved.push_back(member);
                        continue;
                    }

                    auto planned = plannedByPath_.find(resolved->relativePath);
                    if (planned != plannedByPath_.end())
                    {
                        references[member] = planned->second;
                        module.sharedLibs.push_back(planned->second);
                        continue;
                    }

                    if (candidateByPath_.count(resolved->relativePath) != 0 && !sharesCycle(member, rootName))
                    {
                        throw InjectionError("Module " + module.moduleName + " references " + member +
                                             " which is injected by a later module");
                    }

                    const std::string bundledName = claimModuleName(*resolved, model::ModuleType::SharedLib);
                    plannedByPath_[resolved->relativePath] = bundledName;
                    references[member] = bundledName;
                    module.entries.push_back({resolved, makeEntry(*resolved, model::ModuleType::SharedLib, bundledName)});
                    ctx_.debug("Bundling ", resolved->relativePath, " into ", module.moduleName);
                }

                for (auto &entry : module.entries)
                {
                    const auto index = graph_.indexOf(fileNameOf(*entry.artifact));
                    if (!index.has_value())
                    {
                        continue;
                    }
                    for (std::size_t dep : graph_.node(index.value()).dependencies)
                    {
                        auto ref = references.find(graph_.node(dep).libraryName);
                        if (ref != references.end() && ref->second != entry.blueprint.name)
                        {
                            entry.blueprint.sharedLibs.push_back(ref->second);
                        }
                    }
                }

                std::vector<BlueprintEntry> blueprints;
                for (const auto &entry : module.entries)
                {
                    blueprints.push_back(entry.blueprint);
                }
                module.blueprintText = renderBlueprint(blueprints);
                module.destination = tree_.root / options_.injectDir / module.moduleName;
                applyOverwritePolicy(module, *candidate.rule, result);
                return module;
            }

            void applyOverwritePolicy(PlannedModule &module, const model::InjectionRule &rule, PreBuildResult &result)
            {
                std::error_code ec;
                if (!fs::exists(module.destination, ec))
                {
                    return;
                }

                for (const auto &entry : module.entries)
                {
                    const fs::path existing = module.destination / entry.blueprint.src;
                    if (!fs::exists(existing, ec))
                    {
                        continue;
                    }
                    const auto digest = io::sha256File(existing);
                    if (digest.has_value() && digest.value() != entry.artifact->sha256)
                    {
                        const std::string warning = "Version collision at " + existing.string() + ": tree " +
                                                    digest.value() + ", firmware " + entry.artifact->sha256;
                        ctx_.warn(warning);
                        result.warnings.push_back(warning);
                    }
                }

                switch (rule.overwritePolicy)
                {
                case model::OverwritePolicy::Fail:
                    throw InjectionError("Destination already exists: " + module.destination.string() +
                                         " (rule '" + rule.pattern + "' uses overwrite_policy fail)");
                case model::OverwritePolicy::Skip:
                    ctx_.log("Keeping existing module ", module.moduleName);
                    module.skip = true;
                    return;
                case model::OverwritePolicy::Replace:
                    ctx_.log("Replacing existing module ", module.moduleName);
                    module.replace = true;
                    return;
                }
            }

            const model::InjectionStrategy &strategy_;
            const std::vector<model::FirmwareArtifact> &artifacts_;
            const graph::DependencyGraph &graph_;
            const model::TreeHandle &tree_;
            const PreBuildOptions &options_;
            const rehost::Context &ctx_;
            PresenceIndex presence_;

            std::map<std::string, std::vector<const model::FirmwareArtifact *>> byName_;
            std::vector<Candidate> candidates_;
            std::map<std::string, std::size_t> candidateByPath_;
            std::map<std::string, std::string> plannedByPath_;
            std::set<std::string> usedNames_;
        };

        void checkRunMarker(const fs::path &marker, const std::string &runId)
        {
            std::error_code ec;
            if (!fs::exists(marker, ec))
            {
                return;
            }
            const auto owner = io::readTextFile(marker);
            if (!owner.has_value() || owner.value() != runId)
            {
                throw InjectionError("Tree is claimed by another run (" + marker.string() + "): " + owner.value_or("unreadable"));
            }
        }

        // Moves staged modules into place. Restores the previous tree when any step fails.
        class CommitTransaction
        {
        public:
            CommitTransaction(fs::path injectRoot, const std::string &runId, const rehost::Context &ctx)
                : injectRoot_(std::move(injectRoot)),
                  staging_(injectRoot_ / (".staging-" + runId)),
                  backup_(injectRoot_ / (".backup-" + runId)),
                  ctx_(ctx)
            {
            }

            ~CommitTransaction()
            {
                if (!committed_)
                {
                    rollback();
                }
                std::error_code ec;
                fs::remove_all(staging_, ec);
                fs::remove_all(backup_, ec);
            }

            CommitTransaction(const CommitTransaction &) = delete;
            CommitTransaction &operator=(const CommitTransaction &) = delete;

            void stage(const PlannedModule &module)
            {
                const fs::path dir = staging_ / module.moduleName;
                if (!io::ensureDir(dir))
                {
                    throw InjectionError("Could not create staging directory " + dir.string());
                }
                for (const auto &entry : module.entries)
                {
                    const fs::path target = dir / entry.blueprint.src;
                    if (!io::copyFileAtomic(entry.artifact->sourcePath, target))
                    {
                        throw InjectionError("Could not copy " + entry.artifact->sourcePath.string() + " to " + target.string());
                    }
                }
                if (!io::writeFileAtomic(dir / "Android.bp", module.blueprintText))
                {
                    throw InjectionError("Could not write Android.bp for " + module.moduleName);
                }
            }

            void install(const PlannedModule &module)
            {
                std::error_code ec;
                if (module.replace && fs::exists(module.destination, ec))
                {
                    const fs::path saved = backup_ / module.moduleName;
                    if (!io::ensureDir(backup_))
                    {
                        throw InjectionError("Could not create backup directory " + backup_.string());
                    }
                    fs::rename(module.destination, saved, ec);
                    if (ec)
                    {
                        throw InjectionError("Could not move aside " + module.destination.string() + ": " + ec.message());
                    }
                    backedUp_.emplace_back(saved, module.destination);
                }

                fs::rename(staging_ / module.moduleName, module.destination, ec);
                if (ec)
                {
                    throw InjectionError("Could not install " + module.destination.string() + ": " + ec.message());
                }
                installed_.push_back(module.destination);
            }

            void writeFile(const fs::path &path, const std::string &content)
            {
                std::optional<std::string> previous = io::readTextFile(path);
                if (!io::writeFileAtomic(path, content))
                {
                    throw InjectionError("Could not write " + path.string());
                }
                written_.emplace_back(path, std::move(previous));
            }

            void commit() { committed_ = true; }

        private:
            void rollback()
            {
                std::error_code ec;
                for (auto it = installed_.rbegin(); it != installed_.rend(); ++it)
                {
                    fs::remove_all(*it, ec);
                }
                for (const auto &[saved, original] : backedUp_)
                {
                    fs::rename(saved, original, ec);
                    if (ec)
                    {
                        ctx_.error("Could not restore ", original.string(), ": ", ec.message());
                    }
                }
                for (auto it = written_.rbegin(); it != written_.rend(); ++it)
                {
                    if (it->second.has_value())
                    {
                        if (!io::writeFileAtomic(it->first, it->second.value()))
                        {
                            ctx_.error("Could not restore ", it->first.string());
                        }
                    }
                    else
                    {
                        fs::remove(it->first, ec);
                    }
                }
                ctx_.warn("Pre-build injection rolled back under ", injectRoot_.string());
            }

            fs::path injectRoot_;
            fs::path staging_;
            fs::path backup_;
            const rehost::Context &ctx_;
            std::vector<fs::path> installed_;
            std::vector<std::pair<fs::path, fs::path>> backedUp_;
            std::vector<std::pair<fs::path, std::optional<std::string>>> written_;
            bool committed_ = false;
        };

        std::string hookedMakefile(const fs::path &makefile, const std::string &line)
        {
            std::string content = io::readTextFile(makefile).value_or("");
            if (content.find(line) != std::string::npos)
            {
                return content;
            }
            if (!content.empty() && content.back() != '\n')
            {
                content.push_back('\n');
            }
            return content + line + "\n";
        }

    } // namespace

    fs::path runMarkerPath(const model::TreeHandle &tree, const std::string &injectDir)
    {
        return tree.root / injectDir / kRunMarker;
    }

    PreBuildResult injectPreBuild(
        const model::InjectionStrategy &strategy,
        const std::vector<model::FirmwareArtifact> &artifacts,
        const graph::DependencyGraph &graph,
        const model::TreeHandle &tree,
        const PreBuildOptions &options,
        const rehost::Context &ctx)
    {
        std::error_code ec;
        if (!fs::is_directory(tree.root, ec))
        {
            throw InjectionError("Tree root does not exist: " + tree.root.string());
        }

        const fs::path injectRoot = tree.root / options.injectDir;
        const fs::path marker = runMarkerPath(tree, options.injectDir);
        checkRunMarker(marker, options.runId);

        PreBuildResult result;
        InjectionPlanner planner(strategy, artifacts, graph, tree, options, ctx);
        const std::vector<PlannedModule> plan = planner.plan(result);

        if (!io::ensureDir(injectRoot))
        {
            throw InjectionError("Could not create " + injectRoot.string());
        }

        std::vector<std::string> packageNames;
        {
            CommitTransaction transaction(injectRoot, options.runId, ctx);
            transaction.writeFile(marker, options.runId);

            for (const auto &module : plan)
            {
                if (!module.skip)
                {
                    transaction.stage(module);
                }
            }
            for (const auto &module : plan)
            {
                if (!module.skip)
                {
                    transaction.install(module);
                    ctx.log("Injected module ", module.moduleName, " (", model::toString(module.moduleType), ", ",
                            module.entries.size(), " files)");
                }
                for (const auto &entry : module.entries)
                {
                    packageNames.push_back(entry.blueprint.name);
                }
            }

            result.packagesFragment = injectRoot / kPackagesFragment;
            transaction.writeFile(result.packagesFragment, renderPackagesFragment(packageNames));

            if (!options.productMakefile.empty())
            {
                const fs::path makefile = tree.root / options.productMakefile;
                const std::string fragment = (fs::path(options.injectDir) / kPackagesFragment).generic_string();
                transaction.writeFile(makefile, hookedMakefile(makefile, inheritProductLine(fragment)));
            }

            if (!options.boardConfig.empty())
            {
                const fs::path boardConfig = tree.root / options.boardConfig;
                const auto content = io::readTextFile(boardConfig);
                if (!content)
                {
                    throw InjectionError("Board config not found: " + boardConfig.string());
                }
                result.partitionBytes = minimalPartitionSize(injectedPayloadBytes(injectRoot));
                transaction.writeFile(boardConfig, resizedBoardConfig(content.value(), result.partitionBytes));
                ctx.log("Partition group size set to ", result.partitionBytes, " bytes in ", options.boardConfig);
            }
            transaction.commit();
        }

        for (const auto &module : plan)
        {
            model::BuildModule built;
            built.moduleName = module.moduleName;
            built.moduleType = module.moduleType;
            built.sharedLibs = module.sharedLibs;
            built.descriptorText = module.blueprintText;
            built.directory = module.destination;
            for (const auto &entry : module.entries)
            {
                built.injectedFiles.push_back(*entry.artifact);
            }
            if (module.skip)
            {
                ++result.skippedModules;
            }
            result.modules.push_back(std::move(built));
        }

        ctx.log("Pre-build injection: ", result.modules.size(), " modules (", result.skippedModules, " kept), ",
                result.unresolved.size(), " unresolved dependencies");
        return result;
    }

} // namespace rehost::inject
