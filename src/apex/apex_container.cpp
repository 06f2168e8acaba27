#include "apex/apex_container.hpp"

#include <map>
#include <system_error>

#include "core/errors.hpp"
#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"
#include "io/process.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace rehost::apex
{
    namespace
    {

        using Placeholders = std::map<std::string, std::string>;

        std::vector<std::string> expandTemplate(const std::string &commandTemplate, const Placeholders &values)
        {
            std::vector<std::string> tokens = io::splitFlags(commandTemplate);
            for (auto &token : tokens)
            {
                for (const auto &[key, value] : values)
                {
                    const std::string needle = "{" + key + "}";
                    std::size_t pos = 0;
                    while ((pos = token.find(needle, pos)) != std::string::npos)
                    {
                        token.replace(pos, needle.size(), value);
                        pos += value.size();
                    }
                }
            }
            return tokens;
        }

        int runTool(const std::vector<std::string> &tokens, const fs::path &cwd, const rehost::Context &ctx)
        {
            if (tokens.empty())
            {
                ctx.error("Empty tool command");
                return -1;
            }
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());
            const io::ProcessResult result = io::runCommand(tokens.front(), args, cwd, ctx);
            if (result.code != 0)
            {
                ctx.error("Tool failed (", result.code, "): ", result.commandLine);
            }
            return result.code;
        }

        bool isSafePayloadPath(const std::string &path)
        {
            const fs::path value(path);
            if (path.empty() || value.is_absolute())
            {
                return false;
            }
            for (const auto &part : value)
            {
                if (part == "..")
                {
                    return false;
                }
            }
            return true;
        }

        std::uintmax_t fileSizeOrZero(const fs::path &path)
        {
            std::error_code ec;
            const auto size = fs::file_size(path, ec);
            return ec ? 0 : size;
        }

        bool writeManifest(const fs::path &path, const ApexManifest &manifest)
        {
            return io::writeJsonFile(path, manifestToJson(manifest));
        }

    } // namespace

    ScratchPath::~ScratchPath()
    {
        if (released_ || path_.empty())
        {
            return;
        }
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ApexManifest parseManifest(const json &data)
    {
        if (!data.is_object())
        {
            throw ContainerFormatError("apex manifest is not a JSON object");
        }

        ApexManifest manifest;
        if (!data.contains("name") || !data["name"].is_string() || data["name"].get<std::string>().empty())
        {
            throw ContainerFormatError("apex manifest has no name");
        }
        manifest.name = data["name"].get<std::string>();

        if (!data.contains("version") || !data["version"].is_number_integer())
        {
            throw ContainerFormatError("apex manifest of " + manifest.name + " has no integer version");
        }
        manifest.version = data["version"].get<long long>();

        if (data.contains("capacity"))
        {
            if (!data["capacity"].is_number_unsigned())
            {
                throw ContainerFormatError("apex manifest of " + manifest.name + " has an invalid capacity");
            }
            manifest.capacity = data["capacity"].get<std::uintmax_t>();
        }

        if (data.contains("payload"))
        {
            if (!data["payload"].is_array())
            {
                throw ContainerFormatError("apex manifest of " + manifest.name + " has an invalid payload list");
            }
            for (const auto &item : data["payload"])
            {
                if (!item.is_object() || !item.contains("path") || !item["path"].is_string())
                {
                    throw ContainerFormatError("apex manifest of " + manifest.name + " has a payload entry without path");
                }
                PayloadEntry entry;
                entry.path = item["path"].get<std::string>();
                entry.size = item.value("size", std::uintmax_t{0});
                entry.sha256 = item.value("sha256", std::string());
                manifest.payload.push_back(std::move(entry));
            }
        }

        manifest.imageSize = data.value("image_size", std::uintmax_t{0});
        manifest.imageSha256 = data.value("image_sha256", std::string());

        for (const auto &[key, value] : data.items())
        {
            if (key != "name" && key != "version" && key != "capacity" && key != "payload" && key != "image_size" &&
                key != "image_sha256")
            {
                manifest.extra[key] = value;
            }
        }
        return manifest;
    }

    json manifestToJson(const ApexManifest &manifest)
    {
        json out = manifest.extra.is_object() ? manifest.extra : json::object();
        out["name"] = manifest.name;
        out["version"] = manifest.version;
        if (manifest.capacity.has_value())
        {
            out["capacity"] = manifest.capacity.value();
        }

        json payload = json::array();
        for (const auto &entry : manifest.payload)
        {
            payload.push_back({{"path", entry.path}, {"size", entry.size}, {"sha256", entry.sha256}});
        }
        out["payload"] = payload;
        out["image_size"] = manifest.imageSize;
        out["image_sha256"] = manifest.imageSha256;
        return out;
    }

    std::string stateName(const ApexState &state)
    {
        static const char *kNames[] = {"intact", "unpacked", "payload_modified", "repacked", "signed", "replaced"};
        return kNames[state.index()];
    }

    Unpacked unpack(const Intact &state, const ApexTools &tools, const rehost::Context &ctx)
    {
        std::error_code ec;
        if (!fs::is_regular_file(state.container, ec))
        {
            throw ContainerFormatError("APEX container not found: " + state.container.string());
        }

        Unpacked out;
        out.container = state.container;
        out.scratch = std::make_shared<ScratchPath>(io::makeScratchDir("apex"));
        out.archiveDir = out.scratch->path() / "container";
        out.payloadDir = out.scratch->path() / "payload";
        if (!io::ensureDir(out.archiveDir) || !io::ensureDir(out.payloadDir))
        {
            throw ContainerFormatError("Could not create scratch directories under " + out.scratch->path().string());
        }

        ctx.debug("Unpacking ", state.container.string(), " into ", out.scratch->path().string());
        const Placeholders archiveValues = {{"archive", state.container.string()}, {"dir", out.archiveDir.string()}};
        if (runTool(expandTemplate(tools.archiveUnpack, archiveValues), out.archiveDir, ctx) != 0)
        {
            throw ContainerFormatError("Could not unpack container " + state.container.string());
        }

        const fs::path manifestPath = out.archiveDir / kManifestFile;
        if (!fs::is_regular_file(manifestPath, ec))
        {
            throw ContainerFormatError("Container " + state.container.string() + " has no " + kManifestFile);
        }
        try
        {
            out.manifest = parseManifest(io::loadJsonDocument(manifestPath));
        }
        catch (const ContainerFormatError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw ContainerFormatError(std::string("Malformed manifest in ") + state.container.string() + ": " + e.what());
        }

        const fs::path image = out.archiveDir / kPayloadImage;
        if (!fs::is_regular_file(image, ec))
        {
            throw ContainerFormatError("Container " + state.container.string() + " has no " + kPayloadImage);
        }
        const Placeholders imageValues = {{"image", image.string()}, {"dir", out.payloadDir.string()}};
        if (runTool(expandTemplate(tools.imageUnpack, imageValues), out.payloadDir, ctx) != 0)
        {
            throw ContainerFormatError("Could not unpack payload image of " + state.container.string());
        }

        out.capacity = out.manifest.capacity.value_or(fileSizeOrZero(image));
        ctx.debug("APEX ", out.manifest.name, " v", out.manifest.version, " capacity ", out.capacity, " bytes");
        return out;
    }

    std::variant<Intact, PayloadModified> modifyPayload(
        Unpacked state,
        const std::vector<PayloadOverlay> &overlays,
        const rehost::Context &ctx)
    {
        for (const auto &overlay : overlays)
        {
            if (!isSafePayloadPath(overlay.payloadPath))
            {
                throw InjectionError("Invalid payload path '" + overlay.payloadPath + "' for " + state.container.string());
            }
            std::error_code ec;
            if (!fs::is_regular_file(overlay.source, ec))
            {
                throw InjectionError("Missing source artifact " + overlay.source.string());
            }
            const std::uintmax_t size = fileSizeOrZero(overlay.source);
            if (size > state.capacity)
            {
                throw CapacityExceededError(overlay.payloadPath + " is " + std::to_string(size) + " bytes, " +
                                            state.manifest.name + " accepts at most " + std::to_string(state.capacity));
            }
        }

        std::vector<std::string> changed;
        for (const auto &overlay : overlays)
        {
            const fs::path target = state.payloadDir / overlay.payloadPath;
            std::error_code ec;
            if (fs::exists(target, ec))
            {
                const auto digest = io::sha256File(target);
                if (digest.has_value() && digest.value() == overlay.sha256)
                {
                    ctx.debug("Payload file unchanged: ", overlay.payloadPath);
                    continue;
                }
                if (overlay.policy == model::OverwritePolicy::Fail)
                {
                    throw InjectionError("Payload file already exists: " + overlay.payloadPath + " in " +
                                         state.container.string());
                }
                if (overlay.policy == model::OverwritePolicy::Skip)
                {
                    ctx.debug("Keeping payload file ", overlay.payloadPath);
                    continue;
                }
                ctx.warn("Version collision in ", state.manifest.name, ": replacing ", overlay.payloadPath);
            }

            if (!io::copyFileAtomic(overlay.source, target))
            {
                throw InjectionError("Could not copy " + overlay.source.string() + " into payload of " +
                                     state.container.string());
            }
            changed.push_back(overlay.payloadPath);
        }

        if (changed.empty())
        {
            ctx.log("APEX ", state.manifest.name, " unchanged, leaving container untouched");
            return Intact{state.container};
        }

        PayloadModified out;
        out.changedPaths = std::move(changed);
        out.unpacked = std::move(state);
        return out;
    }

    Repacked repack(PayloadModified state, const ApexTools &tools, const rehost::Context &ctx)
    {
        Unpacked &unpacked = state.unpacked;
        const fs::path newImage = unpacked.scratch->path() / "apex_payload.img.new";
        std::error_code ec;
        fs::remove(newImage, ec);

        const Placeholders values = {{"image", newImage.string()}, {"dir", unpacked.payloadDir.string()}};
        if (runTool(expandTemplate(tools.imagePack, values), unpacked.payloadDir, ctx) != 0 ||
            !fs::is_regular_file(newImage, ec))
        {
            throw ContainerFormatError("Could not rebuild payload image of " + unpacked.container.string());
        }

        unpacked.manifest.payload.clear();
        for (const auto &relative : io::listFilesRecursive(unpacked.payloadDir))
        {
            PayloadEntry entry;
            entry.path = relative.generic_string();
            entry.size = fileSizeOrZero(unpacked.payloadDir / relative);
            entry.sha256 = io::sha256File(unpacked.payloadDir / relative).value_or("");
            unpacked.manifest.payload.push_back(std::move(entry));
        }

        const auto imageDigest = io::sha256File(newImage);
        if (!imageDigest.has_value())
        {
            throw ContainerFormatError("Could not hash rebuilt image " + newImage.string());
        }
        unpacked.manifest.imageSize = fileSizeOrZero(newImage);
        unpacked.manifest.imageSha256 = imageDigest.value();

        const fs::path image = unpacked.archiveDir / kPayloadImage;
        fs::rename(newImage, image, ec);
        if (ec)
        {
            throw ContainerFormatError("Could not replace payload image: " + ec.message());
        }
        if (!writeManifest(unpacked.archiveDir / kManifestFile, unpacked.manifest))
        {
            throw ContainerFormatError("Could not write manifest for " + unpacked.manifest.name);
        }

        ctx.debug("Repacked ", unpacked.manifest.name, ": ", unpacked.manifest.payload.size(), " payload files, image ",
                  unpacked.manifest.imageSize, " bytes");
        Repacked out;
        out.image = image;
        out.modified = std::move(state);
        return out;
    }

    Signed sign(Repacked state, const SigningConfig &signing, const ApexTools &tools, const rehost::Context &ctx)
    {
        const Unpacked &unpacked = state.modified.unpacked;
        std::error_code ec;

        if (signing.signTool.empty())
        {
            throw SigningError("No signing tool configured for " + unpacked.manifest.name);
        }
        if (!fs::is_regular_file(signing.key, ec))
        {
            throw SigningError("Signing key not found: " + signing.key.string());
        }
        if (!fs::is_regular_file(signing.cert, ec))
        {
            throw SigningError("Signing certificate not found: " + signing.cert.string());
        }

        const fs::path signature = unpacked.archiveDir / kPayloadSignature;
        if (!io::ensureDir(signature.parent_path()))
        {
            throw SigningError("Could not create " + signature.parent_path().string());
        }
        fs::remove(signature, ec);

        const Placeholders values = {
            {"key", signing.key.string()},
            {"cert", signing.cert.string()},
            {"input", state.image.string()},
            {"output", signature.string()}};
        std::vector<std::string> tokens = {signing.signTool};
        for (const auto &arg : signing.signArgs)
        {
            const auto expanded = expandTemplate(arg, values);
            tokens.insert(tokens.end(), expanded.begin(), expanded.end());
        }

        ctx.log("Signing ", unpacked.manifest.name, " with ", signing.key.filename().string());
        if (runTool(tokens, unpacked.archiveDir, ctx) != 0)
        {
            throw SigningError("Signing tool failed for " + unpacked.manifest.name);
        }
        if (!fs::is_regular_file(signature, ec))
        {
            throw SigningError("Signing tool produced no signature for " + unpacked.manifest.name);
        }
        if (!io::copyFileAtomic(signing.cert, unpacked.archiveDir / kPublicKey))
        {
            throw SigningError("Could not install public key into " + unpacked.manifest.name);
        }

        const fs::path temp = unpacked.container.parent_path() /
                              ("." + unpacked.container.filename().string() + ".rehost-tmp");
        fs::remove(temp, ec);

        Signed out;
        out.assembled = std::make_shared<ScratchPath>(temp);
        const Placeholders archiveValues = {{"archive", temp.string()}, {"dir", unpacked.archiveDir.string()}};
        if (runTool(expandTemplate(tools.archivePack, archiveValues), unpacked.archiveDir, ctx) != 0 ||
            !fs::is_regular_file(temp, ec))
        {
            throw ContainerFormatError("Could not assemble container " + temp.string());
        }

        out.repacked = std::move(state);
        return out;
    }

    Replaced replace(Signed state, const rehost::Context &ctx)
    {
        const Unpacked &unpacked = state.repacked.modified.unpacked;
        std::error_code ec;
        fs::permissions(state.assembled->path(), fs::status(unpacked.container, ec).permissions(), ec);
        fs::rename(state.assembled->path(), unpacked.container, ec);
        if (ec)
        {
            throw ContainerFormatError("Could not replace " + unpacked.container.string() + ": " + ec.message());
        }
        state.assembled->release();

        ctx.log("Replaced ", unpacked.container.string(), " (", state.repacked.modified.changedPaths.size(),
                " payload files changed)");
        Replaced out;
        out.container = unpacked.container;
        out.manifest = unpacked.manifest;
        out.changedPaths = state.repacked.modified.changedPaths;
        return out;
    }

    void decompressCapex(const fs::path &capex, const fs::path &apexOut, const ApexTools &tools, const rehost::Context &ctx)
    {
        std::error_code ec;
        if (!fs::is_regular_file(capex, ec))
        {
            throw ContainerFormatError("Compressed APEX not found: " + capex.string());
        }
        if (fs::exists(apexOut, ec))
        {
            throw ContainerFormatError("Refusing to overwrite " + apexOut.string() + " with the contents of " +
                                       capex.string());
        }

        ScratchPath scratch(io::makeScratchDir("capex"));
        const Placeholders values = {{"archive", capex.string()}, {"dir", scratch.path().string()}};
        if (runTool(expandTemplate(tools.archiveUnpack, values), scratch.path(), ctx) != 0)
        {
            throw ContainerFormatError("Could not unpack compressed APEX " + capex.string());
        }

        const fs::path inner = scratch.path() / kCompressedApexEntry;
        if (!fs::is_regular_file(inner, ec))
        {
            throw ContainerFormatError("Compressed APEX " + capex.string() + " has no " + kCompressedApexEntry);
        }
        if (!io::copyFileAtomic(inner, apexOut))
        {
            throw ContainerFormatError("Could not write " + apexOut.string());
        }
        ctx.log("Decompressed ", capex.filename().string(), " to ", apexOut.filename().string());
    }

} // namespace rehost::apex
