#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"
#include "nlohmann/json.hpp"

namespace rehost::apex {

constexpr const char *kManifestFile = "apex_manifest.json";
constexpr const char *kPayloadImage = "apex_payload.img";
constexpr const char *kPublicKey = "apex_pubkey";
constexpr const char *kPayloadSignature = "META-INF/apex_payload.sig";
// Entry of a compressed (.capex) container holding the plain APEX.
constexpr const char *kCompressedApexEntry = "original_apex";
// Suffix a .capex is renamed with once its decompressed APEX replaced it.
constexpr const char *kRetiredCapexSuffix = ".original_capex";

struct PayloadEntry {
    std::string path;
    std::uintmax_t size = 0;
    std::string sha256;
};

struct ApexManifest {
    std::string name;
    long long version = 0;
    // Largest payload file accepted. Falls back to the original image size.
    std::optional<std::uintmax_t> capacity;
    std::vector<PayloadEntry> payload;
    std::uintmax_t imageSize = 0;
    std::string imageSha256;
    // Fields this tool does not interpret, written back unchanged.
    nlohmann::json extra = nlohmann::json::object();
};

// Throws ContainerFormatError when name or integer version is missing.
ApexManifest parseManifest(const nlohmann::json &data);
nlohmann::json manifestToJson(const ApexManifest &manifest);

// Tool command templates. Tokens are split on whitespace before the
// placeholders {archive}, {image} and {dir} are substituted.
struct ApexTools {
    std::string archiveUnpack = "unzip -qq -o {archive} -d {dir}";
    std::string archivePack = "zip -qq -X -r {archive} .";
    std::string imageUnpack = "unzip -qq -o {image} -d {dir}";
    std::string imagePack = "zip -qq -X -r {image} .";
};

// Placeholders in signArgs: {key}, {cert}, {input}, {output}.
struct SigningConfig {
    std::filesystem::path key;
    std::filesystem::path cert;
    std::string signTool = "openssl";
    std::vector<std::string> signArgs = {"dgst", "-sha256", "-sign", "{key}", "-out", "{output}", "{input}"};
};

struct PayloadOverlay {
    // Path inside the payload image.
    std::string payloadPath;
    std::filesystem::path source;
    std::string sha256;
    model::OverwritePolicy policy = model::OverwritePolicy::Fail;
};

// Removes a scratch directory or temp file when the last state referencing it goes away.
class ScratchPath {
public:
    explicit ScratchPath(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchPath();

    ScratchPath(const ScratchPath &) = delete;
    ScratchPath &operator=(const ScratchPath &) = delete;

    const std::filesystem::path &path() const { return path_; }
    void release() { released_ = true; }

private:
    std::filesystem::path path_;
    bool released_ = false;
};

struct Intact {
    std::filesystem::path container;
};

struct Unpacked {
    std::filesystem::path container;
    std::shared_ptr<ScratchPath> scratch;
    std::filesystem::path archiveDir;
    std::filesystem::path payloadDir;
    ApexManifest manifest;
    std::uintmax_t capacity = 0;
};

struct PayloadModified {
    Unpacked unpacked;
    std::vector<std::string> changedPaths;
};

struct Repacked {
    PayloadModified modified;
    std::filesystem::path image;
};

struct Signed {
    Repacked repacked;
    std::shared_ptr<ScratchPath> assembled;
};

struct Replaced {
    std::filesystem::path container;
    ApexManifest manifest;
    std::vector<std::string> changedPaths;
};

using ApexState = std::variant<Intact, Unpacked, PayloadModified, Repacked, Signed, Replaced>;

std::string stateName(const ApexState &state);

Unpacked unpack(const Intact &state, const ApexTools &tools, const rehost::Context &ctx);

// Returns Intact when no payload file changes. Throws CapacityExceededError,
// InjectionError on a fail-policy collision.
std::variant<Intact, PayloadModified> modifyPayload(
    Unpacked state,
    const std::vector<PayloadOverlay> &overlays,
    const rehost::Context &ctx
);

Repacked repack(PayloadModified state, const ApexTools &tools, const rehost::Context &ctx);

// Signs the new image and assembles a temporary container beside the original.
// Throws SigningError.
Signed sign(Repacked state, const SigningConfig &signing, const ApexTools &tools, const rehost::Context &ctx);

Replaced replace(Signed state, const rehost::Context &ctx);

// Extracts the original_apex entry of a compressed container to apexOut, which
// must not exist yet. Throws ContainerFormatError.
void decompressCapex(
    const std::filesystem::path &capex,
    const std::filesystem::path &apexOut,
    const ApexTools &tools,
    const rehost::Context &ctx
);

} // namespace rehost::apex
