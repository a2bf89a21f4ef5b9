#pragma once

#include "selfupdate/update/build_info.hpp"
#include "selfupdate/util/result.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace selfupdate {

enum class ArtifactKind {
    kTarGz,  // .tar.gz / .tgz
    kZip,    // .zip
    kGzip,   // single gzip-compressed executable (.gz)
    kRaw,    // the executable itself
};

ArtifactKind DetectArtifactKind(std::string_view filename);

// Decides whether an extracted file is the product executable. Arguments are
// the entry's base name and the target OS.
using ArtifactPredicate = std::function<bool(std::string_view name, std::string_view os)>;

// The lower-cased name contains `product`, or on Windows ends in ".exe", or
// elsewhere has no extension at all.
bool IsExpectedArtifact(std::string_view name, std::string_view product, std::string_view os);
ArtifactPredicate MakeDefaultArtifactPredicate(std::string product);

// `product`, plus ".exe" on Windows.
std::string ExecutableFileName(std::string_view product, std::string_view os);

class ArtifactExtractor {
  public:
    struct Options {
        std::string product_name = "delta";
        std::string os = CurrentOs();
        // Defaults to MakeDefaultArtifactPredicate(product_name).
        ArtifactPredicate is_binary;
    };

    explicit ArtifactExtractor(Options opt);

    // Unpacks `artifact` into the existing directory `dst_dir` and reports
    // the path of the executable it found. When several entries qualify, one
    // whose name contains the product name wins; otherwise the last match.
    Result Extract(const std::string& artifact, const std::string& dst_dir, std::string& out_binary) const;

  private:
    Result ExtractArchive(const std::string& artifact,
                          ArtifactKind kind,
                          const std::string& dst_dir,
                          std::string& out_binary) const;
    Result ExtractGzip(const std::string& artifact, const std::string& dst_dir, std::string& out_binary) const;
    Result CopyRaw(const std::string& artifact, const std::string& dst_dir, std::string& out_binary) const;

    Options opt_;
};

} // namespace selfupdate
