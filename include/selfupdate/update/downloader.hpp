#pragma once

#include "selfupdate/update/release.hpp"
#include "selfupdate/update/update_types.hpp"

#include <expected>
#include <string>

namespace selfupdate {

class IDownloader {
  public:
    virtual ~IDownloader() = default;
    virtual std::expected<DownloadResult, std::string> Download(const Release& release,
                                                                const Asset& asset) = 0;
};

// Fetches assets published on a local mirror. Download URLs may be plain
// paths, paths relative to the mirror root, or file:// URLs; network schemes
// are refused. The asset lands in `download_dir` under its own name.
class MirrorDownloader final : public IDownloader {
  public:
    struct Options {
        std::string mirror_root;
        std::string download_dir;
    };

    explicit MirrorDownloader(Options opt);

    std::expected<DownloadResult, std::string> Download(const Release& release,
                                                        const Asset& asset) override;

    // Local source path for `url`, or an error for unsupported schemes.
    std::expected<std::string, std::string> ResolveSource(const std::string& url) const;

  private:
    Options opt_;
};

} // namespace selfupdate
