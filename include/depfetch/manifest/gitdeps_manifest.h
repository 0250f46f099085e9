#pragma once

#include <depfetch/core/types.h>
#include <depfetch/downloader/downloader.hpp>

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace depfetch::manifest {

/**
 * @brief Reader for `Commit.gitdeps.xml` dependency manifests.
 *
 * Expected shape:
 * @code
 * <DependencyManifest BaseUrl="https://host/deps">
 *   <Packs>
 *     <Pack Hash="..." Size="..." CompressedSize="..." RemotePath="/a/b" />
 *   </Packs>
 * </DependencyManifest>
 * @endcode
 *
 * Each Pack becomes one DownloadItem with url `<BaseUrl>/<RemotePath>/<Hash>`
 * and destination `<RemotePath>/<Hash>` (RemotePath stripped of '/').
 */
class GitDepsManifest {
public:
    /**
     * @brief Load a manifest file. FileNotFound when missing, ManifestInvalid when malformed.
     */
    static Result<std::vector<downloader::DownloadItem>> load(const std::filesystem::path& path);

    /**
     * @brief Parse manifest XML from a stream
     */
    static Result<std::vector<downloader::DownloadItem>> parse(std::istream& input);
};

} // namespace depfetch::manifest
