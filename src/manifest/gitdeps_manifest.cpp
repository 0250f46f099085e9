#include <depfetch/manifest/gitdeps_manifest.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace depfetch::manifest {

namespace pt = boost::property_tree;

namespace {

std::string stripSlashes(std::string_view s) {
    while (!s.empty() && s.front() == '/')
        s.remove_prefix(1);
    while (!s.empty() && s.back() == '/')
        s.remove_suffix(1);
    return std::string(s);
}

Result<std::string> requireAttr(const pt::ptree& node, const std::string& name) {
    auto value = node.get_optional<std::string>("<xmlattr>." + name);
    if (!value) {
        return Error{ErrorCode::ManifestInvalid, "Invalid manifest: missing '" + name + "'"};
    }
    return *value;
}

Result<std::uint64_t> requireSize(const pt::ptree& node, const std::string& name) {
    auto text = requireAttr(node, name);
    if (!text)
        return text.error();
    auto notASize = [&] {
        return Error{ErrorCode::ManifestInvalid,
                     "Invalid manifest: '" + name + "' is not a size: " + text.value()};
    };
    // stoull would wrap a negative value around to a huge size
    const auto digits = text.value().find_first_not_of(" \t\r\n");
    if (digits == std::string::npos || text.value()[digits] == '-')
        return notASize();
    try {
        std::size_t consumed = 0;
        auto value = std::stoull(text.value(), &consumed);
        if (consumed != text.value().size())
            return notASize();
        return static_cast<std::uint64_t>(value);
    } catch (const std::exception&) {
        return notASize();
    }
}

} // namespace

Result<std::vector<downloader::DownloadItem>> GitDepsManifest::load(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Manifest not found: " + path.string()};
    }
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot open manifest: " + path.string()};
    }
    auto items = parse(in);
    if (items) {
        spdlog::info("Loaded {} packs from {}", items.value().size(), path.string());
    }
    return items;
}

Result<std::vector<downloader::DownloadItem>> GitDepsManifest::parse(std::istream& input) {
    pt::ptree tree;
    try {
        pt::read_xml(input, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        return Error{ErrorCode::ManifestInvalid, std::string("Failed to parse XML: ") + e.what()};
    }

    auto root = tree.get_child_optional("DependencyManifest");
    if (!root) {
        return Error{ErrorCode::ManifestInvalid, "Invalid manifest: missing 'DependencyManifest'"};
    }

    auto baseUrl = requireAttr(*root, "BaseUrl");
    if (!baseUrl)
        return baseUrl.error();
    std::string base = baseUrl.value();
    while (!base.empty() && base.back() == '/')
        base.pop_back();

    auto packs = root->get_child_optional("Packs");
    if (!packs) {
        return Error{ErrorCode::ManifestInvalid, "Invalid manifest: missing 'Packs'"};
    }

    std::vector<downloader::DownloadItem> items;
    for (const auto& [name, pack] : *packs) {
        if (name != "Pack")
            continue;

        auto remotePath = requireAttr(pack, "RemotePath");
        if (!remotePath)
            return remotePath.error();
        auto hash = requireAttr(pack, "Hash");
        if (!hash)
            return hash.error();
        auto size = requireSize(pack, "Size");
        if (!size)
            return size.error();
        auto compressed = requireSize(pack, "CompressedSize");
        if (!compressed)
            return compressed.error();

        const auto remote = stripSlashes(remotePath.value());
        downloader::DownloadItem item;
        item.url = base + "/" + remote + "/" + hash.value();
        item.destination = std::filesystem::path(remote) / hash.value();
        item.expectedSize = size.value();
        item.expectedCompressedSize = compressed.value();
        item.expectedHash = hash.value();
        items.push_back(std::move(item));
    }

    if (items.empty()) {
        return Error{ErrorCode::ManifestInvalid, "Invalid manifest: missing 'Pack'"};
    }
    return items;
}

} // namespace depfetch::manifest
