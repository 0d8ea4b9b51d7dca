/*

attachment_provider.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Per-recipient attachment resolution.

*/

#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <mailcast/core/message.hpp>
#include <mailcast/detail/error_detail.hpp>
#include <mailcast/detail/redact.hpp>
#include <mailcast/detail/result.hpp>

namespace mailcast::content
{

class attachment_provider
{
public:
    virtual ~attachment_provider() = default;

    /**
    Attachment for one recipient. Called from every worker concurrently.

    @param recipient Target address.
    @return          Attachment, nothing when the message goes out without one,
                     or errc::attachment_too_large / errc::attachment_unavailable.
    **/
    virtual result<std::optional<attachment>> build(const std::string& recipient) = 0;
};

/// Messages go out without attachments.
class no_attachments : public attachment_provider
{
public:
    result<std::optional<attachment>> build(const std::string&) override
    {
        return std::optional<attachment>{};
    }
};

/// Content type from a file extension; unknown extensions are sent as octet-stream.
[[nodiscard]] inline std::string content_type_for(const std::filesystem::path& file)
{
    const std::string ext = detail::to_lower_ascii(file.extension().string());
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".heic") return "image/heic";
    if (ext == ".txt") return "text/plain";
    if (ext == ".html" || ext == ".htm") return "text/html";
    if (ext == ".doc") return "application/msword";
    if (ext == ".docx") return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    if (ext == ".zip") return "application/zip";
    return "application/octet-stream";
}

/**
Picks a random file from a set of directories for every recipient.
The directory listing is taken once at construction.
**/
class directory_attachment_provider : public attachment_provider
{
public:
    struct options
    {
        std::vector<std::filesystem::path> directories;

        /// Lower-case extensions with the dot (".pdf"); empty accepts everything
        std::set<std::string> extensions;

        /// Files above this size are refused with attachment_too_large
        std::uintmax_t max_bytes{25u * 1024u * 1024u};

        std::uint64_t seed{std::random_device{}()};
    };

    explicit directory_attachment_provider(options opts)
        : options_(std::move(opts)), rng_(options_.seed)
    {
        scan();
    }

    [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept
    {
        return files_;
    }

    result<std::optional<attachment>> build(const std::string& recipient) override
    {
        if (files_.empty())
        {
            return fail<std::optional<attachment>>(errc::attachment_unavailable,
                "no attachment files available",
                detail::error_detail().add("recipient", recipient).str());
        }

        std::filesystem::path chosen;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::uniform_int_distribution<std::size_t> dist(0, files_.size() - 1);
            chosen = files_[dist(rng_)];
        }

        std::error_code ec;
        const auto size = std::filesystem::file_size(chosen, ec);
        if (ec)
        {
            return fail<std::optional<attachment>>(errc::attachment_unavailable,
                "attachment vanished: " + chosen.string(),
                detail::error_detail().add("file", chosen.string()).add("reason", ec.message()).str());
        }
        if (size > options_.max_bytes)
        {
            return fail<std::optional<attachment>>(errc::attachment_too_large,
                "attachment exceeds size limit: " + chosen.filename().string(),
                detail::error_detail().add("file", chosen.string())
                    .add_int("size", size).add_int("limit", options_.max_bytes).str());
        }

        std::ifstream in(chosen, std::ios::binary);
        if (!in)
        {
            return fail<std::optional<attachment>>(errc::attachment_unavailable,
                "cannot open attachment: " + chosen.string());
        }

        attachment att;
        att.filename = chosen.filename().string();
        att.content_type = content_type_for(chosen);
        att.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return std::optional<attachment>(std::move(att));
    }

private:
    void scan()
    {
        for (const auto& dir : options_.directories)
        {
            std::error_code ec;
            std::filesystem::directory_iterator it(dir, ec);
            if (ec)
                continue;
            for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec))
            {
                std::error_code type_ec;
                if (!it->is_regular_file(type_ec) || type_ec)
                    continue;
                const std::string ext = detail::to_lower_ascii(it->path().extension().string());
                if (!options_.extensions.empty() && options_.extensions.count(ext) == 0)
                    continue;
                files_.push_back(it->path());
            }
        }
        // directory iteration order is unspecified
        std::sort(files_.begin(), files_.end());
    }

    options options_;
    std::vector<std::filesystem::path> files_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

} // namespace mailcast::content
