/*

smtp_options.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace mailcast::smtp
{

/// Default maximum reply line length (RFC 5321 allows 512, servers send more)
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

struct smtp_options
{
    /// Name sent with EHLO/HELO
    std::string helo_domain{"localhost"};

    /// Verify the server certificate chain and host name
    bool verify_peer = true;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds command_timeout{60000};
    std::chrono::milliseconds data_timeout{120000};

    std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH;
};

} // namespace mailcast::smtp
