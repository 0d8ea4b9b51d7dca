/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>

namespace mailcast
{

/// Attachment payload resolved for one recipient.
struct attachment
{
    std::string filename;
    std::string content_type{"application/octet-stream"};
    std::string bytes;
};

/// One outgoing message. Built per send, never stored.
struct message
{
    std::string from;
    std::string from_name;
    std::string to;
    std::string subject;
    std::string body;
    std::optional<attachment> file;
};

} // namespace mailcast
